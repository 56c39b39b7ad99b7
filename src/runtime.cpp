#include "runbox/runtime.hpp"

// Architecture notes:
//
// ATTEMPT PIPELINE (run_attempt), one phase per comment below:
//   1. request digest                     (correlation anchor)
//   2. workspace create + source write    (fresh directory, 0700 / 0600)
//   3. compile, if the toolchain has one  (no address-space limit)
//   4. run with the watchdog armed        (all limits)
//   5. classify                           (pure, see classifier.hpp)
//   6. digests + workspace release        (release on every path)
//
// STATE MACHINE:
//   queued -> preparing -> [compiling ->] running -> terminal
//   Every transition is appended to the trace as {"type":"state"} with
//   from/to; process starts and ends get their own events. seq numbers are
//   dense from 1, t_ms is relative to the attempt start.
//
// GUEST ENVIRONMENT:
//   The guest never sees the engine's environment. It gets PATH (so
//   interpreters can find helpers), HOME and TMPDIR pointing into the
//   workspace, a UTF-8 locale, and the toolchain's own env entries.
//
// EXTENSION_POINT: artifact_cache
//   Compiled artifacts die with the workspace. A content-addressed artifact
//   cache keyed by request_digest would skip recompilation, but it must never
//   share a workspace between attempts.

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <random>

#include "runbox/classifier.hpp"
#include "runbox/hash.hpp"
#include "runbox/jsonlite.hpp"
#include "runbox/observability.hpp"
#include "runbox/version.hpp"
#include "runbox/watchdog.hpp"
#include "runbox/workspace.hpp"

namespace fs = std::filesystem;

namespace runbox {

namespace {

constexpr std::uint64_t kMiB = 1024ull * 1024ull;

// Maximum request JSON payload: source and stdin caps plus framing.
constexpr std::size_t kMaxRequestPayloadBytes = 8 * 1024 * 1024;

// Sanitize request_id: only allow alphanumeric, hyphen, underscore.
std::string sanitize_request_id(const std::string& id) {
  std::string out;
  out.reserve(id.size());
  for (char c : id) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
      out.push_back(c);
    }
  }
  return out.substr(0, 128);
}

std::string map_to_json(const std::map<std::string, std::string>& m) {
  std::string out;
  out.reserve(m.size() * 32 + 2);
  out += '{';
  bool first = true;
  for (const auto& [k, v] : m) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += jsonlite::escape(k);
    out += "\":\"";
    out += jsonlite::escape(v);
    out += '"';
  }
  out += '}';
  return out;
}

std::uint64_t ms_since(std::chrono::steady_clock::time_point t0) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count());
}

// Mutable per-attempt state. Lives on the worker's stack; never shared.
class Attempt {
 public:
  Attempt(const ExecutionRequest& request, const ToolchainDescriptor& toolchain, const std::string& attempt_id)
      : start_(std::chrono::steady_clock::now()) {
    result_.attempt_id = attempt_id;
    result_.language = toolchain.id;
    result_.request_id = request.request_id;
    record("state", {{"from", ""}, {"to", to_string(state_)}});
  }

  void transition(AttemptState next) {
    record("state", {{"from", to_string(state_)}, {"to", to_string(next)}});
    state_ = next;
  }

  void record(const std::string& type, std::map<std::string, std::string> data) {
    TraceEvent e;
    e.seq = ++seq_;
    e.t_ms = ms_since(start_);
    e.type = type;
    e.data = std::move(data);
    result_.trace_events.push_back(std::move(e));
  }

  void fail_infra(ErrorCode code, const std::string& message) {
    raw_.infra_error = code;
    result_.error_code = to_string(code);
    result_.error_message = message;
  }

  AttemptState state() const { return state_; }
  ExecutionResult& result() { return result_; }
  RawOutcome& raw() { return raw_; }

 private:
  std::chrono::steady_clock::time_point start_;
  AttemptState state_{AttemptState::queued};
  std::uint64_t seq_{0};
  ExecutionResult result_;
  RawOutcome raw_;
};

std::map<std::string, std::string> guest_env(const ToolchainDescriptor& toolchain, const PlaceholderValues& pv) {
  std::map<std::string, std::string> env;
  const char* path = std::getenv("PATH");
  env["PATH"] = (path && path[0]) ? path : "/usr/local/bin:/usr/bin:/bin";
  env["HOME"] = pv.workdir;
  env["TMPDIR"] = pv.workdir;
  env["LANG"] = "C.UTF-8";
  env["LC_ALL"] = "C.UTF-8";
#ifdef _WIN32
  if (const char* root = std::getenv("SystemRoot")) env["SystemRoot"] = root;
  env["TEMP"] = pv.workdir;
  env["TMP"] = pv.workdir;
#endif
  for (const auto& [k, v] : toolchain.env) {
    env[k] = expand_template({v}, pv).front();
  }
  return env;
}

// Resolve and expand a template into a ProcessSpec. Returns false when the
// program is not on PATH.
bool build_spec(const LanguageRegistry& registry, const ToolchainDescriptor& toolchain,
                const std::vector<std::string>& tmpl, const PlaceholderValues& pv, ProcessSpec* spec) {
  std::string program = registry.resolve_program(toolchain, tmpl.front());
  if (program.empty()) return false;
  auto expanded = expand_template(tmpl, pv);
  spec->command = expand_template({program}, pv).front();
  spec->argv.assign(expanded.begin() + 1, expanded.end());
  return true;
}

void apply_launch_failure(Attempt& attempt, AttemptOutcome& outcome, const ProcessResult& p) {
  attempt.fail_infra(p.launch_error, p.error_message);
  outcome.transient = (p.launch_error == ErrorCode::spawn_failed || p.launch_error == ErrorCode::pipe_failed) &&
                      is_transient_errno(p.launch_errno);
  attempt.record("launch_failed", {{"error_code", to_string(p.launch_error)},
                                   {"errno", std::to_string(p.launch_errno)},
                                   {"message", p.error_message}});
}

void finish(Attempt& attempt, AttemptOutcome& outcome, Workspace& workspace) {
  ExecutionResult& r = attempt.result();
  const Classification c = classify(attempt.raw());
  r.status = c.status;
  if (c.uncategorized) {
    r.diagnostics = describe_outcome(attempt.raw());
  }
  if (r.status == ExecutionStatus::cancelled && r.error_code.empty()) {
    r.error_code = to_string(ErrorCode::cancelled);
  }
  r.duration_ms = outcome.compile_ms + outcome.run_ms;
  r.stdout_digest = output_digest(r.stdout_text);
  r.stderr_digest = output_digest(r.stderr_text);
  attempt.transition(terminal_state_for(r.status));

  const std::string dir = workspace.dir().string();
  const bool released = workspace.release();
  attempt.record("workspace_released", {{"path", dir}, {"ok", released ? "true" : "false"}});
}

}  // namespace

std::uint64_t effective_timeout_ms(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                                   const EngineConfig& config) {
  std::uint64_t t = (request.timeout_ms && *request.timeout_ms > 0) ? *request.timeout_ms : toolchain.timeout_ms;
  return std::min(t, config.max_timeout_ms);
}

std::size_t effective_output_bytes(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                                   const EngineConfig& config) {
  std::size_t n = (request.max_output_bytes && *request.max_output_bytes > 0) ? *request.max_output_bytes
                                                                               : toolchain.max_output_bytes;
  return std::min(n, config.max_output_bytes);
}

std::string canonicalize_request(const ExecutionRequest& request) {
  jsonlite::Object obj;
  std::string lang = request.language;
  std::transform(lang.begin(), lang.end(), lang.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  obj["language"] = lang;
  obj["source"] = request.source;
  obj["stdin"] = request.stdin_text ? jsonlite::Value{*request.stdin_text} : jsonlite::Value{nullptr};
  obj["timeout_ms"] = request.timeout_ms ? jsonlite::Value{static_cast<std::uint64_t>(*request.timeout_ms)}
                                         : jsonlite::Value{nullptr};
  obj["max_output_bytes"] = request.max_output_bytes
                                ? jsonlite::Value{static_cast<std::uint64_t>(*request.max_output_bytes)}
                                : jsonlite::Value{nullptr};
  // jsonlite::Object is a std::map: keys serialize in sorted order.
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

std::string new_attempt_id() {
  static std::atomic<std::uint64_t> counter{0};
  thread_local std::mt19937_64 rng{std::random_device{}() ^
                                   (static_cast<std::uint64_t>(std::random_device{}()) << 32)};
  const std::uint64_t v = rng() ^ (counter.fetch_add(1, std::memory_order_relaxed) * 0x9E3779B97F4A7C15ull);
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 0; i < 16; ++i) out[static_cast<std::size_t>(i)] = kHex[(v >> (60 - 4 * i)) & 0xf];
  return out;
}

ExecutionResult make_rejection(const ExecutionRequest& request, ExecutionStatus status, ErrorCode code,
                               const std::string& message) {
  ExecutionResult r;
  r.status = status;
  r.request_id = request.request_id;
  r.error_code = to_string(code);
  r.error_message = message;
  r.request_digest = request_digest(canonicalize_request(request));
  r.stdout_digest = output_digest("");
  r.stderr_digest = output_digest("");
  return r;
}

std::optional<ExecutionResult> check_request(const ExecutionRequest& request, const LanguageRegistry& registry,
                                             const EngineConfig& config) {
  const ToolchainDescriptor* toolchain = registry.lookup(request.language);
  if (!toolchain) {
    return make_rejection(request, ExecutionStatus::unsupported_language, ErrorCode::unsupported_language,
                          "unsupported language: " + request.language);
  }
  if (request.source.size() > config.max_source_bytes) {
    auto r = make_rejection(request, ExecutionStatus::resource_exceeded, ErrorCode::source_too_large,
                            "source is " + std::to_string(request.source.size()) + " bytes; limit is " +
                                std::to_string(config.max_source_bytes));
    r.language = toolchain->id;
    return r;
  }
  if (request.stdin_text && request.stdin_text->size() > config.max_stdin_bytes) {
    auto r = make_rejection(request, ExecutionStatus::resource_exceeded, ErrorCode::stdin_too_large,
                            "stdin is " + std::to_string(request.stdin_text->size()) + " bytes; limit is " +
                                std::to_string(config.max_stdin_bytes));
    r.language = toolchain->id;
    return r;
  }
  const ToolchainStatus& st = registry.status(*toolchain);
  if (!st.available) {
    std::string missing;
    for (const auto& m : st.missing) {
      if (!missing.empty()) missing += ", ";
      missing += m;
    }
    auto r = make_rejection(request, ExecutionStatus::internal_error, ErrorCode::toolchain_missing,
                            "toolchain for " + toolchain->id + " not installed: " + missing);
    r.language = toolchain->id;
    return r;
  }
  return std::nullopt;
}

AttemptOutcome run_attempt(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                           const AttemptContext& ctx, const std::string& attempt_id, CancelToken* cancel) {
  AttemptOutcome outcome;
  Attempt attempt(request, toolchain, attempt_id);
  Workspace workspace;

  try {
    // Phase 1: request digest.
    attempt.result().request_digest = request_digest(canonicalize_request(request));
    attempt.transition(AttemptState::preparing);

    const std::uint64_t timeout_ms = effective_timeout_ms(request, toolchain, ctx.config);
    const std::size_t output_cap = effective_output_bytes(request, toolchain, ctx.config);
    const std::uint64_t compile_timeout_ms = std::min(toolchain.compile_timeout_ms, ctx.config.max_timeout_ms);

    if (cancel && cancel->cancelled()) {
      attempt.raw().cancelled = true;
      finish(attempt, outcome, workspace);
      return outcome;
    }

    // Phase 2: workspace.
    ErrorCode ws_error = ErrorCode::none;
    int ws_errno = 0;
    std::string ws_message;
    workspace = Workspace::create(ctx.config.workspace_root, attempt_id, &ws_error, &ws_errno, &ws_message);
    if (!workspace.valid()) {
      attempt.fail_infra(ErrorCode::workspace_create_failed, ws_message);
      outcome.transient = true;
      finish(attempt, outcome, workspace);
      return outcome;
    }
    attempt.record("workspace_created", {{"path", workspace.dir().string()}});

    std::string write_error;
    if (!workspace.write_file(toolchain.source_file_name(), request.source, &write_error)) {
      attempt.fail_infra(ErrorCode::workspace_write_failed, write_error);
      finish(attempt, outcome, workspace);
      return outcome;
    }

    PlaceholderValues pv;
    pv.workdir = workspace.dir().string();
    pv.source = (workspace.dir() / toolchain.source_file_name()).string();
    pv.artifact = (workspace.dir() / toolchain.artifact_name()).string();
    const auto env = guest_env(toolchain, pv);

    ResourceLimits limits;
    limits.max_file_bytes = ctx.config.max_file_bytes;
    limits.max_processes = ctx.config.max_processes;

    // Phase 3: compile. A failed compile short-circuits; the artifact is
    // never executed.
    if (toolchain.has_compile_phase()) {
      attempt.transition(AttemptState::compiling);
      ProcessSpec spec;
      if (!build_spec(ctx.registry, toolchain, toolchain.compile, pv, &spec)) {
        attempt.fail_infra(ErrorCode::toolchain_missing, "compiler not found: " + toolchain.compile.front());
        finish(attempt, outcome, workspace);
        return outcome;
      }
      spec.env = env;
      spec.cwd = pv.workdir;
      spec.timeout_ms = compile_timeout_ms;
      spec.max_output_bytes = output_cap;
      spec.limits = limits;
      spec.limits.cpu_time_ms = compile_timeout_ms;

      attempt.record("process_start", {{"phase", "compile"}, {"command", spec.command}});
      const auto t0 = std::chrono::steady_clock::now();
      ProcessResult p = run_process(spec, ctx.limiter, cancel);
      outcome.compile_ms = ms_since(t0);
      if (!p.launched || p.launch_error != ErrorCode::none) {
        apply_launch_failure(attempt, outcome, p);
        finish(attempt, outcome, workspace);
        return outcome;
      }
      attempt.record("process_end", {{"phase", "compile"},
                                     {"exit_code", p.exit_code ? std::to_string(*p.exit_code) : ""},
                                     {"signal", p.term_signal ? std::to_string(*p.term_signal) : ""},
                                     {"duration_ms", std::to_string(p.duration_ms)}});

      std::string diagnostics = p.stderr_text;
      if (!p.stdout_text.empty()) {
        if (!diagnostics.empty() && diagnostics.back() != '\n') diagnostics += '\n';
        diagnostics += p.stdout_text;
      }
      attempt.result().compile_output = std::move(diagnostics);

      attempt.raw().cancelled = p.cancelled;
      attempt.raw().timed_out = p.timed_out;
      const bool compiled = p.exit_code && *p.exit_code == 0;
      if (!compiled || p.timed_out || p.cancelled) {
        attempt.raw().compile_failed = !p.timed_out && !p.cancelled;
        finish(attempt, outcome, workspace);
        return outcome;
      }
    }

    if (cancel && cancel->cancelled()) {
      attempt.raw().cancelled = true;
      finish(attempt, outcome, workspace);
      return outcome;
    }

    // Phase 4: run.
    attempt.transition(AttemptState::running);
    ProcessSpec spec;
    if (!build_spec(ctx.registry, toolchain, toolchain.run, pv, &spec)) {
      attempt.fail_infra(ErrorCode::toolchain_missing, "interpreter not found: " + toolchain.run.front());
      finish(attempt, outcome, workspace);
      return outcome;
    }
    spec.env = env;
    spec.cwd = pv.workdir;
    spec.stdin_data = request.stdin_text.value_or("");
    spec.timeout_ms = timeout_ms;
    spec.max_output_bytes = output_cap;
    spec.limits = limits;
    spec.limits.cpu_time_ms = timeout_ms;
    spec.limits.max_memory_bytes = toolchain.memory_limit_mb * kMiB;

    attempt.record("process_start", {{"phase", "run"}, {"command", spec.command}});
    const auto t0 = std::chrono::steady_clock::now();
    ProcessResult p = run_process(spec, ctx.limiter, cancel);
    outcome.run_ms = ms_since(t0);
    if (!p.launched || p.launch_error != ErrorCode::none) {
      apply_launch_failure(attempt, outcome, p);
      finish(attempt, outcome, workspace);
      return outcome;
    }
    attempt.record("process_end", {{"phase", "run"},
                                   {"exit_code", p.exit_code ? std::to_string(*p.exit_code) : ""},
                                   {"signal", p.term_signal ? std::to_string(*p.term_signal) : ""},
                                   {"timed_out", p.timed_out ? "true" : "false"},
                                   {"duration_ms", std::to_string(p.duration_ms)}});

    // Phase 5: classify (inside finish()).
    ExecutionResult& r = attempt.result();
    r.stdout_text = std::move(p.stdout_text);
    r.stderr_text = std::move(p.stderr_text);
    r.stdout_truncated = p.stdout_truncated;
    r.stderr_truncated = p.stderr_truncated;
    r.exit_code = p.exit_code;
    r.term_signal = p.term_signal;

    RawOutcome& raw = attempt.raw();
    raw.cancelled = p.cancelled;
    raw.timed_out = p.timed_out;
    raw.exit_code = p.exit_code;
    raw.term_signal = p.term_signal;
    raw.stdout_truncated = p.stdout_truncated;
    raw.stderr_truncated = p.stderr_truncated;

    // Phase 6: digests + release.
    finish(attempt, outcome, workspace);
  } catch (const std::exception& e) {
    attempt.fail_infra(ErrorCode::internal_exception, e.what());
    emit_log(LogLevel::error, "runtime", "attempt raised an exception",
             {{"attempt_id", attempt_id}, {"error", e.what()}});
    ExecutionResult& r = attempt.result();
    r.status = ExecutionStatus::internal_error;
    r.stdout_digest = output_digest(r.stdout_text);
    r.stderr_digest = output_digest(r.stderr_text);
    workspace.release();
  }
  outcome.result = std::move(attempt.result());
  return outcome;
}

ExecutionRequest parse_request_json(const std::string& payload, std::string* error) {
  ExecutionRequest req;

  if (payload.size() > kMaxRequestPayloadBytes) {
    if (error) *error = "source_too_large";
    return req;
  }

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(payload, &err);
  if (err) {
    if (error) *error = err->code;
    return req;
  }

  req.request_id = sanitize_request_id(jsonlite::get_string(obj, "request_id", ""));
  req.language = jsonlite::get_string(obj, "language", "");
  req.source = jsonlite::get_string(obj, "source", "");
  // Present fields must have their documented type; a cap that cannot be
  // honored is reported rather than replaced by the language default.
  auto present = [&obj](const char* key) { return jsonlite::has_key(obj, key) && !jsonlite::is_null(obj, key); };
  auto invalid = [error, &req](const std::string& key) {
    if (error) *error = "invalid_request";
    emit_log(LogLevel::debug, "runtime", "request field has wrong type", {{"field", key}});
    return req;
  };
  if (present("stdin")) {
    if (!std::holds_alternative<std::string>(obj.at("stdin").v)) return invalid("stdin");
    req.stdin_text = jsonlite::get_string(obj, "stdin", "");
  }
  // Both the snake_case and camelCase spellings are accepted.
  for (const char* key : {"timeout_ms", "timeoutMs"}) {
    if (!present(key)) continue;
    if (!std::holds_alternative<std::uint64_t>(obj.at(key).v)) return invalid(key);
    req.timeout_ms = jsonlite::get_u64(obj, key, 0);
  }
  for (const char* key : {"max_output_bytes", "maxOutputBytes"}) {
    if (!present(key)) continue;
    if (!std::holds_alternative<std::uint64_t>(obj.at(key).v)) return invalid(key);
    req.max_output_bytes = static_cast<std::size_t>(jsonlite::get_u64(obj, key, 0));
  }

  const bool has_source = obj.find("source") != obj.end() &&
                          std::holds_alternative<std::string>(obj.find("source")->second.v);
  if ((req.language.empty() || !has_source) && error) *error = "missing_input";
  return req;
}

std::string request_to_json(const ExecutionRequest& request) {
  jsonlite::Object obj;
  obj["language"] = request.language;
  obj["source"] = request.source;
  if (!request.request_id.empty()) obj["request_id"] = request.request_id;
  if (request.stdin_text) obj["stdin"] = *request.stdin_text;
  if (request.timeout_ms) obj["timeout_ms"] = static_cast<std::uint64_t>(*request.timeout_ms);
  if (request.max_output_bytes) obj["max_output_bytes"] = static_cast<std::uint64_t>(*request.max_output_bytes);
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

std::string result_to_json(const ExecutionResult& r) {
  std::string te;
  te.reserve(r.trace_events.size() * 80 + 2);
  te += '[';
  for (size_t i = 0; i < r.trace_events.size(); ++i) {
    const auto& e = r.trace_events[i];
    if (i) te += ',';
    te += "{\"seq\":";
    te += std::to_string(e.seq);
    te += ",\"t_ms\":";
    te += std::to_string(e.t_ms);
    te += ",\"type\":\"";
    te += jsonlite::escape(e.type);
    te += "\",\"data\":";
    te += map_to_json(e.data);
    te += '}';
  }
  te += ']';

  std::string out;
  out.reserve(512 + r.stdout_text.size() + r.stderr_text.size() + te.size());
  out += "{\"schema_version\":";
  out += std::to_string(version::RESULT_SCHEMA_VERSION);
  out += ",\"status\":\"";
  out += to_string(r.status);
  out += "\",\"stdout\":\"";
  out += jsonlite::escape(r.stdout_text);
  out += "\",\"stderr\":\"";
  out += jsonlite::escape(r.stderr_text);
  out += '"';
  if (r.compile_output) {
    out += ",\"compile_output\":\"";
    out += jsonlite::escape(*r.compile_output);
    out += '"';
  }
  if (r.exit_code) {
    out += ",\"exit_code\":";
    out += std::to_string(*r.exit_code);
  }
  if (r.term_signal) {
    out += ",\"term_signal\":";
    out += std::to_string(*r.term_signal);
  }
  out += ",\"duration_ms\":";
  out += std::to_string(r.duration_ms);
  out += ",\"queue_ms\":";
  out += std::to_string(r.queue_ms);
  out += ",\"stdout_truncated\":";
  out += r.stdout_truncated ? "true" : "false";
  out += ",\"stderr_truncated\":";
  out += r.stderr_truncated ? "true" : "false";
  out += ",\"attempt_id\":\"";
  out += r.attempt_id;
  out += "\",\"language\":\"";
  out += jsonlite::escape(r.language);
  out += "\",\"request_id\":\"";
  out += r.request_id;
  out += "\",\"error_code\":\"";
  out += r.error_code;
  out += "\",\"error_message\":\"";
  out += jsonlite::escape(r.error_message);
  out += "\",\"diagnostics\":\"";
  out += jsonlite::escape(r.diagnostics);
  out += "\",\"infra_retries\":";
  out += std::to_string(r.infra_retries);
  out += ",\"request_digest\":\"";
  out += r.request_digest;
  out += "\",\"stdout_digest\":\"";
  out += r.stdout_digest;
  out += "\",\"stderr_digest\":\"";
  out += r.stderr_digest;
  out += "\",\"trace_events\":";
  out += te;
  out += '}';
  return out;
}

std::string trace_pretty(const ExecutionResult& result) {
  std::string out;
  out.reserve(result.trace_events.size() * 48);
  for (const auto& e : result.trace_events) {
    out += '#';
    out += std::to_string(e.seq);
    out += ' ';
    out += e.type;
    out += " t_ms=";
    out += std::to_string(e.t_ms);
    for (const auto& [k, v] : e.data) {
      out += ' ';
      out += k;
      out += '=';
      out += v;
    }
    out += '\n';
  }
  return out;
}

}  // namespace runbox
