#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include "runbox/classifier.hpp"
#include "runbox/config.hpp"
#include "runbox/coordinator.hpp"
#include "runbox/hash.hpp"
#include "runbox/jsonlite.hpp"
#include "runbox/language_registry.hpp"
#include "runbox/observability.hpp"
#include "runbox/runtime.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/version.hpp"
#include "runbox/watchdog.hpp"
#include "runbox/worker.hpp"
#include "runbox/workspace.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
std::string g_cli_path;  // argv[1]: the runbox CLI binary, when CTest passes it

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

// Shell-backed languages so the engine tests run on any POSIX host.
//   count  interpreted, the stdin-sum example
//   shell  interpreted, general purpose
//   capped interpreted, with a 256 MiB address-space limit
//   shc    "compiled": the compile step syntax-checks and copies the script
//   ghost  interpreter that does not exist
const char* const kTestCatalog = R"JSON({
  "config_version": "1",
  "languages": [
    {"id": "count", "aliases": ["Adder"], "extension": ".sh",
     "run": ["/bin/sh", "{source}"], "timeout_ms": 10000, "max_output_bytes": 65536},
    {"id": "shell", "aliases": ["sh-test"], "extension": ".sh",
     "run": ["/bin/sh", "{source}"], "timeout_ms": 10000, "max_output_bytes": 1048576},
    {"id": "capped", "extension": ".sh",
     "run": ["/bin/sh", "{source}"], "timeout_ms": 10000, "memory_limit_mb": 256},
    {"id": "shc", "extension": ".sh",
     "compile": ["/bin/sh", "-c", "sh -n \"$0\" && cp \"$0\" \"$1\"", "{source}", "{artifact}"],
     "run": ["/bin/sh", "{artifact}"], "timeout_ms": 10000},
    {"id": "ghost", "extension": ".gh", "run": ["runbox-no-such-interpreter", "{source}"]}
  ]
})JSON";

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& i : items) {
    if (!out.empty()) out += "; ";
    out += i;
  }
  return out;
}

std::shared_ptr<const runbox::LanguageRegistry> test_registry() {
  static std::shared_ptr<const runbox::LanguageRegistry> reg = [] {
    std::vector<std::string> errors;
    std::shared_ptr<const runbox::LanguageRegistry> r = runbox::LanguageRegistry::from_json(kTestCatalog, &errors);
    expect(r != nullptr, "test catalog loads: " + join(errors));
    return r;
  }();
  return reg;
}

runbox::EngineConfig test_config() {
  runbox::EngineConfig c;
  c.pool_size = 4;
  c.queue_depth = 16;
  return c;
}

runbox::ExecutionRequest make_request(const std::string& language, const std::string& source) {
  runbox::ExecutionRequest req;
  req.language = language;
  req.source = source;
  return req;
}

std::string workspace_path(const runbox::ExecutionResult& r) {
  for (const auto& e : r.trace_events) {
    if (e.type == "workspace_created") return e.data.at("path");
  }
  return "";
}

// True once pid is gone or a zombie waiting for its new parent to reap it.
bool process_gone(pid_t pid) {
  for (int i = 0; i < 60; ++i) {
    if (::kill(pid, 0) != 0 && errno == ESRCH) return true;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (std::getline(stat, line)) {
      const auto rp = line.rfind(')');
      if (rp != std::string::npos && rp + 2 < line.size() && line[rp + 2] == 'Z') return true;
    }
    std::this_thread::sleep_for(50ms);
  }
  return false;
}

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
  while (!s.empty() && s.front() == ' ') s.erase(s.begin());
  return s;
}

class FakeHandle : public runbox::ProcessHandle {
 public:
  void kill_tree() noexcept override { kills.fetch_add(1); }
  std::atomic<int> kills{0};
};

std::atomic<int> g_hook_events{0};
void counting_hook(const runbox::ExecutionEvent&) { g_hook_events.fetch_add(1); }

// ============================================================================
// Hashing, JSON, versions
// ============================================================================

void test_blake3_known_vectors() {
  expect(runbox::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(runbox::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  const auto info = runbox::hash_runtime_info();
  expect(info.primitive == "blake3", "hash primitive is blake3");
}

void test_request_digest_canonical() {
  auto a = make_request("Python", "print(1)");
  auto b = make_request("python", "print(1)");
  expect(runbox::canonicalize_request(a) == runbox::canonicalize_request(b), "language case is canonicalized");
  b.stdin_text = "x";
  expect(runbox::request_digest(runbox::canonicalize_request(a)) !=
             runbox::request_digest(runbox::canonicalize_request(b)),
         "stdin changes the request digest");
  expect(runbox::request_digest("abc") != runbox::output_digest("abc"), "digest domains are separated");
  expect(runbox::output_digest("abc").size() == 64, "digest is 64 hex chars");
}

void test_jsonlite_strict() {
  std::optional<runbox::jsonlite::JsonError> err;
  runbox::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  runbox::jsonlite::parse("{\"a\":", &err);
  expect(err.has_value() && err->code == "json_parse_error", "truncated document rejected");

  err.reset();
  auto obj = runbox::jsonlite::parse("{\"b\":[\"x\",\"y\"],\"a\":42,\"c\":null}", &err);
  expect(!err, "valid document parses");
  expect(runbox::jsonlite::get_u64(obj, "a") == 42, "u64 extracted");
  expect(runbox::jsonlite::get_string_array(obj, "b").size() == 2, "array extracted");
  expect(runbox::jsonlite::is_null(obj, "c"), "null detected");
  expect(runbox::jsonlite::to_json(runbox::jsonlite::Value{obj}) == "{\"a\":42,\"b\":[\"x\",\"y\"],\"c\":null}",
         "keys serialize sorted");
  expect(runbox::jsonlite::escape("a\"b\n") == "a\\\"b\\n", "escape quotes and newline");

  err.reset();
  auto pair = runbox::jsonlite::parse(R"({"s":"\ud83d\ude00"})", &err);
  expect(!err && runbox::jsonlite::get_string(pair, "s") == "\xF0\x9F\x98\x80", "surrogate pair decodes");
  for (const char* bad : {R"({"s":"\ud83d\u0041"})", R"({"s":"\ud83d"})", R"({"s":"\ude00"})",
                          R"({"s":"\ud83dx"})"}) {
    err.reset();
    runbox::jsonlite::parse(bad, &err);
    expect(err.has_value() && err->code == "json_parse_error", std::string("bad surrogate rejected: ") + bad);
  }
}

void test_version_manifest() {
  const auto m = runbox::version::current_manifest();
  expect(m.engine_semver == runbox::version::ENGINE_SEMVER, "manifest semver");
  expect(m.hash_primitive == "blake3", "manifest hash primitive");
  const auto json = runbox::version::manifest_to_json(m);
  expect(!runbox::jsonlite::validate_strict(json), "manifest JSON is valid");
  expect(runbox::version::check_catalog_version("1").ok, "catalog version 1 accepted");
  expect(!runbox::version::check_catalog_version("2").ok, "catalog version 2 rejected");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_merge_and_validate() {
  runbox::EngineConfig c;
  std::string err;
  expect(c.max_processes == 0, "process count limit unset by default");
  expect(c.merge_json("{\"pool_size\":2,\"queue_depth\":3,\"limits_enabled\":false}", &err), "merge: " + err);
  expect(c.pool_size == 2 && c.queue_depth == 3 && !c.limits_enabled, "merged values applied");

  runbox::EngineConfig d;
  expect(!d.merge_json("{\"pool_sise\":2}", &err), "unknown key rejected");
  expect(err.find("pool_sise") != std::string::npos, "error names the key");
  expect(!d.merge_json("{\"pool_size\":\"two\"}", &err), "wrong type rejected");

  runbox::EngineConfig bad;
  bad.pool_size = 0;
  bad.max_infra_retries = 9;
  expect(bad.validate().size() == 2, "two validation errors");
  expect(runbox::EngineConfig{}.validate().empty(), "defaults are valid");
}

void test_config_precedence() {
  const fs::path file = fs::temp_directory_path() / ("runbox-config-" + std::to_string(::getpid()) + ".json");
  {
    std::ofstream ofs(file);
    ofs << "{\"pool_size\":8,\"queue_depth\":9}";
  }
  ::setenv("RUNBOX_QUEUE_DEPTH", "3", 1);
  runbox::EngineConfig c;
  std::string err;
  const bool ok = runbox::load_engine_config(file.string(), &c, &err);
  ::unsetenv("RUNBOX_QUEUE_DEPTH");
  fs::remove(file);
  expect(ok, "load config: " + err);
  expect(c.pool_size == 8, "file overrides defaults");
  expect(c.queue_depth == 3, "environment overrides file");

  runbox::EngineConfig missing;
  expect(!runbox::load_engine_config("/nonexistent/runbox.json", &missing, &err), "missing file is an error");
}

void test_config_env_equal_to_default() {
  const runbox::EngineConfig defaults;
  const fs::path file = fs::temp_directory_path() / ("runbox-config-def-" + std::to_string(::getpid()) + ".json");
  {
    std::ofstream ofs(file);
    ofs << "{\"pool_size\":8,\"max_timeout_ms\":5000,\"limits_enabled\":false}";
  }
  ::setenv("RUNBOX_POOL_SIZE", std::to_string(defaults.pool_size).c_str(), 1);
  ::setenv("RUNBOX_MAX_TIMEOUT_MS", std::to_string(defaults.max_timeout_ms).c_str(), 1);
  ::setenv("RUNBOX_LIMITS_DISABLED", "0", 1);
  runbox::EngineConfig c;
  std::string err;
  const bool ok = runbox::load_engine_config(file.string(), &c, &err);
  ::unsetenv("RUNBOX_POOL_SIZE");
  ::unsetenv("RUNBOX_MAX_TIMEOUT_MS");
  ::unsetenv("RUNBOX_LIMITS_DISABLED");
  fs::remove(file);
  expect(ok, "load config: " + err);
  expect(c.pool_size == defaults.pool_size, "env equal to default still overrides file pool_size");
  expect(c.max_timeout_ms == defaults.max_timeout_ms, "env equal to default still overrides file max_timeout_ms");
  expect(c.limits_enabled, "RUNBOX_LIMITS_DISABLED=0 re-enables limits");
}

// ============================================================================
// Language registry
// ============================================================================

void test_builtin_catalog() {
  auto reg = runbox::LanguageRegistry::builtin();
  expect(reg != nullptr, "built-in catalog loads");
  expect(reg->size() == 12, "twelve built-in languages");
  expect(reg->lookup("PY") && reg->lookup("PY")->id == "python", "alias lookup is case-insensitive");
  expect(reg->lookup("c#") && reg->lookup("c#")->id == "csharp", "c# alias");
  expect(reg->lookup("golang") && reg->lookup("golang")->has_compile_phase(), "go is compiled");
  const auto* java = reg->lookup("java");
  expect(java && java->source_file_name() == "Main.java", "java source file name");
  expect(reg->lookup("unknown-lang") == nullptr, "unknown language");
  const auto list = reg->list();
  for (size_t i = 1; i < list.size(); ++i) expect(list[i - 1]->id < list[i]->id, "list sorted by id");
  expect(!runbox::jsonlite::validate_strict(reg->to_json()), "languages JSON is valid");
}

void test_registry_validation() {
  std::vector<std::string> errors;
  auto dup = runbox::LanguageRegistry::from_json(R"({"config_version":"1","languages":[
      {"id":"a","aliases":["x"],"extension":".a","run":["/bin/sh","{source}"]},
      {"id":"b","aliases":["X"],"extension":".b","run":["/bin/sh","{source}"]}]})",
                                                 &errors);
  expect(dup == nullptr, "duplicate alias rejected");
  expect(join(errors).find("already names") != std::string::npos, "duplicate alias reported");

  errors.clear();
  auto bad = runbox::LanguageRegistry::from_json(R"({"config_version":"1","languages":[
      {"id":"a","extension":"a","run":[]},
      {"id":"b","extension":".b","compile":["cc","{source}"],"run":["{srcfile}"]},
      {"id":"b","extension":".b","run":["/bin/sh"]}]})",
                                                 &errors);
  expect(bad == nullptr, "invalid catalog rejected");
  const std::string all = join(errors);
  expect(all.find("extension") != std::string::npos, "bad extension reported");
  expect(all.find("run template is empty") != std::string::npos, "empty run reported");
  expect(all.find("{artifact}") != std::string::npos, "compile without artifact reported");
  expect(all.find("unknown placeholder {srcfile}") != std::string::npos, "unknown placeholder reported");
  expect(all.find("duplicate language id") != std::string::npos, "duplicate id reported");

  errors.clear();
  expect(runbox::LanguageRegistry::from_json(R"({"config_version":"2","languages":[]})", &errors) == nullptr,
         "future catalog version rejected");
}

void test_expand_template() {
  runbox::PlaceholderValues pv;
  pv.source = "/w/main.c";
  pv.workdir = "/w";
  pv.artifact = "/w/main.out";
  auto out = runbox::expand_template({"gcc", "-o", "{artifact}", "{source}", "-I{workdir}/inc"}, pv);
  expect(out.size() == 5, "element count preserved");
  expect(out[2] == "/w/main.out" && out[3] == "/w/main.c", "placeholders replaced");
  expect(out[4] == "-I/w/inc", "embedded placeholder replaced");
}

void test_availability_probe() {
  auto reg = test_registry();
  expect(reg->is_available("count"), "/bin/sh language available");
  expect(reg->is_available("SH-TEST"), "availability through alias");
  expect(!reg->is_available("ghost"), "missing interpreter unavailable");
  const auto& st = reg->status(*reg->lookup("ghost"));
  expect(st.missing.size() == 1 && st.missing[0] == "runbox-no-such-interpreter", "missing program recorded");
  expect(!reg->is_available("nope"), "unknown language unavailable");
}

// ============================================================================
// Workspace, sandbox, watchdog
// ============================================================================

void test_workspace_lifecycle() {
  runbox::ErrorCode code = runbox::ErrorCode::none;
  int err = 0;
  std::string msg;
  auto ws = runbox::Workspace::create("", "unit-test", &code, &err, &msg);
  expect(ws.valid(), "workspace created: " + msg);
  const fs::path dir = ws.dir();
  const auto perms = fs::status(dir).permissions();
  expect((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none, "workspace is owner-only");

  std::string werr;
  expect(ws.write_file("main.txt", "hello", &werr), "write file: " + werr);
  std::ifstream ifs(dir / "main.txt");
  std::string content;
  std::getline(ifs, content);
  expect(content == "hello", "file content written");

  auto other = runbox::Workspace::create("", "unit-test", &code, &err, &msg);
  expect(other.valid() && other.dir() != dir, "each workspace is unique");

  expect(ws.release(), "release removes directory");
  expect(!fs::exists(dir), "directory gone");
  expect(ws.release(), "release is idempotent");
  const fs::path other_dir = other.dir();
  { runbox::Workspace moved = std::move(other); }
  expect(!fs::exists(other_dir), "destructor releases");

  auto bad = runbox::Workspace::create("/nonexistent/runbox-root", "x", &code, &err, &msg);
  expect(!bad.valid() && code == runbox::ErrorCode::workspace_create_failed, "bad root reported");
}

void test_workspace_release_read_only_root() {
  runbox::ErrorCode code = runbox::ErrorCode::none;
  int err = 0;
  std::string msg;
  auto ws = runbox::Workspace::create("", "read-only", &code, &err, &msg);
  expect(ws.valid(), "workspace created: " + msg);
  const fs::path dir = ws.dir();
  std::string werr;
  expect(ws.write_file("main.sh", "echo hi", &werr), "write file: " + werr);
  fs::create_directory(dir / "locked");
  std::ofstream(dir / "locked" / "f") << "x";
  fs::permissions(dir / "locked", fs::perms::none, fs::perm_options::replace);
  fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
  expect(ws.release(), "release succeeds on a read-only workspace root");
  expect(!fs::exists(dir), "read-only workspace removed");
}

void test_capped_buffer() {
  runbox::CappedBuffer buf(5);
  buf.append("abc", 3);
  expect(!buf.truncated(), "under cap");
  buf.append("defg", 4);
  expect(buf.text() == "abcde" && buf.truncated(), "cap enforced");
  buf.append("h", 1);
  expect(buf.text().size() == 5, "never grows past cap");
}

void test_run_process_direct() {
  runbox::NullLimiter limiter;
  runbox::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo hi; echo err >&2; exit 4"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  spec.timeout_ms = 10000;
  auto r = runbox::run_process(spec, limiter);
  expect(r.launched, "process launched: " + r.error_message);
  expect(r.exit_code && *r.exit_code == 4, "exit code captured");
  expect(r.stdout_text == "hi\n" && r.stderr_text == "err\n", "both streams captured");
  expect(!r.term_signal && !r.timed_out, "no signal, no timeout");

  spec.command = "/nonexistent/runbox-binary";
  auto missing = runbox::run_process(spec, limiter);
  expect(!missing.launched, "missing binary not launched");
  expect(missing.launch_error == runbox::ErrorCode::toolchain_missing, "missing binary is toolchain_missing");
  expect(!missing.exit_code, "no exit code for a launch failure");
}

void test_platform_limiter() {
  auto limiter = runbox::make_platform_limiter();
  expect(limiter != nullptr, "platform limiter exists");
  const auto caps = limiter->capabilities();
  expect(caps.process_group_kill, "tree kill supported");
  runbox::NullLimiter null;
  expect(null.capabilities().enforced().size() == 1, "null limiter only kills trees");
  expect(runbox::resolve_executable("sh").size() > 0, "sh resolves on PATH");
  expect(runbox::resolve_executable("runbox-no-such-interpreter").empty(), "missing program unresolved");
}

runbox::RawOutcome outcome_of(const runbox::ProcessResult& p) {
  runbox::RawOutcome raw;
  raw.timed_out = p.timed_out;
  raw.exit_code = p.exit_code;
  raw.term_signal = p.term_signal;
  raw.stdout_truncated = p.stdout_truncated;
  raw.stderr_truncated = p.stderr_truncated;
  return raw;
}

void test_rlimits_constrain_guest() {
  auto limiter = runbox::make_platform_limiter();
  runbox::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  spec.timeout_ms = 10000;

  spec.argv = {"-c", "while :; do :; done"};
  spec.limits.cpu_time_ms = 1000;
  auto cpu = runbox::run_process(spec, *limiter);
  expect(cpu.launched, "cpu hog launched: " + cpu.error_message);
  expect(cpu.term_signal && *cpu.term_signal == SIGXCPU, "cpu limit delivers SIGXCPU");
  expect(!cpu.timed_out && cpu.duration_ms < 8000, "cpu limit fires before the wall clock");
  expect(runbox::classify(outcome_of(cpu)).status == runbox::ExecutionStatus::resource_exceeded,
         "cpu limit classifies as ResourceExceeded");

  const fs::path scratch = fs::temp_directory_path() / ("runbox-fsize-" + std::to_string(::getpid()));
  fs::create_directories(scratch);
  spec.cwd = scratch.string();
  spec.argv = {"-c", "exec head -c 100000 /dev/zero > big"};
  spec.limits = runbox::ResourceLimits{};
  spec.limits.max_file_bytes = 4096;
  auto fsize = runbox::run_process(spec, *limiter);
  const auto written = fs::exists(scratch / "big") ? fs::file_size(scratch / "big") : 0;
  fs::remove_all(scratch);
  expect(fsize.term_signal && *fsize.term_signal == SIGXFSZ, "file size limit delivers SIGXFSZ");
  expect(written <= 4096, "file never grows past the limit");
  expect(runbox::classify(outcome_of(fsize)).status == runbox::ExecutionStatus::resource_exceeded,
         "file size limit classifies as ResourceExceeded");

  spec.cwd = fs::temp_directory_path().string();
  spec.argv = {"-c", "ulimit -v; ulimit -c"};
  spec.limits = runbox::ResourceLimits{};
  spec.limits.max_memory_bytes = 128ull * 1024 * 1024;
  auto as = runbox::run_process(spec, *limiter);
  expect(as.stdout_text == "131072\n0\n", "address space and core limits applied: " + as.stdout_text);
}

void test_engine_applies_limits() {
  auto config = test_config();
  config.max_file_bytes = 1024 * 1024;
  runbox::ExecutionCoordinator engine(config, test_registry());
  auto r = engine.execute(make_request("capped", "ulimit -v\nulimit -f\n"));
  expect(r.status == runbox::ExecutionStatus::success, "ulimit script succeeds: " + runbox::to_string(r.status));
  const auto nl = r.stdout_text.find('\n');
  expect(r.stdout_text.substr(0, nl) == "262144", "memory_limit_mb becomes RLIMIT_AS: " + r.stdout_text);
  // ulimit -f reports 512-byte blocks in POSIX mode and 1024-byte blocks in bash.
  const std::string fblocks = trim(r.stdout_text.substr(nl + 1));
  expect(fblocks == "2048" || fblocks == "1024", "max_file_bytes becomes RLIMIT_FSIZE: " + fblocks);

  config.limits_enabled = false;
  runbox::ExecutionCoordinator unlimited(config, test_registry());
  auto u = unlimited.execute(make_request("capped", "ulimit -v\n"));
  expect(trim(u.stdout_text) == "unlimited", "limits_enabled=false leaves RLIMIT_AS unset");
}

void test_watchdog_fires() {
  FakeHandle handle;
  {
    runbox::Watchdog w(handle, 50);
    std::this_thread::sleep_for(300ms);
    expect(w.fired() && w.reason() == runbox::Watchdog::Reason::timeout, "watchdog fired on timeout");
  }
  expect(handle.kills.load() == 1, "kill_tree called once");
}

void test_watchdog_disarm() {
  FakeHandle handle;
  const auto t0 = std::chrono::steady_clock::now();
  {
    runbox::Watchdog w(handle, 60000);
    w.disarm();
    w.trip(runbox::Watchdog::Reason::cancelled);
    expect(!w.fired(), "trip after disarm ignored");
  }
  expect(std::chrono::steady_clock::now() - t0 < 5s, "destructor joins promptly");
  expect(handle.kills.load() == 0, "no kill after disarm");
}

void test_cancel_token() {
  FakeHandle handle;
  runbox::CancelToken token;
  token.cancel();
  expect(token.cancelled(), "token cancelled");
  runbox::Watchdog w(handle, 60000);
  token.attach(&w);
  expect(w.reason() == runbox::Watchdog::Reason::cancelled, "attach after cancel trips immediately");
  token.detach();
  expect(handle.kills.load() == 1, "tree killed once");
}

// ============================================================================
// Classifier
// ============================================================================

void test_classifier_precedence() {
  using runbox::ExecutionStatus;
  runbox::RawOutcome raw;
  raw.exit_code = 0;
  expect(runbox::classify(raw).status == ExecutionStatus::success, "exit 0 is success");
  raw.exit_code = 1;
  expect(runbox::classify(raw).status == ExecutionStatus::runtime_error, "exit 1 is runtime error");
  raw.stdout_truncated = true;
  expect(runbox::classify(raw).status == ExecutionStatus::resource_exceeded, "truncation beats exit code");
  raw.compile_failed = true;
  expect(runbox::classify(raw).status == ExecutionStatus::compile_error, "compile failure beats truncation");
  raw.timed_out = true;
  expect(runbox::classify(raw).status == ExecutionStatus::timeout, "timeout beats compile failure");
  raw.cancelled = true;
  expect(runbox::classify(raw).status == ExecutionStatus::cancelled, "cancel beats timeout");
  raw.infra_error = runbox::ErrorCode::spawn_failed;
  expect(runbox::classify(raw).status == ExecutionStatus::internal_error, "infra failure wins");

  runbox::RawOutcome sig;
  sig.term_signal = SIGXCPU;
  expect(runbox::classify(sig).status == ExecutionStatus::resource_exceeded, "SIGXCPU is resource exceeded");
  sig.term_signal = SIGKILL;
  expect(runbox::classify(sig).status == ExecutionStatus::resource_exceeded, "SIGKILL without watchdog");
  sig.term_signal = SIGSEGV;
  expect(runbox::classify(sig).status == ExecutionStatus::runtime_error, "SIGSEGV is runtime error");

  runbox::RawOutcome empty;
  const auto c = runbox::classify(empty);
  expect(c.status == ExecutionStatus::internal_error && c.uncategorized, "no data is uncategorized");
  expect(runbox::describe_outcome(empty).find("exit_code=none") != std::string::npos, "raw data described");
  expect(runbox::terminal_state_for(ExecutionStatus::timeout) == runbox::AttemptState::timed_out,
         "timeout terminal state");
  expect(runbox::is_terminal(runbox::AttemptState::cancelled), "cancelled is terminal");
  expect(!runbox::is_terminal(runbox::AttemptState::running), "running is not terminal");
  expect(runbox::status_from_string("resource_exceeded") == ExecutionStatus::resource_exceeded,
         "status parses from wire name");
  expect(!runbox::status_from_string("bogus").has_value(), "unknown status rejected");
}

// ============================================================================
// Requests and results
// ============================================================================

void test_parse_request_json() {
  std::string err;
  auto req = runbox::parse_request_json(
      R"J({"language":"py","source":"print(1)","stdin":"x","timeoutMs":1500,"max_output_bytes":10,"request_id":"ab/../c d"})J",
      &err);
  expect(err.empty(), "request parses: " + err);
  expect(req.language == "py" && req.source == "print(1)", "fields read");
  expect(req.stdin_text && *req.stdin_text == "x", "stdin read");
  expect(req.timeout_ms && *req.timeout_ms == 1500, "camelCase timeout accepted");
  expect(req.max_output_bytes && *req.max_output_bytes == 10, "output cap read");
  expect(req.request_id == "abcd", "request_id sanitized");

  err.clear();
  runbox::parse_request_json(R"({"language":"py"})", &err);
  expect(err == "missing_input", "missing source rejected");
  err.clear();
  runbox::parse_request_json(R"({"language":)", &err);
  expect(err == "json_parse_error", "malformed JSON rejected");
  for (const char* bad : {R"({"language":"py","source":"x","timeout_ms":1500.0})",
                          R"({"language":"py","source":"x","timeout_ms":"1500"})",
                          R"({"language":"py","source":"x","timeoutMs":-1})",
                          R"({"language":"py","source":"x","max_output_bytes":true})",
                          R"({"language":"py","source":"x","stdin":42})"}) {
    err.clear();
    auto r = runbox::parse_request_json(bad, &err);
    expect(err == "invalid_request", std::string("mistyped field rejected: ") + bad);
    expect(!r.timeout_ms && !r.max_output_bytes, "mistyped cap not applied");
  }
  err.clear();
  auto nulls = runbox::parse_request_json(R"({"language":"py","source":"x","timeout_ms":null,"stdin":null})", &err);
  expect(err.empty() && !nulls.timeout_ms && !nulls.stdin_text, "null fields mean absent");

  auto round = runbox::parse_request_json(runbox::request_to_json(req), &err);
  expect(round.timeout_ms == req.timeout_ms && round.request_id == req.request_id, "request_to_json readable");
}

void test_effective_caps() {
  runbox::ToolchainDescriptor d;
  d.timeout_ms = 10000;
  d.max_output_bytes = 4096;
  runbox::EngineConfig c;
  c.max_timeout_ms = 60000;
  c.max_output_bytes = 8192;
  auto req = make_request("x", "y");
  expect(runbox::effective_timeout_ms(req, d, c) == 10000, "language default timeout");
  req.timeout_ms = 999999;
  expect(runbox::effective_timeout_ms(req, d, c) == 60000, "timeout capped");
  req.timeout_ms = 0;
  expect(runbox::effective_timeout_ms(req, d, c) == 10000, "zero timeout means default");
  req.max_output_bytes = 1 << 20;
  expect(runbox::effective_output_bytes(req, d, c) == 8192, "output capped");
}

// ============================================================================
// Engine: end-to-end through the coordinator
// ============================================================================

void test_count_example() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto req = make_request("count", "read a b\necho $((a + b))\n");
  req.stdin_text = "2 3";
  auto r = engine.execute(req);
  expect(r.status == runbox::ExecutionStatus::success, "count succeeds: " + runbox::to_string(r.status) + " " +
                                                           r.error_message + r.stderr_text);
  expect(r.stdout_text == "5\n", "2 + 3 = 5");
  expect(r.exit_code && *r.exit_code == 0, "exit code 0");
  expect(!r.compile_output, "no compile output for interpreted language");
  expect(r.language == "count" && r.attempt_id.size() == 16, "result identifies the attempt");
  expect(r.stdout_digest == runbox::output_digest("5\n"), "stdout digest");

  auto via_alias = engine.execute([] {
    auto q = make_request("ADDER", "read a b\necho $((a * b))\n");
    q.stdin_text = "4 5\n";
    return q;
  }());
  expect(via_alias.stdout_text == "20\n" && via_alias.language == "count", "alias resolves");
}

void test_trace_and_workspace_removed() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shell", "pwd\n"));
  expect(r.status == runbox::ExecutionStatus::success, "pwd succeeds");
  const std::string ws = workspace_path(r);
  expect(!ws.empty(), "workspace recorded in trace");
  expect(trim(r.stdout_text) == fs::canonical(fs::path(ws).parent_path()).string() + "/" +
                                    fs::path(ws).filename().string() ||
             trim(r.stdout_text) == ws,
         "guest runs inside its workspace");
  expect(!fs::exists(ws), "workspace removed after attempt");

  for (size_t i = 0; i < r.trace_events.size(); ++i) {
    expect(r.trace_events[i].seq == i + 1, "trace seq is dense");
  }
  expect(r.trace_events.front().type == "state" && r.trace_events.front().data.at("to") == "queued",
         "trace starts queued");
  bool saw_running = false, saw_completed = false;
  for (const auto& e : r.trace_events) {
    if (e.type != "state") continue;
    if (e.data.at("to") == "running") saw_running = true;
    if (e.data.at("to") == "completed") saw_completed = true;
  }
  expect(saw_running && saw_completed, "running and completed transitions recorded");

  const std::string json = runbox::result_to_json(r);
  expect(!runbox::jsonlite::validate_strict(json), "result JSON is valid");
  expect(json.find("\"status\":\"Success\"") != std::string::npos, "status serialized");
  expect(json.find("\"exit_code\":0") != std::string::npos, "exit code serialized");
  expect(!runbox::trace_pretty(r).empty(), "trace renders");
}

void test_guest_environment() {
  ::setenv("RUNBOX_TEST_SECRET", "hunter2", 1);
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shell", "echo \"[$RUNBOX_TEST_SECRET]\"\necho \"$HOME\"\npwd\n"));
  ::unsetenv("RUNBOX_TEST_SECRET");
  expect(r.status == runbox::ExecutionStatus::success, "env script succeeds");
  const auto first_nl = r.stdout_text.find('\n');
  expect(r.stdout_text.substr(0, first_nl) == "[]", "engine environment not inherited");
  expect(r.stdout_text.find(workspace_path(r)) != std::string::npos, "HOME points into the workspace");
}

void test_guest_locks_workspace() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shell", "mkdir sub\nchmod 0 sub\nchmod 500 \"$PWD\"\necho locked\n"));
  expect(r.status == runbox::ExecutionStatus::success, "chmod script succeeds: " + runbox::to_string(r.status));
  const std::string ws = workspace_path(r);
  expect(!ws.empty(), "workspace recorded in trace");
  expect(!fs::exists(ws), "workspace removed after guest made it read-only");
}

void test_compile_error() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shc", "if then fi (\n"));
  expect(r.status == runbox::ExecutionStatus::compile_error, "syntax error is CompileError: " +
                                                                 runbox::to_string(r.status) + " " + r.error_message);
  expect(r.compile_output && !r.compile_output->empty(), "compile diagnostics returned");
  expect(!r.exit_code, "no exit code for a compile error");
  expect(r.stdout_text.empty(), "artifact never executed");
  expect(!fs::exists(workspace_path(r)), "workspace removed after compile error");
}

void test_compile_and_run() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shc", "echo compiled\n"));
  expect(r.status == runbox::ExecutionStatus::success, "compiled program succeeds: " + r.error_message);
  expect(r.stdout_text == "compiled\n", "artifact output");
  bool saw_compiling = false;
  for (const auto& e : r.trace_events)
    if (e.type == "state" && e.data.at("to") == "compiling") saw_compiling = true;
  expect(saw_compiling, "compiling state recorded");
}

void test_runtime_errors() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto r = engine.execute(make_request("shell", "echo before\nexit 3\n"));
  expect(r.status == runbox::ExecutionStatus::runtime_error, "non-zero exit is RuntimeError");
  expect(r.exit_code && *r.exit_code == 3, "exit code 3");
  expect(r.stdout_text == "before\n", "output before failure kept");

  auto s = engine.execute(make_request("shell", "kill -TERM $$\nsleep 5\n"));
  expect(s.status == runbox::ExecutionStatus::runtime_error, "signal death is RuntimeError");
  expect(s.term_signal && *s.term_signal == SIGTERM && !s.exit_code, "signal recorded, no exit code");
}

void test_timeout_kills_tree() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto req = make_request("shell", "sleep 30 &\necho $!\nwait\n");
  req.timeout_ms = 500;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = engine.execute(req);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.status == runbox::ExecutionStatus::timeout, "sleep is Timeout: " + runbox::to_string(r.status));
  expect(elapsed < 5s, "timeout enforced promptly");
  expect(!r.exit_code, "no exit code after timeout");
  const std::string pid_text = trim(r.stdout_text);
  expect(!pid_text.empty(), "background pid reported");
  expect(process_gone(static_cast<pid_t>(std::stol(pid_text))), "background child killed");
  expect(!fs::exists(workspace_path(r)), "workspace removed after timeout");

  auto loop = make_request("shell", "while :; do :; done\n");
  loop.timeout_ms = 500;
  auto l = engine.execute(loop);
  expect(l.status == runbox::ExecutionStatus::timeout, "busy loop is Timeout");
}

void test_output_cap() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto req = make_request("shell", "yes | head -c 100000\n");
  req.max_output_bytes = 1000;
  auto r = engine.execute(req);
  expect(r.stdout_text.size() == 1000, "stdout capped at 1000 bytes");
  expect(r.stdout_truncated, "truncation flagged");
  expect(r.status == runbox::ExecutionStatus::resource_exceeded, "truncation is ResourceExceeded");
}

void test_large_stdin_streaming() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto req = make_request("shell", "cat\n");
  req.stdin_text = std::string(300000, 'z');
  auto r = engine.execute(req);
  expect(r.status == runbox::ExecutionStatus::success, "cat succeeds: " + runbox::to_string(r.status));
  expect(r.stdout_text == *req.stdin_text, "stdin echoed back without deadlock");
}

void test_request_time_rejections() {
  auto config = test_config();
  config.max_source_bytes = 16;
  config.max_stdin_bytes = 4;
  runbox::ExecutionCoordinator engine(config, test_registry());

  auto u = engine.execute(make_request("unknown-lang", "x"));
  expect(u.status == runbox::ExecutionStatus::unsupported_language, "unknown language rejected");
  expect(u.attempt_id.empty() && u.trace_events.empty(), "no attempt for unsupported language");

  auto big = engine.execute(make_request("shell", std::string(100, '#')));
  expect(big.status == runbox::ExecutionStatus::resource_exceeded && big.error_code == "source_too_large",
         "oversized source rejected");
  expect(big.attempt_id.empty(), "oversized source consumes no attempt");

  auto in = make_request("shell", "cat");
  in.stdin_text = "123456";
  auto big_in = engine.execute(in);
  expect(big_in.error_code == "stdin_too_large", "oversized stdin rejected");

  auto g = engine.execute(make_request("ghost", "x"));
  expect(g.status == runbox::ExecutionStatus::internal_error && g.error_code == "toolchain_missing",
         "missing toolchain is InternalError");
  expect(g.error_message.find("runbox-no-such-interpreter") != std::string::npos, "missing program named");
  expect(engine.health().running == 0 && engine.health().queued == 0, "rejections consume no slot");
}

void test_transient_retry() {
  auto config = test_config();
  config.workspace_root = "/nonexistent/runbox-test-root";
  config.max_infra_retries = 1;
  const auto before = runbox::global_engine_stats().infra_retries.load();
  runbox::ExecutionCoordinator engine(config, test_registry());
  auto r = engine.execute(make_request("shell", "echo x"));
  expect(r.status == runbox::ExecutionStatus::internal_error, "workspace failure is InternalError");
  expect(r.error_code == "workspace_create_failed", "workspace failure code");
  expect(r.infra_retries == 1, "retried once");
  expect(runbox::global_engine_stats().infra_retries.load() == before + 1, "retry counted");

  config.workspace_root.clear();
  runbox::ExecutionCoordinator engine2(config, test_registry());
  auto t = engine2.execute([] {
    auto q = make_request("shell", "sleep 5");
    q.timeout_ms = 200;
    return q;
  }());
  expect(t.status == runbox::ExecutionStatus::timeout && t.infra_retries == 0, "timeouts are never retried");
}

void test_overload() {
  auto config = test_config();
  config.pool_size = 1;
  config.queue_depth = 1;
  runbox::ExecutionCoordinator engine(config, test_registry());
  auto a = engine.submit(make_request("shell", "sleep 1"));
  auto b = engine.submit(make_request("shell", "sleep 1"));
  auto c = engine.submit(make_request("shell", "sleep 1"));
  expect(a.ticket != 0 && b.ticket != 0, "first two admitted");
  expect(c.ticket == 0, "third not admitted");
  expect(c.result.wait_for(0ms) == std::future_status::ready, "rejection is immediate");
  auto rc = c.result.get();
  expect(rc.status == runbox::ExecutionStatus::overloaded && rc.error_code == "overloaded", "third Overloaded");

  const auto h = engine.health();
  expect(h.running + h.queued == 2, "two in flight");
  expect(a.result.get().status == runbox::ExecutionStatus::success, "first completes");
  expect(b.result.get().status == runbox::ExecutionStatus::success, "second completes after queueing");

  auto d = engine.execute(make_request("shell", "echo again"));
  expect(d.status == runbox::ExecutionStatus::success, "capacity returns after completion");
  expect(!runbox::jsonlite::validate_strict(runbox::pool_health_to_json(engine.health())), "health JSON valid");
}

void test_concurrent_identical_independent() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  const std::string source = "echo $$ > pid.txt\nsleep 0.2\ncat pid.txt\npwd\n";
  std::vector<runbox::Submission> subs;
  for (int i = 0; i < 4; ++i) subs.push_back(engine.submit(make_request("shell", source)));
  std::set<std::string> outputs, workspaces, attempts;
  for (auto& s : subs) {
    auto r = s.result.get();
    expect(r.status == runbox::ExecutionStatus::success, "concurrent run succeeds: " + r.stderr_text);
    outputs.insert(r.stdout_text);
    workspaces.insert(workspace_path(r));
    attempts.insert(r.attempt_id);
    expect(!fs::exists(workspace_path(r)), "concurrent workspace removed");
  }
  expect(outputs.size() == 4, "each run saw only its own files");
  expect(workspaces.size() == 4 && attempts.size() == 4, "fresh workspace and attempt per run");
}

// Many short attempts spawned while a long one runs must each see EOF as soon
// as their own tree exits, never when an unrelated attempt finishes.
void test_spawns_do_not_share_pipes() {
  runbox::ExecutionCoordinator engine(test_config(), test_registry());
  auto slow = engine.submit(make_request("shell", "sleep 3\n"));
  for (int i = 0; i < 100 && engine.health().running == 0; ++i) std::this_thread::sleep_for(10ms);
  const auto t0 = std::chrono::steady_clock::now();
  std::vector<runbox::Submission> fast;
  for (int i = 0; i < 3; ++i) fast.push_back(engine.submit(make_request("shell", "echo fast\n")));
  for (auto& s : fast) {
    auto r = s.result.get();
    expect(r.status == runbox::ExecutionStatus::success && r.stdout_text == "fast\n", "fast attempt succeeds");
  }
  expect(std::chrono::steady_clock::now() - t0 < 2s, "fast attempts not held by the slow one");
  expect(slow.result.get().status == runbox::ExecutionStatus::success, "slow attempt succeeds");
}

void test_cancel_queued_and_running() {
  auto config = test_config();
  config.pool_size = 1;
  config.queue_depth = 4;
  runbox::ExecutionCoordinator engine(config, test_registry());

  auto a = engine.submit(make_request("shell", "sleep 30 &\necho $!\nwait\n"));
  for (int i = 0; i < 100 && engine.health().running == 0; ++i) std::this_thread::sleep_for(20ms);
  expect(engine.health().running == 1, "first request running");
  std::this_thread::sleep_for(300ms);

  auto b = engine.submit(make_request("shell", "echo should-not-run"));
  expect(engine.cancel(b.ticket), "queued request cancelled");
  auto rb = b.result.get();
  expect(rb.status == runbox::ExecutionStatus::cancelled && rb.error_code == "cancelled", "queued is Cancelled");
  expect(rb.attempt_id.empty() && rb.stdout_text.empty(), "queued request never started");
  expect(!engine.cancel(b.ticket), "second cancel is a no-op");

  const auto t0 = std::chrono::steady_clock::now();
  expect(engine.cancel(a.ticket), "running request cancelled");
  auto ra = a.result.get();
  expect(std::chrono::steady_clock::now() - t0 < 5s, "cancel kills promptly");
  expect(ra.status == runbox::ExecutionStatus::cancelled, "running is Cancelled: " + runbox::to_string(ra.status));
  const std::string pid_text = trim(ra.stdout_text);
  if (!pid_text.empty()) {
    expect(process_gone(static_cast<pid_t>(std::stol(pid_text))), "cancelled tree killed");
  }
  expect(!fs::exists(workspace_path(ra)), "workspace removed after cancel");
}

void test_shutdown_cancels_queue() {
  auto config = test_config();
  config.pool_size = 1;
  config.queue_depth = 4;
  auto engine = std::make_unique<runbox::ExecutionCoordinator>(config, test_registry());
  auto a = engine->submit(make_request("shell", "sleep 0.5"));
  for (int i = 0; i < 100 && engine->health().running == 0; ++i) std::this_thread::sleep_for(20ms);
  auto b = engine->submit(make_request("shell", "echo queued"));
  engine->shutdown();
  expect(a.result.get().status == runbox::ExecutionStatus::success, "running attempt finishes");
  auto rb = b.result.get();
  expect(rb.status == runbox::ExecutionStatus::cancelled && rb.error_code == "shutting_down", "queued cancelled");
  auto late = engine->execute(make_request("shell", "echo late"));
  expect(late.error_code == "shutting_down", "no admission after shutdown");
  expect(!engine->health().accepting, "health reports shutdown");
  engine.reset();
}

void test_events_and_stats() {
  auto& stats = runbox::global_engine_stats();
  const auto success_before = stats.status_count(runbox::ExecutionStatus::success);
  const auto unsupported_before = stats.status_count(runbox::ExecutionStatus::unsupported_language);
  g_hook_events.store(0);
  runbox::set_execution_event_hook(counting_hook);
  {
    runbox::ExecutionCoordinator engine(test_config(), test_registry());
    engine.execute(make_request("shell", "echo ok"));
    engine.execute(make_request("klingon", "x"));
  }
  runbox::set_execution_event_hook(nullptr);
  expect(g_hook_events.load() == 2, "one event per request");
  expect(stats.status_count(runbox::ExecutionStatus::success) == success_before + 1, "success counted");
  expect(stats.status_count(runbox::ExecutionStatus::unsupported_language) == unsupported_before + 1,
         "rejection counted");
  expect(!stats.recent_events_snapshot().empty(), "recent events kept");
  expect(!runbox::jsonlite::validate_strict(stats.to_json()), "stats JSON valid");

  runbox::ExecutionEvent ev;
  ev.attempt_id = "a";
  ev.status = runbox::ExecutionStatus::timeout;
  const auto json = runbox::event_to_json(ev);
  expect(!runbox::jsonlite::validate_strict(json) && json.find("\"Timeout\"") != std::string::npos, "event JSON");
}

void test_worker_identity() {
  const auto w = runbox::init_worker_identity("w-test", "node-test");
  expect(w.worker_id == "w-test" && w.node_id == "node-test", "explicit identity");
  expect(runbox::global_worker_identity().engine_semver == runbox::version::ENGINE_SEMVER, "semver stamped");
  expect(!runbox::jsonlite::validate_strict(runbox::worker_identity_to_json(w)), "identity JSON valid");
}

// Runs each built-in sample whose toolchain is installed on this host.
void test_builtin_samples() {
  std::shared_ptr<const runbox::LanguageRegistry> reg = runbox::LanguageRegistry::builtin();
  auto config = test_config();
  config.pool_size = 2;
  runbox::ExecutionCoordinator engine(config, reg);
  int ran = 0;
  for (const auto* d : reg->list()) {
    if (!reg->is_available(d->id)) continue;
    auto r = engine.execute(make_request(d->id, d->sample_source));
    expect(r.status == runbox::ExecutionStatus::success,
           d->id + " sample succeeds: " + runbox::to_string(r.status) + " " + r.error_message + " " +
               r.stderr_text + (r.compile_output ? *r.compile_output : ""));
    expect(r.stdout_text == d->sample_stdout, d->id + " sample output");
    expect(r.exit_code && *r.exit_code == 0, d->id + " exit code 0");
    ++ran;
  }
  std::cout << " (" << ran << " toolchains)";
}

}  // namespace

// ============================================================================
// CLI
// ============================================================================

runbox::ProcessResult run_cli(const std::vector<std::string>& args) {
  runbox::NullLimiter limiter;
  runbox::ProcessSpec spec;
  spec.command = g_cli_path;
  spec.argv = args;
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  spec.timeout_ms = 30000;
  return runbox::run_process(spec, limiter);
}

void test_cli_exit_codes() {
  if (g_cli_path.empty()) {
    std::cout << " (CLI path not given, skipped)";
    return;
  }
  auto version = run_cli({"version"});
  expect(version.exit_code && *version.exit_code == 0, "version exits 0: " + version.stderr_text);
  auto none = run_cli({});
  expect(none.exit_code && *none.exit_code == 2, "missing command is a usage error");
  auto unknown = run_cli({"frobnicate"});
  expect(unknown.exit_code && *unknown.exit_code == 2, "unknown command is a usage error");
  expect(unknown.stdout_text.find("unknown_command") != std::string::npos ||
             unknown.stderr_text.find("unknown_command") != std::string::npos,
         "unknown command reported");
  auto no_request = run_cli({"exec", "run"});
  expect(no_request.exit_code && *no_request.exit_code == 2, "exec run without --request is a usage error");
}

int main(int argc, char** argv) {
  if (argc > 1) g_cli_path = argv[1];
  std::cout << "=== runbox Engine Test Suite ===\n";
  // Rejection paths log at warn; keep test output to real errors.
  runbox::set_log_level(runbox::LogLevel::error);

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("request digest canonicalization", test_request_digest_canonical);
  run_test("strict JSON", test_jsonlite_strict);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Configuration]\n";
  run_test("merge + validate", test_config_merge_and_validate);
  run_test("defaults < file < env", test_config_precedence);
  run_test("env equal to default overrides file", test_config_env_equal_to_default);

  std::cout << "\n[Language registry]\n";
  run_test("built-in catalog", test_builtin_catalog);
  run_test("catalog validation", test_registry_validation);
  run_test("placeholder expansion", test_expand_template);
  run_test("availability probe", test_availability_probe);

  std::cout << "\n[Workspace, sandbox, watchdog]\n";
  run_test("workspace lifecycle", test_workspace_lifecycle);
  run_test("release of read-only workspace", test_workspace_release_read_only_root);
  run_test("capped buffer", test_capped_buffer);
  run_test("run_process direct", test_run_process_direct);
  run_test("platform limiter", test_platform_limiter);
  run_test("rlimits constrain the guest", test_rlimits_constrain_guest);
  run_test("watchdog fires", test_watchdog_fires);
  run_test("watchdog disarm", test_watchdog_disarm);
  run_test("cancel token", test_cancel_token);

  std::cout << "\n[Classifier]\n";
  run_test("classification precedence", test_classifier_precedence);

  std::cout << "\n[Requests]\n";
  run_test("parse request JSON", test_parse_request_json);
  run_test("effective caps", test_effective_caps);

  std::cout << "\n[Execution]\n";
  run_test("count example (2 3 -> 5)", test_count_example);
  run_test("trace + workspace removal", test_trace_and_workspace_removed);
  run_test("guest environment", test_guest_environment);
  run_test("engine applies limits", test_engine_applies_limits);
  run_test("guest locks its workspace", test_guest_locks_workspace);
  run_test("compile error", test_compile_error);
  run_test("compile + run", test_compile_and_run);
  run_test("runtime errors", test_runtime_errors);
  run_test("timeout kills process tree", test_timeout_kills_tree);
  run_test("output cap", test_output_cap);
  run_test("large stdin streaming", test_large_stdin_streaming);
  run_test("request-time rejections", test_request_time_rejections);
  run_test("transient retry", test_transient_retry);

  std::cout << "\n[Coordinator]\n";
  run_test("overload", test_overload);
  run_test("concurrent identical runs", test_concurrent_identical_independent);
  run_test("spawns do not share pipes", test_spawns_do_not_share_pipes);
  run_test("cancel queued + running", test_cancel_queued_and_running);
  run_test("shutdown cancels queue", test_shutdown_cancels_queue);
  run_test("events + stats", test_events_and_stats);
  run_test("worker identity", test_worker_identity);

  std::cout << "\n[CLI]\n";
  run_test("exit codes", test_cli_exit_codes);

  std::cout << "\n[Built-in languages]\n";
  run_test("samples for installed toolchains", test_builtin_samples);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
