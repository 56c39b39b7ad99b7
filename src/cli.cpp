#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "runbox/config.hpp"
#include "runbox/coordinator.hpp"
#include "runbox/hash.hpp"
#include "runbox/jsonlite.hpp"
#include "runbox/language_registry.hpp"
#include "runbox/observability.hpp"
#include "runbox/runtime.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/version.hpp"
#include "runbox/worker.hpp"

namespace {

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

bool write_file(const std::string &path, const std::string &data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  return static_cast<bool>(ofs);
}

void print_error(const std::string &code, const std::string &message) {
  std::cerr << "{\"error\":\"" << code << "\",\"message\":\""
            << runbox::jsonlite::escape(message) << "\"}\n";
}

std::string json_string_array(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += "\"" + runbox::jsonlite::escape(items[i]) + "\"";
  }
  out += "]";
  return out;
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (runbox::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (runbox::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

struct GlobalOptions {
  std::string config_file;
  std::string languages_file;
};

struct Engine {
  runbox::EngineConfig config;
  std::shared_ptr<const runbox::LanguageRegistry> registry;
};

// defaults < --config file < RUNBOX_* env; --languages wins over both.
bool load_engine(const GlobalOptions &opts, Engine *engine,
                 std::vector<std::string> *errors) {
  std::string err;
  if (!runbox::load_engine_config(opts.config_file, &engine->config, &err)) {
    errors->push_back(err);
    return false;
  }
  if (!opts.languages_file.empty())
    engine->config.languages_file = opts.languages_file;

  auto problems = engine->config.validate();
  if (!problems.empty()) {
    errors->insert(errors->end(), problems.begin(), problems.end());
    return false;
  }

  if (engine->config.languages_file.empty()) {
    engine->registry = runbox::LanguageRegistry::builtin();
  } else {
    engine->registry = runbox::LanguageRegistry::from_file(
        engine->config.languages_file, errors);
  }
  return engine->registry != nullptr;
}

// Parse a JSON array of requests. Each element is re-serialized and parsed
// through the same path as a single request file.
bool parse_request_array(const std::string &text,
                         std::vector<runbox::ExecutionRequest> *out,
                         std::string *error) {
  std::optional<runbox::jsonlite::JsonError> jerr;
  auto doc = runbox::jsonlite::parse_value(text, &jerr);
  if (jerr) {
    *error = jerr->code + ": " + jerr->message;
    return false;
  }
  const auto *arr = std::get_if<runbox::jsonlite::Array>(&doc.v);
  if (!arr) {
    *error = "requests file must contain a JSON array";
    return false;
  }
  for (size_t i = 0; i < arr->size(); ++i) {
    std::string perr;
    auto req = runbox::parse_request_json(
        runbox::jsonlite::to_json((*arr)[i]), &perr);
    if (!perr.empty()) {
      *error = "request " + std::to_string(i) + ": " + perr;
      return false;
    }
    out->push_back(std::move(req));
  }
  return true;
}

// Submit everything at once so the pool's admission control is exercised,
// then collect in submission order.
std::vector<runbox::ExecutionResult>
run_batch(runbox::ExecutionCoordinator &coordinator,
          std::vector<runbox::ExecutionRequest> requests) {
  std::vector<runbox::Submission> pending;
  pending.reserve(requests.size());
  for (auto &req : requests)
    pending.push_back(coordinator.submit(std::move(req)));
  std::vector<runbox::ExecutionResult> results;
  results.reserve(pending.size());
  for (auto &s : pending)
    results.push_back(s.result.get());
  return results;
}

} // namespace

int main(int argc, char **argv) {
  GlobalOptions opts;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      opts.config_file = argv[++i];
      continue;
    }
    if (a == "--languages" && i + 1 < argc) {
      opts.languages_file = argv[++i];
      continue;
    }
    args.push_back(a);
  }
  std::string cmd;
  for (const auto &a : args) {
    if (a.rfind("--", 0) == 0)
      continue;
    cmd = a;
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: runbox [--config <file>] [--languages <file>] "
                 "<health|doctor|languages|exec run|exec batch|selftest|"
                 "stats|version>\n";
    return 2;
  }
  const std::string sub = args.size() >= 2 ? args[1] : "";
  auto option = [&](const std::string &name) -> std::string {
    for (size_t i = 0; i + 1 < args.size(); ++i)
      if (args[i] == name)
        return args[i + 1];
    return "";
  };

  if (cmd == "version") {
    std::cout << runbox::version::manifest_to_json(
                     runbox::version::current_manifest())
              << "\n";
    return 0;
  }

  Engine engine;
  std::vector<std::string> load_errors;
  const bool loaded = load_engine(opts, &engine, &load_errors);

  if (cmd == "health") {
    const auto h = runbox::hash_runtime_info();
    auto caps = runbox::make_platform_limiter()->capabilities();
    std::ostringstream o;
    o << "{\"ok\":" << (loaded ? "true" : "false")
      << ",\"hash_primitive\":\"" << h.primitive << "\""
      << ",\"hash_version\":\"" << h.version << "\""
      << ",\"version\":"
      << runbox::version::manifest_to_json(runbox::version::current_manifest())
      << ",\"worker\":"
      << runbox::worker_identity_to_json(runbox::global_worker_identity())
      << ",\"sandbox\":{\"enforced\":" << json_string_array(caps.enforced())
      << ",\"unsupported\":" << json_string_array(caps.unsupported()) << "}";
    if (loaded) {
      o << ",\"config\":" << engine.config.to_json()
        << ",\"languages\":" << engine.registry->size();
    } else {
      o << ",\"errors\":" << json_string_array(load_errors);
    }
    o << "}\n";
    std::cout << o.str();
    return loaded ? 0 : 2;
  }

  if (cmd == "doctor") {
    std::vector<std::string> blockers;
    std::vector<std::string> warnings;

    const auto h = runbox::hash_runtime_info();
    if (h.primitive != "blake3")
      blockers.push_back("hash_primitive_not_blake3");
    if (!verify_hash_vectors())
      blockers.push_back("hash_vectors_failed");

    if (!loaded) {
      blockers.push_back("config_invalid");
    }

    // Detect sandbox capabilities
    auto caps = runbox::detect_platform_sandbox_capabilities();
    if (!caps.process_group_kill)
      blockers.push_back("process_tree_kill_unavailable");
    for (const auto &u : caps.unsupported())
      if (u.rfind("rlimits_", 0) == 0)
        warnings.push_back("limit_unsupported:" + u);

    size_t available = 0;
    if (loaded) {
      if (!engine.config.limits_enabled)
        warnings.push_back("resource_limits_disabled");
      for (const auto *d : engine.registry->list()) {
        const auto &st = engine.registry->status(*d);
        if (st.available) {
          ++available;
        } else {
          warnings.push_back("toolchain_missing:" + d->id);
        }
      }
      if (available == 0)
        blockers.push_back("no_language_available");
    }

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false")
              << ",\"blockers\":" << json_string_array(blockers)
              << ",\"warnings\":" << json_string_array(warnings)
              << ",\"errors\":" << json_string_array(load_errors)
              << ",\"engine_version\":\"" << runbox::version::ENGINE_SEMVER
              << "\""
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"languages_available\":" << available
              << ",\"sandbox\":{\"process_group_kill\":"
              << (caps.process_group_kill ? "true" : "false")
              << ",\"rlimits_cpu\":" << (caps.rlimits_cpu ? "true" : "false")
              << ",\"rlimits_mem\":" << (caps.rlimits_mem ? "true" : "false")
              << ",\"rlimits_fsize\":"
              << (caps.rlimits_fsize ? "true" : "false")
              << ",\"job_objects\":" << (caps.job_objects ? "true" : "false")
              << "}}\n";
    return blockers.empty() ? 0 : 2;
  }

  if (!loaded) {
    std::string joined;
    for (const auto &e : load_errors) {
      if (!joined.empty())
        joined += "; ";
      joined += e;
    }
    print_error("config_invalid", joined);
    return 2;
  }

  if (cmd == "languages") {
    std::cout << engine.registry->to_json() << "\n";
    return 0;
  }

  if (cmd == "exec" && sub == "run") {
    const std::string in = option("--request");
    const std::string out = option("--out");
    std::string payload;
    if (in.empty() || !read_file(in, &payload)) {
      print_error("missing_input", "cannot read request file: " + in);
      return 2;
    }
    std::string err;
    auto req = runbox::parse_request_json(payload, &err);
    if (!err.empty()) {
      print_error(err, "invalid request in " + in);
      return 2;
    }
    runbox::ExecutionCoordinator coordinator(engine.config, engine.registry);
    auto res = coordinator.execute(std::move(req));
    const std::string json = runbox::result_to_json(res);
    if (out.empty()) {
      std::cout << json << "\n";
    } else if (!write_file(out, json)) {
      print_error("write_failed", "cannot write " + out);
      return 2;
    }
    if (std::find(args.begin(), args.end(), "--trace") != args.end())
      std::cerr << runbox::trace_pretty(res);
    return res.status == runbox::ExecutionStatus::success ? 0 : 1;
  }

  // exec batch and stats share the batch path; stats prints the engine
  // statistics instead of the individual results.
  if ((cmd == "exec" && sub == "batch") || cmd == "stats") {
    const std::string in = option("--requests");
    std::vector<runbox::ExecutionRequest> requests;
    if (!in.empty()) {
      std::string payload, err;
      if (!read_file(in, &payload)) {
        print_error("missing_input", "cannot read requests file: " + in);
        return 2;
      }
      if (!parse_request_array(payload, &requests, &err)) {
        print_error("json_parse_error", err);
        return 2;
      }
    } else if (cmd == "exec") {
      print_error("missing_input", "exec batch requires --requests <file>");
      return 2;
    }

    std::vector<runbox::ExecutionResult> results;
    runbox::PoolHealth pool;
    {
      runbox::ExecutionCoordinator coordinator(engine.config, engine.registry);
      results = run_batch(coordinator, std::move(requests));
      pool = coordinator.health();
    }

    if (cmd == "stats") {
      std::cout << "{\"pool\":" << runbox::pool_health_to_json(pool)
                << ",\"stats\":" << runbox::global_engine_stats().to_json()
                << "}\n";
      return 0;
    }
    bool all_success = true;
    for (const auto &r : results) {
      std::cout << runbox::result_to_json(r) << "\n";
      if (r.status != runbox::ExecutionStatus::success)
        all_success = false;
    }
    return all_success ? 0 : 1;
  }

  if (cmd == "selftest") {
    std::vector<std::string> names;
    std::vector<runbox::ExecutionRequest> requests;
    std::vector<std::string> skipped;
    for (const auto *d : engine.registry->list()) {
      if (d->sample_source.empty() || !engine.registry->is_available(d->id)) {
        skipped.push_back(d->id);
        continue;
      }
      runbox::ExecutionRequest req;
      req.request_id = "selftest-" + d->id;
      req.language = d->id;
      req.source = d->sample_source;
      names.push_back(d->id);
      requests.push_back(std::move(req));
    }

    // One at a time: compilers are heavy and the point is a clean signal
    // per language, not load.
    auto config = engine.config;
    config.pool_size = 1;
    config.queue_depth = std::max<size_t>(requests.size(), 1);
    std::vector<runbox::ExecutionResult> results;
    {
      runbox::ExecutionCoordinator coordinator(config, engine.registry);
      results = run_batch(coordinator, std::move(requests));
    }

    size_t passed = 0;
    std::ostringstream o;
    o << "{\"results\":[";
    for (size_t i = 0; i < results.size(); ++i) {
      const auto *d = engine.registry->lookup(names[i]);
      const auto &r = results[i];
      const bool ok = r.status == runbox::ExecutionStatus::success &&
                      r.stdout_text == d->sample_stdout;
      if (ok)
        ++passed;
      if (i)
        o << ",";
      o << "{\"language\":\"" << names[i] << "\",\"pass\":"
        << (ok ? "true" : "false") << ",\"status\":\""
        << runbox::to_string(r.status) << "\",\"duration_ms\":"
        << r.duration_ms;
      if (!ok) {
        o << ",\"stdout\":\"" << runbox::jsonlite::escape(r.stdout_text)
          << "\",\"stderr\":\"" << runbox::jsonlite::escape(r.stderr_text)
          << "\",\"error_message\":\""
          << runbox::jsonlite::escape(r.error_message) << "\"";
      }
      o << "}";
    }
    o << "],\"passed\":" << passed << ",\"failed\":"
      << (results.size() - passed)
      << ",\"skipped\":" << json_string_array(skipped) << "}\n";
    std::cout << o.str();
    return passed == results.size() ? 0 : 1;
  }

  print_error("unknown_command", cmd);
  return 2;
}
