#include "runbox/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include "runbox/jsonlite.hpp"

namespace runbox {

namespace {

const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

template <typename T>
void env_number(const char* name, T* out) {
  if (const char* e = env_value(name)) {
    char* end = nullptr;
    unsigned long long v = std::strtoull(e, &end, 10);
    if (end && *end == '\0') *out = static_cast<T>(v);
  }
}

}  // namespace

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  c.merge_env();
  return c;
}

void EngineConfig::merge_env() {
  env_number("RUNBOX_POOL_SIZE", &pool_size);
  env_number("RUNBOX_QUEUE_DEPTH", &queue_depth);
  env_number("RUNBOX_MAX_TIMEOUT_MS", &max_timeout_ms);
  env_number("RUNBOX_MAX_OUTPUT_BYTES", &max_output_bytes);
  env_number("RUNBOX_MAX_STDIN_BYTES", &max_stdin_bytes);
  env_number("RUNBOX_MAX_SOURCE_BYTES", &max_source_bytes);
  env_number("RUNBOX_MAX_INFRA_RETRIES", &max_infra_retries);
  env_number("RUNBOX_MAX_FILE_BYTES", &max_file_bytes);
  env_number("RUNBOX_MAX_PROCESSES", &max_processes);
  if (const char* e = env_value("RUNBOX_WORKSPACE_ROOT")) workspace_root = e;
  if (const char* e = env_value("RUNBOX_LANGUAGES")) languages_file = e;
  if (const char* e = env_value("RUNBOX_LIMITS_DISABLED")) {
    limits_enabled = std::string(e) != "1";
  }
}

bool EngineConfig::merge_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }

  static const std::set<std::string> kKnown = {
      "pool_size",        "queue_depth",       "max_timeout_ms", "max_output_bytes",
      "max_stdin_bytes",  "max_source_bytes",  "max_infra_retries", "max_file_bytes",
      "max_processes",    "workspace_root",    "limits_enabled", "languages_file",
  };
  for (const auto& [k, v] : obj) {
    if (!kKnown.contains(k)) {
      if (error) *error = "unknown config key: " + k;
      return false;
    }
    const bool want_string = k == "workspace_root" || k == "languages_file";
    const bool want_bool = k == "limits_enabled";
    const bool ok = want_string ? std::holds_alternative<std::string>(v.v)
                    : want_bool ? std::holds_alternative<bool>(v.v)
                                : std::holds_alternative<std::uint64_t>(v.v);
    if (!ok) {
      if (error) *error = "config key has wrong type: " + k;
      return false;
    }
  }

  pool_size = jsonlite::get_u64(obj, "pool_size", pool_size);
  queue_depth = jsonlite::get_u64(obj, "queue_depth", queue_depth);
  max_timeout_ms = jsonlite::get_u64(obj, "max_timeout_ms", max_timeout_ms);
  max_output_bytes = jsonlite::get_u64(obj, "max_output_bytes", max_output_bytes);
  max_stdin_bytes = jsonlite::get_u64(obj, "max_stdin_bytes", max_stdin_bytes);
  max_source_bytes = jsonlite::get_u64(obj, "max_source_bytes", max_source_bytes);
  max_infra_retries = static_cast<std::uint32_t>(jsonlite::get_u64(obj, "max_infra_retries", max_infra_retries));
  max_file_bytes = jsonlite::get_u64(obj, "max_file_bytes", max_file_bytes);
  max_processes = jsonlite::get_u64(obj, "max_processes", max_processes);
  workspace_root = jsonlite::get_string(obj, "workspace_root", workspace_root);
  languages_file = jsonlite::get_string(obj, "languages_file", languages_file);
  limits_enabled = jsonlite::get_bool(obj, "limits_enabled", limits_enabled);
  return true;
}

std::vector<std::string> EngineConfig::validate() const {
  std::vector<std::string> errors;
  if (pool_size == 0) errors.push_back("pool_size must be at least 1");
  if (pool_size > 256) errors.push_back("pool_size must be at most 256");
  if (max_timeout_ms == 0) errors.push_back("max_timeout_ms must be positive");
  if (max_output_bytes == 0) errors.push_back("max_output_bytes must be positive");
  if (max_source_bytes == 0) errors.push_back("max_source_bytes must be positive");
  if (max_infra_retries > 5) errors.push_back("max_infra_retries must be at most 5");
  return errors;
}

std::string EngineConfig::to_json() const {
  jsonlite::Object o;
  o["pool_size"] = static_cast<std::uint64_t>(pool_size);
  o["queue_depth"] = static_cast<std::uint64_t>(queue_depth);
  o["max_timeout_ms"] = static_cast<std::uint64_t>(max_timeout_ms);
  o["max_output_bytes"] = static_cast<std::uint64_t>(max_output_bytes);
  o["max_stdin_bytes"] = static_cast<std::uint64_t>(max_stdin_bytes);
  o["max_source_bytes"] = static_cast<std::uint64_t>(max_source_bytes);
  o["max_infra_retries"] = static_cast<std::uint64_t>(max_infra_retries);
  o["max_file_bytes"] = static_cast<std::uint64_t>(max_file_bytes);
  o["max_processes"] = static_cast<std::uint64_t>(max_processes);
  o["workspace_root"] = workspace_root;
  o["limits_enabled"] = limits_enabled;
  o["languages_file"] = languages_file;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

bool load_engine_config(const std::string& config_file, EngineConfig* out, std::string* error) {
  EngineConfig cfg;
  if (!config_file.empty()) {
    std::ifstream ifs(config_file, std::ios::binary);
    if (!ifs) {
      if (error) *error = "cannot read config file: " + config_file;
      return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (!cfg.merge_json(ss.str(), error)) return false;
  }

  // Environment wins over the file, including a variable set to the
  // built-in default.
  cfg.merge_env();

  auto problems = cfg.validate();
  if (!problems.empty()) {
    if (error) {
      std::string joined;
      for (const auto& p : problems) {
        if (!joined.empty()) joined += "; ";
        joined += p;
      }
      *error = joined;
    }
    return false;
  }
  *out = std::move(cfg);
  return true;
}

}  // namespace runbox
