#pragma once

// runbox/config.hpp: Engine configuration.
//
// PRECEDENCE (lowest to highest):
//   built-in defaults < JSON config file (--config) < RUNBOX_* environment.
//
// EngineConfig is a plain value. The coordinator copies it at construction,
// so changing the environment after startup has no effect on a running pool.

#include <cstdint>
#include <string>
#include <vector>

namespace runbox {

struct EngineConfig {
  std::size_t pool_size{4};
  std::size_t queue_depth{16};
  std::uint64_t max_timeout_ms{60000};
  std::size_t max_output_bytes{1024 * 1024};
  std::size_t max_stdin_bytes{1024 * 1024};
  std::size_t max_source_bytes{1024 * 1024};
  std::uint32_t max_infra_retries{1};
  std::uint64_t max_file_bytes{64ull * 1024 * 1024};
  // RLIMIT_NPROC counts every process of the uid, not just the attempt's
  // tree, so a fixed default would fail under a busy pool sharing one user.
  // 0 leaves the limit unset; set it when attempts run under their own uid.
  std::uint64_t max_processes{0};
  std::string workspace_root;      // empty = system temp dir
  bool limits_enabled{true};       // RUNBOX_LIMITS_DISABLED=1 turns off rlimits/job limits
  std::string languages_file;      // empty = built-in catalog

  // Defaults overlaid with RUNBOX_* variables.
  static EngineConfig from_env();

  // Overwrite only the fields whose RUNBOX_* variable is set and non-empty.
  void merge_env();

  // Overlay keys present in a JSON document. Unknown keys are errors so a
  // typo cannot silently fall back to a default.
  bool merge_json(const std::string& text, std::string* error);

  // Empty when valid.
  std::vector<std::string> validate() const;

  std::string to_json() const;
};

// defaults < file (if non-empty) < environment. On failure returns false and
// describes the problem in *error.
bool load_engine_config(const std::string& config_file, EngineConfig* out, std::string* error);

}  // namespace runbox
