#pragma once

// runbox/types.hpp: Core data structures for the runbox execution engine.
//
// OWNERSHIP:
//   - ExecutionRequest and ExecutionResult are value types. The caller owns
//     both; nothing inside them borrows engine memory.
//   - An attempt's mutable state (buffers, process handle, workspace) never
//     escapes runtime.cpp. ExecutionResult is its final, immutable projection.
//
// STATUS TAXONOMY:
//   Request-time (no slot, no workspace consumed):
//     unsupported_language, overloaded, and oversized source/stdin
//     (resource_exceeded before admission).
//   Attempt outcomes (always returned as data, never thrown):
//     success, compile_error, runtime_error, timeout, resource_exceeded.
//   Infrastructure:
//     internal_error: failure unrelated to the submitted code.
//   Caller action:
//     cancelled: dequeued or killed on request.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

enum class ExecutionStatus {
  success,
  compile_error,
  runtime_error,
  timeout,
  resource_exceeded,
  internal_error,
  unsupported_language,
  overloaded,
  cancelled,
};

// Wire names: "Success", "CompileError", ...
std::string to_string(ExecutionStatus status);
std::optional<ExecutionStatus> status_from_string(const std::string& name);

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  missing_input,
  unsupported_language,
  overloaded,
  source_too_large,
  stdin_too_large,
  workspace_create_failed,
  workspace_write_failed,
  pipe_failed,
  spawn_failed,
  toolchain_missing,
  exec_failed,
  wait_failed,
  config_invalid,
  cancelled,
  shutting_down,
  internal_exception,
};

std::string to_string(ErrorCode code);

// Sandbox capabilities detected at runtime for the active limiter.
struct SandboxCapabilities {
  bool process_group_kill{false};  // whole-tree termination (pgid or job)
  bool rlimits_cpu{false};
  bool rlimits_mem{false};
  bool rlimits_fsize{false};
  bool rlimits_nproc{false};
  bool job_objects{false};
  bool no_console_window{false};

  std::vector<std::string> enforced() const;
  std::vector<std::string> unsupported() const;
};

// OS-level limits applied before the guest begins executing.
// 0 means "do not set". The wall-clock timeout lives in ProcessSpec, not here,
// because it is enforced by the watchdog on every platform.
struct ResourceLimits {
  std::uint64_t cpu_time_ms{0};
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_bytes{0};
  std::uint64_t max_processes{0};
  bool disable_core_dumps{true};
};

// Attempt lifecycle. Terminal states: completed, failed, timed_out,
// resource_exceeded, internal_error, cancelled.
enum class AttemptState {
  queued,
  preparing,
  compiling,
  running,
  completed,
  failed,
  timed_out,
  resource_exceeded,
  internal_error,
  cancelled,
};

std::string to_string(AttemptState state);
bool is_terminal(AttemptState state);

struct ExecutionRequest {
  std::string request_id;  // caller correlation id, sanitized on parse
  std::string language;
  std::string source;
  std::optional<std::string> stdin_text;
  std::optional<std::uint64_t> timeout_ms;        // capped by EngineConfig
  std::optional<std::size_t> max_output_bytes;    // capped by EngineConfig
};

struct TraceEvent {
  std::uint64_t seq{0};
  std::uint64_t t_ms{0};  // milliseconds since attempt start
  std::string type;
  std::map<std::string, std::string> data;
};

struct ExecutionResult {
  ExecutionStatus status{ExecutionStatus::internal_error};
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> compile_output;
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  std::uint64_t duration_ms{0};  // compile + run, excludes queue wait
  std::uint64_t queue_ms{0};
  bool stdout_truncated{false};
  bool stderr_truncated{false};

  std::string attempt_id;
  std::string language;       // canonical id, empty when unsupported
  std::string request_id;
  std::string error_code;     // to_string(ErrorCode), empty on guest outcomes
  std::string error_message;
  std::string diagnostics;    // raw outcome when classification fell back
  std::uint32_t infra_retries{0};

  std::string request_digest;
  std::string stdout_digest;
  std::string stderr_digest;

  std::vector<TraceEvent> trace_events;
};

}  // namespace runbox
