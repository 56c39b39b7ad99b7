#include "runbox/types.hpp"

namespace runbox {

std::string to_string(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::success: return "Success";
    case ExecutionStatus::compile_error: return "CompileError";
    case ExecutionStatus::runtime_error: return "RuntimeError";
    case ExecutionStatus::timeout: return "Timeout";
    case ExecutionStatus::resource_exceeded: return "ResourceExceeded";
    case ExecutionStatus::internal_error: return "InternalError";
    case ExecutionStatus::unsupported_language: return "UnsupportedLanguage";
    case ExecutionStatus::overloaded: return "Overloaded";
    case ExecutionStatus::cancelled: return "Cancelled";
  }
  return "InternalError";
}

std::optional<ExecutionStatus> status_from_string(const std::string& name) {
  static const ExecutionStatus kAll[] = {
      ExecutionStatus::success,          ExecutionStatus::compile_error,
      ExecutionStatus::runtime_error,    ExecutionStatus::timeout,
      ExecutionStatus::resource_exceeded, ExecutionStatus::internal_error,
      ExecutionStatus::unsupported_language, ExecutionStatus::overloaded,
      ExecutionStatus::cancelled,
  };
  for (auto s : kAll)
    if (to_string(s) == name) return s;
  return std::nullopt;
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::unsupported_language: return "unsupported_language";
    case ErrorCode::overloaded: return "overloaded";
    case ErrorCode::source_too_large: return "source_too_large";
    case ErrorCode::stdin_too_large: return "stdin_too_large";
    case ErrorCode::workspace_create_failed: return "workspace_create_failed";
    case ErrorCode::workspace_write_failed: return "workspace_write_failed";
    case ErrorCode::pipe_failed: return "pipe_failed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::toolchain_missing: return "toolchain_missing";
    case ErrorCode::exec_failed: return "exec_failed";
    case ErrorCode::wait_failed: return "wait_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::shutting_down: return "shutting_down";
    case ErrorCode::internal_exception: return "internal_exception";
  }
  return "";
}

std::string to_string(AttemptState state) {
  switch (state) {
    case AttemptState::queued: return "queued";
    case AttemptState::preparing: return "preparing";
    case AttemptState::compiling: return "compiling";
    case AttemptState::running: return "running";
    case AttemptState::completed: return "completed";
    case AttemptState::failed: return "failed";
    case AttemptState::timed_out: return "timed_out";
    case AttemptState::resource_exceeded: return "resource_exceeded";
    case AttemptState::internal_error: return "internal_error";
    case AttemptState::cancelled: return "cancelled";
  }
  return "internal_error";
}

bool is_terminal(AttemptState state) {
  switch (state) {
    case AttemptState::queued:
    case AttemptState::preparing:
    case AttemptState::compiling:
    case AttemptState::running:
      return false;
    default:
      return true;
  }
}

std::vector<std::string> SandboxCapabilities::enforced() const {
  std::vector<std::string> result;
  if (process_group_kill) result.push_back("process_group_kill");
  if (rlimits_cpu) result.push_back("rlimits_cpu");
  if (rlimits_mem) result.push_back("rlimits_mem");
  if (rlimits_fsize) result.push_back("rlimits_fsize");
  if (rlimits_nproc) result.push_back("rlimits_nproc");
  if (job_objects) result.push_back("job_objects");
  if (no_console_window) result.push_back("no_console_window");
  return result;
}

std::vector<std::string> SandboxCapabilities::unsupported() const {
  std::vector<std::string> result;
  if (!process_group_kill) result.push_back("process_group_kill");
  if (!rlimits_cpu) result.push_back("rlimits_cpu");
  if (!rlimits_mem) result.push_back("rlimits_mem");
  if (!rlimits_fsize) result.push_back("rlimits_fsize");
  if (!rlimits_nproc) result.push_back("rlimits_nproc");
  if (!job_objects) result.push_back("job_objects");
  if (!no_console_window) result.push_back("no_console_window");
  return result;
}

}  // namespace runbox
