#include "runbox/classifier.hpp"

#include <csignal>
#include <sstream>

namespace runbox {

namespace {

bool is_resource_signal(int sig) noexcept {
#ifndef _WIN32
  return sig == SIGXCPU || sig == SIGXFSZ || sig == SIGKILL;
#else
  (void)sig;
  return false;
#endif
}

}  // namespace

Classification classify(const RawOutcome& raw) noexcept {
  Classification c;
  if (raw.infra_error != ErrorCode::none) {
    c.status = ExecutionStatus::internal_error;
    return c;
  }
  if (raw.cancelled) {
    c.status = ExecutionStatus::cancelled;
    return c;
  }
  if (raw.timed_out) {
    c.status = ExecutionStatus::timeout;
    return c;
  }
  if (raw.compile_failed) {
    c.status = ExecutionStatus::compile_error;
    return c;
  }
  if (raw.term_signal && is_resource_signal(*raw.term_signal)) {
    c.status = ExecutionStatus::resource_exceeded;
    return c;
  }
  if (raw.stdout_truncated || raw.stderr_truncated) {
    c.status = ExecutionStatus::resource_exceeded;
    return c;
  }
  if (raw.exit_code) {
    c.status = *raw.exit_code == 0 ? ExecutionStatus::success : ExecutionStatus::runtime_error;
    return c;
  }
  if (raw.term_signal) {
    c.status = ExecutionStatus::runtime_error;
    return c;
  }
  c.status = ExecutionStatus::internal_error;
  c.uncategorized = true;
  return c;
}

std::string describe_outcome(const RawOutcome& raw) {
  std::ostringstream o;
  o << "infra_error=" << to_string(raw.infra_error)
    << " cancelled=" << raw.cancelled
    << " timed_out=" << raw.timed_out
    << " compile_failed=" << raw.compile_failed
    << " exit_code=" << (raw.exit_code ? std::to_string(*raw.exit_code) : "none")
    << " term_signal=" << (raw.term_signal ? std::to_string(*raw.term_signal) : "none")
    << " stdout_truncated=" << raw.stdout_truncated
    << " stderr_truncated=" << raw.stderr_truncated;
  return o.str();
}

AttemptState terminal_state_for(ExecutionStatus status) noexcept {
  switch (status) {
    case ExecutionStatus::success: return AttemptState::completed;
    case ExecutionStatus::compile_error:
    case ExecutionStatus::runtime_error: return AttemptState::failed;
    case ExecutionStatus::timeout: return AttemptState::timed_out;
    case ExecutionStatus::resource_exceeded: return AttemptState::resource_exceeded;
    case ExecutionStatus::cancelled: return AttemptState::cancelled;
    default: return AttemptState::internal_error;
  }
}

}  // namespace runbox
