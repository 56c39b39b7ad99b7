#pragma once

// runbox/classifier.hpp: Raw process outcome -> ExecutionStatus.
//
// PRECEDENCE (first match wins):
//   1. infrastructure/launch failure        -> internal_error
//   2. cancelled by the caller              -> cancelled
//   3. watchdog timeout                     -> timeout
//   4. compile step failed                  -> compile_error
//   5. SIGXCPU / SIGXFSZ / SIGKILL          -> resource_exceeded
//      (SIGKILL only reaches here when the watchdog did not fire, so the
//       kernel or an rlimit sent it)
//   6. stdout or stderr truncated           -> resource_exceeded
//   7. exit code 0                          -> success
//   8. non-zero exit or any other signal    -> runtime_error
//   9. anything else                        -> internal_error, uncategorized
//
// classify() is pure and noexcept. describe_outcome() renders the raw data
// for ExecutionResult::diagnostics when a result is uncategorized.

#include <optional>
#include <string>

#include "runbox/types.hpp"

namespace runbox {

struct RawOutcome {
  ErrorCode infra_error{ErrorCode::none};
  bool cancelled{false};
  bool timed_out{false};
  bool compile_failed{false};
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
};

struct Classification {
  ExecutionStatus status{ExecutionStatus::internal_error};
  bool uncategorized{false};
};

Classification classify(const RawOutcome& raw) noexcept;

std::string describe_outcome(const RawOutcome& raw);

// Final attempt state for a classified status.
AttemptState terminal_state_for(ExecutionStatus status) noexcept;

}  // namespace runbox
