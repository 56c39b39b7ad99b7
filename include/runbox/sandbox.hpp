#pragma once

// runbox/sandbox.hpp: Process launcher, resource limiter and capped buffers.
//
// PROCESS TREE:
//   POSIX:   the child calls setsid() before exec, so its pid is also the
//            process group id. kill_tree() sends SIGKILL to -pgid.
//   Windows: the child is created suspended, assigned to a job object with
//            KILL_ON_JOB_CLOSE, then resumed. kill_tree() terminates the job.
//
// LIMITS:
//   The wall-clock timeout is always enforced by a Watchdog (watchdog.hpp).
//   Everything else goes through a ResourceLimiter. Hosts without a usable
//   mechanism get NullLimiter and the capability report says so.
//
// LAUNCH FAILURE vs GUEST FAILURE:
//   On POSIX a close-on-exec error pipe carries errno from a failed execve()
//   back to the parent. A process that never started yields
//   ProcessResult::launched == false and never an exit code, so a missing
//   toolchain cannot be mistaken for a guest exiting with 127.
//
// EXTENSION_POINT: seccomp_filter
//   A ResourceLimiter subclass may install a seccomp-BPF filter in
//   apply_in_child(). It must stay async-signal-safe: no allocation, no locks.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "runbox/types.hpp"

namespace runbox {

class CancelToken;

struct ProcessSpec {
  std::string command;  // resolved absolute path of the binary
  std::vector<std::string> argv;  // arguments after argv[0]
  std::map<std::string, std::string> env;
  std::string cwd;
  std::string stdin_data;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{65536};
  ResourceLimits limits;
};

struct ProcessResult {
  bool launched{false};
  ErrorCode launch_error{ErrorCode::none};
  int launch_errno{0};
  std::string error_message;

  std::optional<int> exit_code;    // set when the process exited normally
  std::optional<int> term_signal;  // set when it was killed by a signal
  bool timed_out{false};
  bool cancelled{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::uint64_t duration_ms{0};
};

// Accumulates at most `limit` bytes. Everything past the cap is discarded and
// sets truncated(); the buffer itself never grows beyond the cap.
class CappedBuffer {
 public:
  explicit CappedBuffer(std::size_t limit) : limit_(limit) {}

  void append(const char* data, std::size_t n);

  const std::string& text() const { return text_; }
  std::string take() { return std::move(text_); }
  bool truncated() const { return truncated_; }
  std::size_t limit() const { return limit_; }

 private:
  std::string text_;
  std::size_t limit_;
  bool truncated_{false};
};

// Handle on a launched process tree. kill_tree() must be safe to call from
// the watchdog thread at any time, including after the process has exited.
class ProcessHandle {
 public:
  virtual ~ProcessHandle() = default;
  virtual void kill_tree() noexcept = 0;
};

// Capability interface for OS-level limits. POSIX limiters act in the forked
// child; Windows limiters act on the job object before the child is resumed.
class ResourceLimiter {
 public:
  virtual ~ResourceLimiter() = default;

  virtual std::string name() const = 0;
  virtual SandboxCapabilities capabilities() const = 0;

  // Runs in the child between fork() and execve(). Async-signal-safe only.
  virtual bool apply_in_child(const ResourceLimits& limits) const noexcept;

  // Runs in the parent with the attempt's job object (a HANDLE).
  virtual bool apply_to_job(void* job, const ResourceLimits& limits) const noexcept;
};

class NullLimiter : public ResourceLimiter {
 public:
  std::string name() const override { return "null"; }
  SandboxCapabilities capabilities() const override;
};

// POSIX: PosixRlimitLimiter. Windows: JobObjectLimiter.
std::unique_ptr<ResourceLimiter> make_platform_limiter();

// Start spec.command, feed stdin, collect capped output and wait for the
// whole tree. The watchdog is armed for spec.timeout_ms from the moment the
// process exists. `cancel` may be null.
ProcessResult run_process(const ProcessSpec& spec, const ResourceLimiter& limiter,
                          CancelToken* cancel = nullptr);

SandboxCapabilities detect_platform_sandbox_capabilities();

// Resolve a bare program name against PATH. Names containing a directory
// separator are checked as-is. Returns empty when not found or not executable.
std::string resolve_executable(const std::string& program);

// True for errno values that indicate temporary exhaustion (EAGAIN, ENOMEM,
// EMFILE, ENFILE) rather than a permanent failure.
bool is_transient_errno(int err) noexcept;

}  // namespace runbox
