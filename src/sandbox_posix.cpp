#ifndef _WIN32

#include "runbox/sandbox.hpp"
#include "runbox/watchdog.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace runbox {

namespace {

// After the main process is reaped, stragglers are killed and the pipes are
// drained for at most this long. A grandchild that escaped the group with its
// own setsid() can hold a pipe open forever; it must not hold the attempt.
constexpr auto kDrainGrace = std::chrono::milliseconds(250);
constexpr int kPollIntervalMs = 20;
constexpr std::size_t kStdinChunk = 64 * 1024;

// Pipe creation and fork() happen under one lock. Every pipe end is
// FD_CLOEXEC, but a fork in another thread between pipe() and fcntl() would
// still inherit the fd and hold this attempt's pipes open.
std::mutex g_spawn_mutex;

// Guest stdin may close early; writes must fail with EPIPE, not kill us.
void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

struct PipeSet {
  int in[2]{-1, -1};
  int out[2]{-1, -1};
  int err[2]{-1, -1};
  int exec_status[2]{-1, -1};

  ~PipeSet() {
    for (int* p : {in, out, err, exec_status}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  }
};

// Written by the child to the exec-status pipe when it fails before or at
// execve(). A successful execve() closes the pipe with nothing written.
struct ChildFailure {
  enum Stage : int { chdir_failed = 1, limits_failed = 2, exec_failed = 3 };
  int stage{0};
  int err{0};
};

[[noreturn]] void child_fail(int fd, int stage) noexcept {
  ChildFailure f;
  f.stage = stage;
  f.err = errno;
  ssize_t n = ::write(fd, &f, sizeof(f));
  (void)n;
  ::_exit(127);
}

class PosixProcessHandle final : public ProcessHandle {
 public:
  explicit PosixProcessHandle(pid_t pid) : pid_(pid) {}

  // SIGKILL the whole group. The leader is signalled individually only
  // while it has not been reaped, so its pid can never be recycled under us.
  void kill_tree() noexcept override {
    std::lock_guard<std::mutex> lock(mu_);
    if (!group_released_) ::kill(-pid_, SIGKILL);
    if (!reaped_) ::kill(pid_, SIGKILL);
  }

  // Returns true once the leader has been collected.
  bool try_reap(int* status, int* wait_errno) {
    std::lock_guard<std::mutex> lock(mu_);
    if (reaped_) return true;
    pid_t w = ::waitpid(pid_, status, WNOHANG);
    if (w == pid_) {
      reaped_ = true;
    } else if (w < 0 && errno != EINTR) {
      *wait_errno = errno;
      reaped_ = true;
    }
    return reaped_;
  }

  void release_group() {
    std::lock_guard<std::mutex> lock(mu_);
    group_released_ = true;
  }

 private:
  const pid_t pid_;
  std::mutex mu_;
  bool reaped_{false};
  bool group_released_{false};
};

struct CancelAttachment {
  CancelToken* token;
  CancelAttachment(CancelToken* t, Watchdog* wd) : token(t) {
    if (token) token->attach(wd);
  }
  ~CancelAttachment() {
    if (token) token->detach();
  }
};

class PosixRlimitLimiter final : public ResourceLimiter {
 public:
  std::string name() const override { return "posix_rlimit"; }

  SandboxCapabilities capabilities() const override {
    return detect_platform_sandbox_capabilities();
  }

  // Soft limits never exceed the inherited hard limit; raising a hard limit
  // needs privileges we do not assume.
  bool apply_in_child(const ResourceLimits& limits) const noexcept override {
    auto set = [](int resource, rlim_t soft, rlim_t hard) {
      struct rlimit cur;
      if (::getrlimit(resource, &cur) == 0 && cur.rlim_max != RLIM_INFINITY) {
        if (hard > cur.rlim_max) hard = cur.rlim_max;
        if (soft > hard) soft = hard;
      }
      struct rlimit rl;
      rl.rlim_cur = soft;
      rl.rlim_max = hard;
      return ::setrlimit(resource, &rl) == 0;
    };

    bool ok = true;
    if (limits.cpu_time_ms > 0) {
      const rlim_t secs = static_cast<rlim_t>((limits.cpu_time_ms + 999) / 1000);
      ok = set(RLIMIT_CPU, secs, secs + 1) && ok;
    }
    if (limits.max_memory_bytes > 0) {
      ok = set(RLIMIT_AS, limits.max_memory_bytes, limits.max_memory_bytes) && ok;
    }
    if (limits.max_file_bytes > 0) {
      ok = set(RLIMIT_FSIZE, limits.max_file_bytes, limits.max_file_bytes) && ok;
    }
    if (limits.max_processes > 0) {
      ok = set(RLIMIT_NPROC, limits.max_processes, limits.max_processes) && ok;
    }
    if (limits.disable_core_dumps) {
      ok = set(RLIMIT_CORE, 0, 0) && ok;
    }
    return ok;
  }
};

}  // namespace

std::unique_ptr<ResourceLimiter> make_platform_limiter() {
  return std::make_unique<PosixRlimitLimiter>();
}

ProcessResult run_process(const ProcessSpec& spec, const ResourceLimiter& limiter,
                          CancelToken* cancel) {
  ProcessResult result;
  ignore_sigpipe_once();

  // Everything the child needs is built before fork(): after fork() in a
  // multi-threaded process only async-signal-safe calls are allowed.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

  PipeSet pipes;
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(g_spawn_mutex);
    if (!make_pipe(pipes.in) || !make_pipe(pipes.out) || !make_pipe(pipes.err) ||
        !make_pipe(pipes.exec_status)) {
      result.launch_error = ErrorCode::pipe_failed;
      result.launch_errno = errno;
      result.error_message = std::string("pipe: ") + std::strerror(errno);
      return result;
    }
    pid = ::fork();
    if (pid < 0) {
      result.launch_error = ErrorCode::spawn_failed;
      result.launch_errno = errno;
      result.error_message = std::string("fork: ") + std::strerror(errno);
      return result;
    }
  }

  if (pid == 0) {
    ::setsid();
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);

    // dup2() clears FD_CLOEXEC on the target; all other pipe ends close at exec.
    ::dup2(pipes.in[0], STDIN_FILENO);
    ::dup2(pipes.out[1], STDOUT_FILENO);
    ::dup2(pipes.err[1], STDERR_FILENO);

    if (cwd && ::chdir(cwd) != 0) child_fail(pipes.exec_status[1], ChildFailure::chdir_failed);
    if (!limiter.apply_in_child(spec.limits)) child_fail(pipes.exec_status[1], ChildFailure::limits_failed);
    ::execve(spec.command.c_str(), argv.data(), envp.data());
    child_fail(pipes.exec_status[1], ChildFailure::exec_failed);
  }

  const auto started = std::chrono::steady_clock::now();
  PosixProcessHandle handle(pid);

  close_fd(pipes.in[0]);
  close_fd(pipes.out[1]);
  close_fd(pipes.err[1]);
  close_fd(pipes.exec_status[1]);

  ChildFailure failure;
  ssize_t got = 0;
  do {
    got = ::read(pipes.exec_status[0], &failure, sizeof(failure));
  } while (got < 0 && errno == EINTR);
  close_fd(pipes.exec_status[0]);

  if (got == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.launch_errno = failure.err;
    switch (failure.stage) {
      case ChildFailure::exec_failed:
        result.launch_error = failure.err == ENOENT ? ErrorCode::toolchain_missing : ErrorCode::exec_failed;
        result.error_message = "execve " + spec.command + ": " + std::strerror(failure.err);
        break;
      case ChildFailure::chdir_failed:
        result.launch_error = ErrorCode::exec_failed;
        result.error_message = "chdir " + spec.cwd + ": " + std::strerror(failure.err);
        break;
      default:
        result.launch_error = ErrorCode::spawn_failed;
        result.error_message = std::string("setrlimit: ") + std::strerror(failure.err);
        break;
    }
    return result;
  }
  result.launched = true;

  int status = 0;
  int wait_errno = 0;
  bool reaped = false;
  {
    Watchdog watchdog(handle, spec.timeout_ms);
    CancelAttachment attachment(cancel, &watchdog);

    ::fcntl(pipes.out[0], F_SETFL, O_NONBLOCK);
    ::fcntl(pipes.err[0], F_SETFL, O_NONBLOCK);
    ::fcntl(pipes.in[1], F_SETFL, O_NONBLOCK);
    if (spec.stdin_data.empty()) close_fd(pipes.in[1]);

    CappedBuffer out_buf(spec.max_output_bytes);
    CappedBuffer err_buf(spec.max_output_bytes);
    std::size_t stdin_off = 0;
    std::chrono::steady_clock::time_point drain_deadline{};
    char buf[4096];

    auto drain = [&buf](int& fd, CappedBuffer& into) {
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n > 0) {
        into.append(buf, static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
        close_fd(fd);
      }
    };

    while (true) {
      if (reaped) {
        if (pipes.out[0] < 0 && pipes.err[0] < 0) break;
        if (std::chrono::steady_clock::now() >= drain_deadline) break;
      }

      struct pollfd fds[3];
      nfds_t nfds = 0;
      int* slots[3];
      if (pipes.out[0] >= 0) { fds[nfds] = {pipes.out[0], POLLIN, 0}; slots[nfds++] = &pipes.out[0]; }
      if (pipes.err[0] >= 0) { fds[nfds] = {pipes.err[0], POLLIN, 0}; slots[nfds++] = &pipes.err[0]; }
      if (pipes.in[1] >= 0) { fds[nfds] = {pipes.in[1], POLLOUT, 0}; slots[nfds++] = &pipes.in[1]; }

      int rc = 0;
      if (nfds > 0) {
        rc = ::poll(fds, nfds, kPollIntervalMs);
        if (rc < 0 && errno != EINTR) {
          wait_errno = errno;
          handle.kill_tree();
        }
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
      }

      for (nfds_t k = 0; rc > 0 && k < nfds; ++k) {
        if (fds[k].revents == 0) continue;
        int& fd = *slots[k];
        if (&fd == &pipes.out[0]) {
          drain(fd, out_buf);
        } else if (&fd == &pipes.err[0]) {
          drain(fd, err_buf);
        } else {
          const std::size_t remaining = spec.stdin_data.size() - stdin_off;
          const std::size_t chunk = remaining < kStdinChunk ? remaining : kStdinChunk;
          ssize_t n = ::write(fd, spec.stdin_data.data() + stdin_off, chunk);
          if (n > 0) {
            stdin_off += static_cast<std::size_t>(n);
            if (stdin_off >= spec.stdin_data.size()) close_fd(fd);
          } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            // EPIPE: the guest closed stdin without reading all of it.
            close_fd(fd);
          }
        }
      }

      if (!reaped && handle.try_reap(&status, &wait_errno)) {
        reaped = true;
        result.duration_ms = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
                .count());
        watchdog.disarm();
        close_fd(pipes.in[1]);
        handle.kill_tree();
        drain_deadline = std::chrono::steady_clock::now() + kDrainGrace;
      }
    }

    handle.release_group();

    const auto reason = watchdog.reason();
    result.timed_out = reason == Watchdog::Reason::timeout;
    result.cancelled = reason == Watchdog::Reason::cancelled;
    result.stdout_truncated = out_buf.truncated();
    result.stderr_truncated = err_buf.truncated();
    result.stdout_text = out_buf.take();
    result.stderr_text = err_buf.take();
  }

  if (wait_errno != 0) {
    result.launch_error = ErrorCode::wait_failed;
    result.launch_errno = wait_errno;
    result.error_message = std::string("waitpid: ") + std::strerror(wait_errno);
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.process_group_kill = true;  // setsid() + kill(-pgid)
  caps.rlimits_cpu = true;
  caps.rlimits_mem = true;
  caps.rlimits_fsize = true;
  caps.rlimits_nproc = true;
  caps.job_objects = false;
  caps.no_console_window = false;  // no console to suppress
  return caps;
}

}  // namespace runbox

#endif
