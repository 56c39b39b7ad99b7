#ifdef _WIN32
#include "runbox/sandbox.hpp"
#include "runbox/watchdog.hpp"

#include <windows.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace runbox {
namespace {

std::wstring widen(const std::string& s) {
  if (s.empty()) return {};
  int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
  std::wstring out(static_cast<std::size_t>(n), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
  return out;
}

// CommandLineToArgvW quoting rules: backslashes are literal unless they
// precede a double quote.
void append_quoted(std::wstring& cmd, const std::wstring& arg) {
  cmd += L'"';
  std::size_t backslashes = 0;
  for (wchar_t c : arg) {
    if (c == L'\\') {
      ++backslashes;
      continue;
    }
    if (c == L'"') {
      cmd.append(backslashes * 2 + 1, L'\\');
    } else {
      cmd.append(backslashes, L'\\');
    }
    backslashes = 0;
    cmd += c;
  }
  cmd.append(backslashes * 2, L'\\');
  cmd += L'"';
}

void close_handle(HANDLE& h) {
  if (h != nullptr && h != INVALID_HANDLE_VALUE) {
    CloseHandle(h);
    h = nullptr;
  }
}

// Child pipe ends are inheritable until CreateProcessW returns and they are
// closed. Serializing that window keeps a concurrent spawn from inheriting
// another attempt's write ends, which would hold its readers open.
std::mutex g_spawn_mutex;

class WindowsProcessHandle final : public ProcessHandle {
 public:
  explicit WindowsProcessHandle(HANDLE job) : job_(job) {}
  void kill_tree() noexcept override {
    std::lock_guard<std::mutex> lock(mu_);
    TerminateJobObject(job_, 1);
  }

 private:
  HANDLE job_;
  std::mutex mu_;
};

class JobObjectLimiter final : public ResourceLimiter {
 public:
  std::string name() const override { return "job_object"; }
  SandboxCapabilities capabilities() const override { return detect_platform_sandbox_capabilities(); }

  bool apply_to_job(void* job, const ResourceLimits& limits) const noexcept override {
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION jeli{};
    jeli.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    if (limits.max_memory_bytes > 0) {
      jeli.BasicLimitInformation.LimitFlags |= JOB_OBJECT_LIMIT_JOB_MEMORY;
      jeli.JobMemoryLimit = static_cast<SIZE_T>(limits.max_memory_bytes);
    }
    if (limits.cpu_time_ms > 0) {
      // 100-nanosecond units.
      jeli.BasicLimitInformation.LimitFlags |= JOB_OBJECT_LIMIT_JOB_TIME;
      jeli.BasicLimitInformation.PerJobUserTimeLimit.QuadPart =
          static_cast<LONGLONG>(limits.cpu_time_ms) * 10000;
    }
    if (limits.max_processes > 0) {
      jeli.BasicLimitInformation.LimitFlags |= JOB_OBJECT_LIMIT_ACTIVE_PROCESS;
      jeli.BasicLimitInformation.ActiveProcessLimit = static_cast<DWORD>(limits.max_processes);
    }
    if (limits.disable_core_dumps) {
      jeli.BasicLimitInformation.LimitFlags |= JOB_OBJECT_LIMIT_DIE_ON_UNHANDLED_EXCEPTION;
    }
    return SetInformationJobObject(static_cast<HANDLE>(job), JobObjectExtendedLimitInformation, &jeli,
                                   sizeof(jeli)) != 0;
  }
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

}  // namespace

std::unique_ptr<ResourceLimiter> make_platform_limiter() {
  return std::make_unique<JobObjectLimiter>();
}

ProcessResult run_process(const ProcessSpec& spec, const ResourceLimiter& limiter,
                          CancelToken* cancel) {
  ProcessResult result;
  std::unique_lock<std::mutex> spawn_lock(g_spawn_mutex);
  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
  HANDLE in_r = nullptr, in_w = nullptr, out_r = nullptr, out_w = nullptr, err_r = nullptr, err_w = nullptr;
  if (!CreatePipe(&in_r, &in_w, &sa, 0) || !CreatePipe(&out_r, &out_w, &sa, 0) ||
      !CreatePipe(&err_r, &err_w, &sa, 0)) {
    result.launch_error = ErrorCode::pipe_failed;
    result.launch_errno = static_cast<int>(GetLastError());
    result.error_message = "CreatePipe failed";
    for (HANDLE* h : {&in_r, &in_w, &out_r, &out_w, &err_r, &err_w}) close_handle(*h);
    return result;
  }
  // Parent ends must not be inherited by the guest.
  SetHandleInformation(in_w, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

  HANDLE job = CreateJobObjectW(nullptr, nullptr);
  if (job == nullptr || !limiter.apply_to_job(job, spec.limits)) {
    result.launch_error = ErrorCode::spawn_failed;
    result.launch_errno = static_cast<int>(GetLastError());
    result.error_message = "job object setup failed";
    for (HANDLE* h : {&in_r, &in_w, &out_r, &out_w, &err_r, &err_w, &job}) close_handle(*h);
    return result;
  }

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = in_r;
  si.hStdOutput = out_w;
  si.hStdError = err_w;

  std::wstring cmd;
  append_quoted(cmd, widen(spec.command));
  for (const auto& a : spec.argv) {
    cmd += L' ';
    append_quoted(cmd, widen(a));
  }

  std::wstring env_block;
  for (const auto& [k, v] : spec.env) {
    env_block += widen(k + "=" + v);
    env_block += L'\0';
  }
  env_block += L'\0';

  auto app = widen(spec.command);
  auto cwd = widen(spec.cwd);
  DWORD creation_flags = CREATE_NO_WINDOW | CREATE_SUSPENDED | CREATE_UNICODE_ENVIRONMENT;

  PROCESS_INFORMATION pi{};
  BOOL created = CreateProcessW(app.c_str(), cmd.data(), nullptr, nullptr, TRUE, creation_flags,
                                env_block.data(), cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
  close_handle(in_r);
  close_handle(out_w);
  close_handle(err_w);
  spawn_lock.unlock();

  if (!created) {
    const DWORD err = GetLastError();
    result.launch_errno = static_cast<int>(err);
    result.launch_error = (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND)
                              ? ErrorCode::toolchain_missing
                              : ErrorCode::exec_failed;
    result.error_message = "CreateProcessW failed for " + spec.command;
    for (HANDLE* h : {&in_w, &out_r, &err_r, &job}) close_handle(*h);
    return result;
  }

  if (!AssignProcessToJobObject(job, pi.hProcess)) {
    TerminateProcess(pi.hProcess, 1);
    WaitForSingleObject(pi.hProcess, INFINITE);
    result.launch_error = ErrorCode::spawn_failed;
    result.launch_errno = static_cast<int>(GetLastError());
    result.error_message = "AssignProcessToJobObject failed";
    for (HANDLE* h : {&in_w, &out_r, &err_r, &pi.hThread, &pi.hProcess, &job}) close_handle(*h);
    return result;
  }
  const auto started = std::chrono::steady_clock::now();
  ResumeThread(pi.hThread);
  close_handle(pi.hThread);
  result.launched = true;

  WindowsProcessHandle handle(job);
  CappedBuffer out_buf(spec.max_output_bytes);
  CappedBuffer err_buf(spec.max_output_bytes);

  // Anonymous pipes have no overlapped mode: one blocking thread per stream.
  auto reader = [](HANDLE h, CappedBuffer* into) {
    char buf[4096];
    DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) into->append(buf, n);
  };
  std::thread out_thread(reader, out_r, &out_buf);
  std::thread err_thread(reader, err_r, &err_buf);
  std::thread in_thread([&spec, in_w]() mutable {
    std::size_t off = 0;
    while (off < spec.stdin_data.size()) {
      DWORD chunk = static_cast<DWORD>(std::min<std::size_t>(spec.stdin_data.size() - off, 64 * 1024));
      DWORD written = 0;
      if (!WriteFile(in_w, spec.stdin_data.data() + off, chunk, &written, nullptr)) break;
      off += written;
    }
    CloseHandle(in_w);
  });

  {
    Watchdog watchdog(handle, spec.timeout_ms);
    CancelAttachment attachment(cancel, &watchdog);
    WaitForSingleObject(pi.hProcess, INFINITE);
    result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    watchdog.disarm();
    const auto reason = watchdog.reason();
    result.timed_out = reason == Watchdog::Reason::timeout;
    result.cancelled = reason == Watchdog::Reason::cancelled;
  }

  // Stragglers die with the job, which closes their pipe ends.
  handle.kill_tree();
  in_thread.join();
  out_thread.join();
  err_thread.join();

  DWORD ec = 0;
  GetExitCodeProcess(pi.hProcess, &ec);
  result.exit_code = static_cast<int>(ec);
  result.stdout_truncated = out_buf.truncated();
  result.stderr_truncated = err_buf.truncated();
  result.stdout_text = out_buf.take();
  result.stderr_text = err_buf.take();

  close_handle(out_r);
  close_handle(err_r);
  close_handle(pi.hProcess);
  close_handle(job);
  return result;
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.process_group_kill = true;  // TerminateJobObject
  caps.rlimits_cpu = true;         // PerJobUserTimeLimit
  caps.rlimits_mem = true;         // JobMemoryLimit
  caps.rlimits_fsize = false;
  caps.rlimits_nproc = true;       // ActiveProcessLimit
  caps.job_objects = true;
  caps.no_console_window = true;
  return caps;
}

}  // namespace runbox
#endif
