#include "runbox/sandbox.hpp"

// Platform-independent pieces of the launcher. The process code itself lives
// in sandbox_posix.cpp and sandbox_win.cpp.

#include <cerrno>
#include <cstdlib>
#include <filesystem>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace runbox {

void CappedBuffer::append(const char* data, std::size_t n) {
  if (n == 0) return;
  const std::size_t avail = text_.size() < limit_ ? limit_ - text_.size() : 0;
  const std::size_t take = n < avail ? n : avail;
  text_.append(data, take);
  if (take < n) truncated_ = true;
}

bool ResourceLimiter::apply_in_child(const ResourceLimits& /*limits*/) const noexcept {
  return true;
}

bool ResourceLimiter::apply_to_job(void* /*job*/, const ResourceLimits& /*limits*/) const noexcept {
  return true;
}

SandboxCapabilities NullLimiter::capabilities() const {
  SandboxCapabilities caps;
  // Tree termination belongs to the process handle, not the limiter.
  caps.process_group_kill = true;
  return caps;
}

bool is_transient_errno(int err) noexcept {
  return err == EAGAIN || err == ENOMEM || err == EMFILE || err == ENFILE;
}

std::string resolve_executable(const std::string& program) {
  if (program.empty()) return {};
  std::error_code ec;

  auto usable = [&ec](const fs::path& p) {
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
  };

  if (program.find('/') != std::string::npos || program.find('\\') != std::string::npos) {
    return usable(program) ? program : std::string{};
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) return {};

#ifdef _WIN32
  const char sep = ';';
  static const char* kSuffixes[] = {".exe", ".cmd", ".bat", ""};
#else
  const char sep = ':';
  static const char* kSuffixes[] = {""};
#endif

  const std::string path_list(path_env);
  std::size_t start = 0;
  while (start <= path_list.size()) {
    std::size_t end = path_list.find(sep, start);
    if (end == std::string::npos) end = path_list.size();
    const std::string dir = path_list.substr(start, end - start);
    if (!dir.empty()) {
      for (const char* suffix : kSuffixes) {
        fs::path candidate = fs::path(dir) / (program + suffix);
        if (usable(candidate)) return candidate.string();
      }
    }
    start = end + 1;
  }
  return {};
}

}  // namespace runbox
