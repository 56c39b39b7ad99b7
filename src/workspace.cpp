#include "runbox/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include "runbox/observability.hpp"

namespace fs = std::filesystem;

namespace runbox {

namespace {

// Attempt ids are generated internally, but keep directory names to a safe
// alphabet regardless.
std::string safe_component(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
      out += c;
    }
  }
  return out.substr(0, 48);
}

}  // namespace

Workspace Workspace::create(const std::string& root, const std::string& attempt_id, ErrorCode* error,
                            int* error_errno, std::string* message) {
  std::error_code ec;
  const fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
  if (ec || base.empty()) {
    if (error) *error = ErrorCode::workspace_create_failed;
    if (error_errno) *error_errno = ec.value();
    if (message) *message = "no temporary directory: " + ec.message();
    return Workspace();
  }
  const std::string prefix = "runbox-" + safe_component(attempt_id) + "-";

#ifndef _WIN32
  std::string tmpl = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    const int err = errno;
    if (error) *error = ErrorCode::workspace_create_failed;
    if (error_errno) *error_errno = err;
    if (message) *message = "mkdtemp " + tmpl + ": " + std::strerror(err);
    return Workspace();
  }
  // mkdtemp already uses 0700; chmod guards against an unusual umask.
  ::chmod(buf.data(), S_IRWXU);
  return Workspace(fs::path(buf.data()));
#else
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::string suffix;
    for (int i = 0; i < 12; ++i) suffix += kAlphabet[rd() % (sizeof(kAlphabet) - 1)];
    fs::path candidate = base / (prefix + suffix);
    if (fs::create_directory(candidate, ec)) {
      fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
      return Workspace(candidate);
    }
    if (ec) break;
  }
  if (error) *error = ErrorCode::workspace_create_failed;
  if (error_errno) *error_errno = ec.value();
  if (message) *message = "create_directory under " + base.string() + ": " + ec.message();
  return Workspace();
#endif
}

Workspace::~Workspace() { release(); }

Workspace::Workspace(Workspace&& other) noexcept : dir_(std::move(other.dir_)) { other.dir_.clear(); }

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    release();
    dir_ = std::move(other.dir_);
    other.dir_.clear();
  }
  return *this;
}

bool Workspace::write_file(const std::string& name, const std::string& contents, std::string* error) const {
  if (!valid()) {
    if (error) *error = "workspace released";
    return false;
  }
  const fs::path target = dir_ / name;
#ifndef _WIN32
  int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    if (error) *error = "open " + target.string() + ": " + std::strerror(errno);
    return false;
  }
  std::size_t off = 0;
  while (off < contents.size()) {
    ssize_t n = ::write(fd, contents.data() + off, contents.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (error) *error = "write " + target.string() + ": " + std::strerror(errno);
      ::close(fd);
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) {
    if (error) *error = "close " + target.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
#else
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  ofs.close();
  if (!ofs) {
    if (error) *error = "write " + target.string() + " failed";
    return false;
  }
  return true;
#endif
}

bool Workspace::release() noexcept {
  if (dir_.empty()) return true;
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) {
    // Guests can leave read-only directories behind, the workspace root
    // included; grant ourselves write access and try once more.
    std::error_code ec2;
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::add, ec2);
    ec2.clear();
    for (auto it = fs::recursive_directory_iterator(dir_, ec2); !ec2 && it != fs::recursive_directory_iterator();
         it.increment(ec2)) {
      std::error_code ignored;
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ignored);
    }
    ec.clear();
    fs::remove_all(dir_, ec);
  }
  if (ec) {
    global_engine_stats().record_cleanup_failure();
    try {
      emit_log(LogLevel::error, "workspace", "workspace cleanup failed",
               {{"path", dir_.string()}, {"error", ec.message()}});
    } catch (const std::exception&) {
      // Logging allocates; a failed log line must not escape a noexcept release.
    }
    return false;
  }
  dir_.clear();
  return true;
}

}  // namespace runbox
