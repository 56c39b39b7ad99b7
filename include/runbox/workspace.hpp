#pragma once

// runbox/workspace.hpp: Per-attempt scratch directory.
//
// OWNERSHIP:
//   One Workspace per attempt, never shared and never reused, even for
//   byte-identical source. Move-only. release() is idempotent; the destructor
//   calls it as a last resort so every exit path, including exceptions,
//   removes the directory.
//
// SECURITY:
//   POSIX:   mkdtemp() under the workspace root, mode 0700; source file 0600.
//   Windows: random name, create_directory() retried on collision.
//   Names carry the attempt id for debugging but the random suffix is what
//   makes them unpredictable.

#include <filesystem>
#include <string>

#include "runbox/types.hpp"

namespace runbox {

class Workspace {
 public:
  // Creates the directory. On failure returns an empty (invalid) workspace
  // and sets *error / *error_errno.
  static Workspace create(const std::string& root, const std::string& attempt_id, ErrorCode* error,
                          int* error_errno, std::string* message);

  Workspace() = default;
  ~Workspace();
  Workspace(Workspace&& other) noexcept;
  Workspace& operator=(Workspace&& other) noexcept;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  bool valid() const { return !dir_.empty(); }
  const std::filesystem::path& dir() const { return dir_; }

  // Write `contents` to dir()/name with owner-only permissions.
  bool write_file(const std::string& name, const std::string& contents, std::string* error) const;

  // Remove the directory tree. Safe to call repeatedly. Failures are logged
  // and counted in EngineStats, never thrown. Returns true when the
  // directory is gone.
  bool release() noexcept;

 private:
  explicit Workspace(std::filesystem::path dir) : dir_(std::move(dir)) {}
  std::filesystem::path dir_;
};

}  // namespace runbox
