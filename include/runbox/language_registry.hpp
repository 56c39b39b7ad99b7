#pragma once

// runbox/language_registry.hpp: Catalog of guest languages and toolchains.
//
// CATALOG FORMAT (JSON):
//   {"config_version":"1","languages":[{
//      "id":"python", "aliases":["py","python3"], "extension":".py",
//      "source_name":"main", "compile":null, "run":["python3","-u","{source}"],
//      "timeout_ms":30000, "compile_timeout_ms":30000, "max_output_bytes":65536,
//      "memory_limit_mb":256, "env":{}, "sample":{"source":"...","stdout":"..."}}]}
//
// PLACEHOLDERS (substring substitution in every template element):
//   {source}   absolute path of the materialized source file
//   {workdir}  absolute path of the attempt's workspace
//   {artifact} absolute path the compile step must produce
//
// AVAILABILITY:
//   A language is available when every program its templates name resolves
//   on PATH. Programs that start with a placeholder live in the workspace
//   and are not probed. Each language is probed at most once, lazily, behind
//   its own once_flag: a slow or missing toolchain never delays another
//   language, and the answer holds for the process lifetime.
//
// The registry is immutable after load apart from the probe cache, so
// lookups need no lock.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace runbox {

struct ToolchainDescriptor {
  std::string id;
  std::vector<std::string> aliases;
  std::string extension;
  std::string source_name{"main"};
  std::vector<std::string> compile;  // empty: interpreted
  std::vector<std::string> run;
  std::uint64_t timeout_ms{30000};
  std::uint64_t compile_timeout_ms{30000};
  std::size_t max_output_bytes{65536};
  std::uint64_t memory_limit_mb{0};  // 0: no address-space limit
  std::map<std::string, std::string> env;
  std::string sample_source;
  std::string sample_stdout;

  bool has_compile_phase() const { return !compile.empty(); }
  std::string source_file_name() const { return source_name + extension; }
  std::string artifact_name() const { return source_name + ".out"; }
};

struct PlaceholderValues {
  std::string source;
  std::string workdir;
  std::string artifact;
};

// Replace every placeholder occurrence in each element.
std::vector<std::string> expand_template(const std::vector<std::string>& tmpl, const PlaceholderValues& values);

struct ToolchainStatus {
  bool available{false};
  std::map<std::string, std::string> resolved;  // program -> absolute path
  std::vector<std::string> missing;
};

class LanguageRegistry {
 public:
  // Parse and validate a catalog. Returns nullptr and fills *errors (one
  // entry per problem) when the document is unusable.
  static std::unique_ptr<LanguageRegistry> from_json(const std::string& text, std::vector<std::string>* errors);
  static std::unique_ptr<LanguageRegistry> from_file(const std::string& path, std::vector<std::string>* errors);
  static std::unique_ptr<LanguageRegistry> builtin();

  static const std::string& builtin_catalog_json();

  // Case-insensitive, alias-resolving. nullptr means unsupported.
  const ToolchainDescriptor* lookup(const std::string& language) const;

  bool is_available(const std::string& language) const;
  const ToolchainStatus& status(const ToolchainDescriptor& descriptor) const;

  // Absolute path for a template's program, or the program itself when it is
  // a workspace path (starts with a placeholder).
  std::string resolve_program(const ToolchainDescriptor& descriptor, const std::string& program) const;

  // Sorted by id.
  std::vector<const ToolchainDescriptor*> list() const;
  std::size_t size() const { return descriptors_.size(); }

  std::string to_json() const;

 private:
  struct ProbeSlot {
    std::once_flag once;
    ToolchainStatus status;
  };

  LanguageRegistry() = default;

  std::map<std::string, ToolchainDescriptor> descriptors_;           // id -> descriptor
  std::unordered_map<std::string, const ToolchainDescriptor*> index_;  // lower-cased id/alias
  std::unordered_map<std::string, std::unique_ptr<ProbeSlot>> probes_;  // id -> probe
};

}  // namespace runbox
