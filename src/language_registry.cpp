#include "runbox/language_registry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "runbox/jsonlite.hpp"
#include "runbox/observability.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/version.hpp"

namespace runbox {

namespace {

// Built-in catalog. Commands and limits follow the toolchains the service
// has always shipped with; runtimes that reserve large virtual heaps up
// front (JVM, V8, Go, Mono) run without an address-space limit.
const char* const kBuiltinCatalog = R"JSON({
  "config_version": "1",
  "languages": [
    {"id": "python", "aliases": ["py", "python3"], "extension": ".py",
     "compile": null, "run": ["python3", "-u", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 256,
     "sample": {"source": "print(\"Hello World\")", "stdout": "Hello World\n"}},
    {"id": "javascript", "aliases": ["js", "node", "nodejs"], "extension": ".js",
     "compile": null, "run": ["node", "--max-old-space-size=512", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 0,
     "sample": {"source": "console.log(\"Hello World\");", "stdout": "Hello World\n"}},
    {"id": "typescript", "aliases": ["ts"], "extension": ".ts",
     "compile": ["tsc", "--target", "es2019", "--outDir", "{artifact}", "{source}"],
     "run": ["node", "--max-old-space-size=512", "{artifact}/main.js"],
     "timeout_ms": 30000, "compile_timeout_ms": 60000, "max_output_bytes": 65536, "memory_limit_mb": 0,
     "sample": {"source": "const greeting: string = \"Hello World\";\nconsole.log(greeting);", "stdout": "Hello World\n"}},
    {"id": "bash", "aliases": ["sh", "shell"], "extension": ".sh",
     "compile": null, "run": ["bash", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 128,
     "sample": {"source": "echo \"Hello World\"", "stdout": "Hello World\n"}},
    {"id": "php", "aliases": [], "extension": ".php",
     "compile": null, "run": ["php", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 256,
     "sample": {"source": "<?php\necho \"Hello World\\n\";", "stdout": "Hello World\n"}},
    {"id": "ruby", "aliases": ["rb"], "extension": ".rb",
     "compile": null, "run": ["ruby", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 256,
     "sample": {"source": "puts \"Hello World\"", "stdout": "Hello World\n"}},
    {"id": "perl", "aliases": ["pl"], "extension": ".pl",
     "compile": null, "run": ["perl", "{source}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 256,
     "sample": {"source": "print \"Hello World\\n\";", "stdout": "Hello World\n"}},
    {"id": "c", "aliases": [], "extension": ".c",
     "compile": ["gcc", "-std=c11", "-O2", "-o", "{artifact}", "{source}", "-lm"],
     "run": ["{artifact}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 512,
     "sample": {"source": "#include <stdio.h>\nint main(void) { printf(\"Hello World\\n\"); return 0; }", "stdout": "Hello World\n"}},
    {"id": "cpp", "aliases": ["c++", "cxx"], "extension": ".cpp",
     "compile": ["g++", "-std=c++17", "-O2", "-o", "{artifact}", "{source}"],
     "run": ["{artifact}"],
     "timeout_ms": 30000, "compile_timeout_ms": 60000, "max_output_bytes": 65536, "memory_limit_mb": 512,
     "sample": {"source": "#include <iostream>\nint main() { std::cout << \"Hello World\" << std::endl; return 0; }", "stdout": "Hello World\n"}},
    {"id": "csharp", "aliases": ["cs", "c#"], "extension": ".cs",
     "compile": ["mcs", "-out:{artifact}", "{source}"],
     "run": ["mono", "{artifact}"],
     "timeout_ms": 30000, "max_output_bytes": 65536, "memory_limit_mb": 0,
     "sample": {"source": "using System;\nclass Program { static void Main() { Console.WriteLine(\"Hello World\"); } }", "stdout": "Hello World\n"}},
    {"id": "java", "aliases": [], "extension": ".java", "source_name": "Main",
     "compile": ["javac", "-d", "{artifact}", "{source}"],
     "run": ["java", "-cp", "{artifact}", "Main"],
     "timeout_ms": 30000, "compile_timeout_ms": 60000, "max_output_bytes": 65536, "memory_limit_mb": 0,
     "sample": {"source": "public class Main { public static void main(String[] args) { System.out.println(\"Hello World\"); } }", "stdout": "Hello World\n"}},
    {"id": "go", "aliases": ["golang"], "extension": ".go",
     "compile": ["go", "build", "-o", "{artifact}", "{source}"],
     "run": ["{artifact}"],
     "env": {"GOCACHE": "{workdir}/.gocache", "GOPATH": "{workdir}/.gopath", "GO111MODULE": "off"},
     "timeout_ms": 30000, "compile_timeout_ms": 60000, "max_output_bytes": 65536, "memory_limit_mb": 0,
     "sample": {"source": "package main\n\nimport \"fmt\"\n\nfunc main() { fmt.Println(\"Hello World\") }", "stdout": "Hello World\n"}}
  ]
})JSON";

const std::set<std::string> kPlaceholders = {"{source}", "{workdir}", "{artifact}"};

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Every "{...}" token must be a known placeholder.
void check_placeholders(const std::string& where, const std::vector<std::string>& tmpl,
                        std::vector<std::string>* errors) {
  for (const auto& part : tmpl) {
    std::size_t pos = 0;
    while ((pos = part.find('{', pos)) != std::string::npos) {
      const std::size_t end = part.find('}', pos);
      if (end == std::string::npos) {
        errors->push_back(where + ": unterminated placeholder in \"" + part + "\"");
        break;
      }
      const std::string token = part.substr(pos, end - pos + 1);
      if (!kPlaceholders.contains(token)) {
        errors->push_back(where + ": unknown placeholder " + token);
      }
      pos = end + 1;
    }
  }
}

bool mentions(const std::vector<std::string>& tmpl, const std::string& token) {
  for (const auto& part : tmpl)
    if (part.find(token) != std::string::npos) return true;
  return false;
}

// Arrays of strings only; anything else is reported rather than skipped.
bool strict_string_array(const jsonlite::Object& obj, const std::string& key, const std::string& where,
                         std::vector<std::string>* out, std::vector<std::string>* errors) {
  const auto* arr = jsonlite::get_array(obj, key);
  if (!arr) return false;
  for (const auto& item : *arr) {
    if (!std::holds_alternative<std::string>(item.v)) {
      errors->push_back(where + ": " + key + " must contain only strings");
      return false;
    }
    out->push_back(std::get<std::string>(item.v));
  }
  return true;
}

bool starts_with_placeholder(const std::string& program) {
  return !program.empty() && program.front() == '{';
}

}  // namespace

std::vector<std::string> expand_template(const std::vector<std::string>& tmpl, const PlaceholderValues& values) {
  std::vector<std::string> out;
  out.reserve(tmpl.size());
  const std::pair<std::string, const std::string*> subs[] = {
      {"{source}", &values.source},
      {"{workdir}", &values.workdir},
      {"{artifact}", &values.artifact},
  };
  for (std::string part : tmpl) {
    for (const auto& [token, value] : subs) {
      std::size_t pos = 0;
      while ((pos = part.find(token, pos)) != std::string::npos) {
        part.replace(pos, token.size(), *value);
        pos += value->size();
      }
    }
    out.push_back(std::move(part));
  }
  return out;
}

const std::string& LanguageRegistry::builtin_catalog_json() {
  static const std::string kCatalog(kBuiltinCatalog);
  return kCatalog;
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::from_json(const std::string& text,
                                                              std::vector<std::string>* errors) {
  std::vector<std::string> local_errors;
  std::vector<std::string>& errs = errors ? *errors : local_errors;

  std::optional<jsonlite::JsonError> jerr;
  auto root = jsonlite::parse(text, &jerr);
  if (jerr) {
    errs.push_back(jerr->code + ": " + jerr->message);
    return nullptr;
  }

  auto compat = version::check_catalog_version(jsonlite::get_string(root, "config_version"));
  if (!compat.ok) {
    errs.push_back(compat.description);
    return nullptr;
  }

  const auto* languages = jsonlite::get_array(root, "languages");
  if (!languages || languages->empty()) {
    errs.push_back("catalog has no \"languages\" array");
    return nullptr;
  }

  std::unique_ptr<LanguageRegistry> reg(new LanguageRegistry());
  const std::size_t errors_before = errs.size();

  std::size_t index = 0;
  for (const auto& item : *languages) {
    const std::string where_idx = "languages[" + std::to_string(index++) + "]";
    const auto* obj = std::get_if<jsonlite::Object>(&item.v);
    if (!obj) {
      errs.push_back(where_idx + ": not an object");
      continue;
    }

    ToolchainDescriptor d;
    d.id = to_lower(jsonlite::get_string(*obj, "id"));
    const std::string where = d.id.empty() ? where_idx : d.id;
    if (d.id.empty()) errs.push_back(where + ": missing id");

    strict_string_array(*obj, "aliases", where, &d.aliases, &errs);
    d.extension = jsonlite::get_string(*obj, "extension");
    if (d.extension.empty() || d.extension.front() != '.') {
      errs.push_back(where + ": extension must start with '.'");
    }
    d.source_name = jsonlite::get_string(*obj, "source_name", "main");
    if (d.source_name.empty() || d.source_name.find_first_of("/\\") != std::string::npos) {
      errs.push_back(where + ": source_name must be a plain file name");
    }

    if (!strict_string_array(*obj, "run", where, &d.run, &errs) || d.run.empty()) {
      errs.push_back(where + ": run template is empty");
    }
    if (jsonlite::has_key(*obj, "compile") && !jsonlite::is_null(*obj, "compile")) {
      if (!strict_string_array(*obj, "compile", where, &d.compile, &errs) || d.compile.empty()) {
        errs.push_back(where + ": compile template must be null or a non-empty array");
      } else if (!mentions(d.compile, "{artifact}")) {
        errs.push_back(where + ": compile template does not produce {artifact}");
      }
    }
    check_placeholders(where + " run", d.run, &errs);
    check_placeholders(where + " compile", d.compile, &errs);

    d.timeout_ms = jsonlite::get_u64(*obj, "timeout_ms", d.timeout_ms);
    d.compile_timeout_ms = jsonlite::get_u64(*obj, "compile_timeout_ms", d.compile_timeout_ms);
    d.max_output_bytes = jsonlite::get_u64(*obj, "max_output_bytes", d.max_output_bytes);
    d.memory_limit_mb = jsonlite::get_u64(*obj, "memory_limit_mb", d.memory_limit_mb);
    if (d.timeout_ms == 0) errs.push_back(where + ": timeout_ms must be positive");
    if (d.compile_timeout_ms == 0) errs.push_back(where + ": compile_timeout_ms must be positive");
    if (d.max_output_bytes == 0) errs.push_back(where + ": max_output_bytes must be positive");

    d.env = jsonlite::get_string_map(*obj, "env");
    for (const auto& [k, v] : d.env) check_placeholders(where + " env " + k, {v}, &errs);

    if (const auto* sample = jsonlite::get_object(*obj, "sample")) {
      d.sample_source = jsonlite::get_string(*sample, "source");
      d.sample_stdout = jsonlite::get_string(*sample, "stdout");
    }

    if (d.id.empty()) continue;
    if (reg->descriptors_.contains(d.id)) {
      errs.push_back(where + ": duplicate language id");
      continue;
    }
    auto& stored = reg->descriptors_[d.id];
    stored = std::move(d);
  }

  // Index ids first so an alias can never shadow another language's id.
  for (const auto& [id, d] : reg->descriptors_) {
    reg->index_[id] = &d;
  }
  for (const auto& [id, d] : reg->descriptors_) {
    for (const auto& alias : d.aliases) {
      const std::string key = to_lower(alias);
      if (key.empty()) {
        errs.push_back(id + ": empty alias");
        continue;
      }
      auto [it, inserted] = reg->index_.emplace(key, &d);
      if (!inserted && it->second != &d) {
        errs.push_back(id + ": alias \"" + alias + "\" already names " + it->second->id);
      } else if (!inserted) {
        errs.push_back(id + ": alias \"" + alias + "\" repeated");
      }
    }
    reg->probes_.emplace(id, std::make_unique<ProbeSlot>());
  }

  if (errs.size() != errors_before) return nullptr;
  return reg;
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::from_file(const std::string& path,
                                                              std::vector<std::string>* errors) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (errors) errors->push_back("cannot read language catalog: " + path);
    return nullptr;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return from_json(ss.str(), errors);
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::builtin() {
  std::vector<std::string> errors;
  auto reg = from_json(builtin_catalog_json(), &errors);
  for (const auto& e : errors) {
    emit_log(LogLevel::error, "registry", "built-in catalog rejected", {{"error", e}});
  }
  return reg;
}

const ToolchainDescriptor* LanguageRegistry::lookup(const std::string& language) const {
  auto it = index_.find(to_lower(language));
  return it == index_.end() ? nullptr : it->second;
}

const ToolchainStatus& LanguageRegistry::status(const ToolchainDescriptor& descriptor) const {
  ProbeSlot& slot = *probes_.at(descriptor.id);
  std::call_once(slot.once, [&descriptor, &slot] {
    std::vector<std::string> programs;
    if (!descriptor.compile.empty()) programs.push_back(descriptor.compile.front());
    if (!descriptor.run.empty()) programs.push_back(descriptor.run.front());
    bool ok = true;
    for (const auto& program : programs) {
      if (starts_with_placeholder(program) || slot.status.resolved.contains(program)) continue;
      std::string path = resolve_executable(program);
      if (path.empty()) {
        ok = false;
        slot.status.missing.push_back(program);
      } else {
        slot.status.resolved[program] = path;
      }
    }
    slot.status.available = ok;
    emit_log(LogLevel::debug, "registry", "toolchain probed",
             {{"language", descriptor.id}, {"available", ok ? "true" : "false"}});
  });
  return slot.status;
}

bool LanguageRegistry::is_available(const std::string& language) const {
  const ToolchainDescriptor* d = lookup(language);
  return d && status(*d).available;
}

std::string LanguageRegistry::resolve_program(const ToolchainDescriptor& descriptor,
                                              const std::string& program) const {
  if (starts_with_placeholder(program)) return program;
  const auto& st = status(descriptor);
  auto it = st.resolved.find(program);
  return it == st.resolved.end() ? std::string{} : it->second;
}

std::vector<const ToolchainDescriptor*> LanguageRegistry::list() const {
  std::vector<const ToolchainDescriptor*> out;
  out.reserve(descriptors_.size());
  for (const auto& [id, d] : descriptors_) out.push_back(&d);
  return out;
}

std::string LanguageRegistry::to_json() const {
  jsonlite::Array arr;
  for (const auto* d : list()) {
    jsonlite::Object o;
    o["language"] = d->id;
    jsonlite::Array aliases;
    for (const auto& a : d->aliases) aliases.emplace_back(a);
    o["aliases"] = std::move(aliases);
    o["extension"] = d->extension;
    o["compiled"] = d->has_compile_phase();
    o["timeout_ms"] = static_cast<std::uint64_t>(d->timeout_ms);
    o["memory_limit_mb"] = static_cast<std::uint64_t>(d->memory_limit_mb);
    o["max_output_bytes"] = static_cast<std::uint64_t>(d->max_output_bytes);
    const auto& st = status(*d);
    o["available"] = st.available;
    jsonlite::Array missing;
    for (const auto& m : st.missing) missing.emplace_back(m);
    o["missing"] = std::move(missing);
    arr.push_back(jsonlite::Value{std::move(o)});
  }
  return jsonlite::to_json(jsonlite::Value{std::move(arr)});
}

}  // namespace runbox
