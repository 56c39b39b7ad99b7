#pragma once

// runbox/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Used for the language catalog, engine config files, CLI requests and
// result serialization. Objects are std::map, so to_json() emits keys in
// sorted order and the output is canonical.
//
// Numbers: non-negative integers are stored as uint64_t, everything else
// (negative or fractional) as double. Duplicate object keys are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace runbox::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;    // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse a document whose top level is an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors: return def when the key is absent or mistyped.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);
bool is_null(const Object& obj, const std::string& key);

}  // namespace runbox::jsonlite
