#pragma once

// runbox/version.hpp: Version constants for every serialized surface.
//
// INVARIANT:
//   All version constants are compile-time. A language catalog or result
//   consumer that sees a different version must fail fast instead of guessing.
//
// EXTENSION_POINT: catalog_migration
//   Current: a catalog whose config_version differs from
//   LANGUAGE_CATALOG_VERSION is rejected at load time.
//   Upgrade path: accept version N-1 and upgrade descriptors in memory.

#include <cstdint>
#include <string>

namespace runbox {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// RESULT_SCHEMA_VERSION
// Tracks the JSON shape emitted by result_to_json(). Renaming or removing a
// field requires a bump; adding optional fields does not.
// ---------------------------------------------------------------------------
constexpr uint32_t RESULT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// LANGUAGE_CATALOG_VERSION
// The "config_version" a language catalog file must declare.
// ---------------------------------------------------------------------------
constexpr uint32_t LANGUAGE_CATALOG_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded, "req:"/"out:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t result_schema{RESULT_SCHEMA_VERSION};
  uint32_t language_catalog{LANGUAGE_CATALOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Never throws.
CompatibilityResult check_catalog_version(const std::string& declared);

}  // namespace version
}  // namespace runbox
