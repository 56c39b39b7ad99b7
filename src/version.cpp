#include "runbox/version.hpp"

#include <sstream>

namespace runbox {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = ENGINE_SEMVER;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"result_schema\":" << m.result_schema
    << ",\"language_catalog\":" << m.language_catalog
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_catalog_version(const std::string& declared) {
  CompatibilityResult r;
  if (declared != std::to_string(LANGUAGE_CATALOG_VERSION)) {
    r.ok          = false;
    r.error_code  = "config_invalid";
    r.description = "language catalog config_version \"" + declared +
                    "\" != supported version " + std::to_string(LANGUAGE_CATALOG_VERSION);
  }
  return r;
}

}  // namespace version
}  // namespace runbox
