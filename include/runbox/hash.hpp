#pragma once

#include <string>
#include <string_view>

namespace runbox {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// BLAKE3-256, lowercase hex.
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Prefixes are part of the digest contract:
//   "req:" canonical request JSON
//   "out:" raw guest stdout/stderr bytes
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string request_digest(std::string_view canonical_request_json);
std::string output_digest(std::string_view raw_bytes);

}  // namespace runbox
