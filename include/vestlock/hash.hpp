#pragma once

// vestlock/hash.hpp - BLAKE3 hashing for lock identifiers and the audit chain.
//
// Domain separation: "lock:" for content-derived lock ids, "audit:" for audit
// chain links. The prefixes are part of the id scheme contract; changing one
// changes every content-derived id and requires an ID_SCHEME_VERSION bump.

#include <string>
#include <string_view>

namespace vestlock {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

std::string hash_domain(std::string_view domain, std::string_view payload);
std::string lock_id_hash(std::string_view canonical_tuple);
std::string audit_link_hash(std::string_view canonical_entry);

// True for a 64-char lowercase hex string.
bool is_hex_digest(std::string_view s);

}  // namespace vestlock
