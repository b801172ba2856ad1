#pragma once

// vestlock/version.hpp - Version manifest for every persisted format.
//
// Every component that writes a versioned format stamps its constant from
// here; every reader checks it before trusting the data.

#include <cstdint>
#include <string>

namespace vestlock {
namespace version {

// ---------------------------------------------------------------------------
// STORE_FORMAT_VERSION
// Journal line layout of JournalLockStore. Version 1 = {"v","op",...} lines
// with create/remove/retire operations. Replay rejects any other value.
// ---------------------------------------------------------------------------
constexpr uint32_t STORE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// ID_SCHEME_VERSION
// Content-derived id layout: BLAKE3("lock:" + owner|asset|amount|maturity|nonce).
// Any change to the tuple or the domain prefix requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t ID_SCHEME_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Audit NDJSON entry layout including the "prev" chain link.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// Version 1 = BLAKE3-256, hex encoded.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

constexpr const char* LEDGER_SEMVER = "0.3.0";

struct VersionManifest {
  uint32_t store_format{STORE_FORMAT_VERSION};
  uint32_t id_scheme{ID_SCHEME_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string ledger_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace vestlock
