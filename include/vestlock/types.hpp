#pragma once

// vestlock/types.hpp - Core data model for the time-locked asset ledger.
//
// DATA MODEL:
//   A LockRecord commits a fixed amount of one asset until its maturity.
//   asset, amount, created_at and duration are immutable after creation;
//   only state moves, and only Active -> Withdrawn.
//
// INVARIANTS:
//   - amount > 0 for every Active lock.
//   - maturity() >= created_at (deposit rejects durations that overflow).
//   - A lock id names at most one lock for the lifetime of a store; retired
//     ids are never handed out again.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. Records are copied out of the store; callers
//   never hold references into store internals.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace vestlock {

using Amount    = std::uint64_t;
using Timestamp = std::uint64_t;  // unix seconds
using Duration  = std::uint64_t;  // seconds
using LockId    = std::string;
using Identity  = std::string;

enum class ErrorCode {
  none,
  duplicate_id,
  not_found,
  unauthorized,
  lock_period_ongoing,
  transfer_failed,
  invalid_amount,
  invalid_duration,
  invalid_argument,
  reentrant_call,
  id_space_exhausted,
  store_io_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// AssetRef - denominating asset of a lock
// ---------------------------------------------------------------------------
// The native chain asset is its own alternative rather than a magic
// reference value. Canonical text: "native" | "token:<reference>".
struct NativeAsset {
  bool operator==(const NativeAsset&) const = default;
};

struct TokenAsset {
  std::string reference;
  bool operator==(const TokenAsset&) const = default;
};

using AssetRef = std::variant<NativeAsset, TokenAsset>;

std::string asset_to_string(const AssetRef& asset);

// Parse the canonical form. Returns nullopt for anything else, including
// "token:" with an empty reference.
std::optional<AssetRef> asset_from_string(const std::string& s);

inline bool is_native(const AssetRef& asset) {
  return std::holds_alternative<NativeAsset>(asset);
}

// ---------------------------------------------------------------------------
// LockRecord
// ---------------------------------------------------------------------------
enum class LockState : std::uint8_t {
  active    = 0,
  withdrawn = 1,
};

std::string to_string(LockState state);

struct LockRecord {
  LockId    id;
  Identity  owner;
  AssetRef  asset{NativeAsset{}};
  Amount    amount{0};
  Timestamp created_at{0};
  Duration  duration{0};
  LockState state{LockState::active};

  Timestamp maturity() const { return created_at + duration; }
};

// Compact single-line JSON, used by the journal and the CLI.
std::string lock_record_to_json(const LockRecord& r);

// Returns false if created_at + duration does not fit in a Timestamp.
bool maturity_fits(Timestamp created_at, Duration duration);

}  // namespace vestlock
