#pragma once

// vestlock/valuation.hpp - Linear vesting value and maturity of a lock.
//
// Pure functions: no side effects, deterministic for a given (record, now),
// callable at any time including long after maturity.
//
//   now >= maturity     -> amount
//   duration == 0       -> amount (matured at creation)
//   now <= created_at   -> 0
//   otherwise           -> floor(amount * (now - created_at) / duration)
//
// The product is computed in 128 bits, so every uint64 amount and duration
// is exact. The result never exceeds amount and never rounds up.

#include "vestlock/types.hpp"

namespace vestlock {

Amount vested_value(const LockRecord& record, Timestamp now);

// Absolute unlock time of a lock.
inline Timestamp maturity_of(const LockRecord& record) { return record.maturity(); }

inline bool is_matured(const LockRecord& record, Timestamp now) {
  return now >= record.maturity();
}

}  // namespace vestlock
