#pragma once

// vestlock/observability.hpp - Ledger events, counters and the event sink.
//
// DESIGN:
//   LedgerEvent is the observable unit: one per deposit/withdraw call,
//   successful or not. Each event is:
//     - recorded into the owning ledger's LedgerStats (always),
//     - passed to a process-wide hook if one is registered, else
//     - appended as one JSON line to the event log, when a path is configured
//       (LedgerConfig::event_log_path or VESTLOCK_EVENT_LOG).
//
// INVARIANT: event emission never changes ledger state and never fails the
// operation that produced it. Sink write errors are counted, not raised.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "vestlock/types.hpp"

namespace vestlock {

enum class LedgerOp {
  deposit,
  withdraw,
};

std::string to_string(LedgerOp op);

struct LedgerEvent {
  LedgerOp    op{LedgerOp::deposit};
  LockId      lock_id;
  Identity    caller;
  std::string asset;
  Amount      amount{0};
  Timestamp   at{0};              // ledger clock at entry
  bool        ok{false};
  ErrorCode   error{ErrorCode::none};
  bool        funds_stranded{false};
  uint64_t    duration_ns{0};
};

std::string ledger_event_to_json(const LedgerEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) us; bucket 0 covers [0, 1) us.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
};

// ---------------------------------------------------------------------------
// LedgerStats - per-ledger counters
// ---------------------------------------------------------------------------
class LedgerStats {
 public:
  void record(const LedgerEvent& ev);
  void record_sink_failure() { sink_failures.fetch_add(1, std::memory_order_relaxed); }

  uint64_t failures_for(ErrorCode code) const;
  std::string to_json() const;

  std::atomic<uint64_t> deposits_ok{0};
  std::atomic<uint64_t> withdrawals_ok{0};
  std::atomic<uint64_t> failed_operations{0};
  std::atomic<uint64_t> stranded_transfers{0};
  std::atomic<uint64_t> sink_failures{0};

  LatencyHistogram latency;

 private:
  mutable std::mutex failure_mu_;
  std::map<ErrorCode, uint64_t> failures_by_code_;
};

// Process-wide hook; replaces the JSONL sink while registered.
using LedgerEventHook = void (*)(const LedgerEvent&);
void set_ledger_event_hook(LedgerEventHook hook);

// Deliver ev to the hook or append it to log_path (empty: VESTLOCK_EVENT_LOG,
// unset: dropped). Returns false only on a sink write failure.
bool emit_ledger_event(const LedgerEvent& ev, const std::string& log_path);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace vestlock
