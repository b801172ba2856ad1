#include "vestlock/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "vestlock/jsonlite.hpp"

namespace vestlock {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<LedgerEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(LedgerOp op) {
  switch (op) {
    case LedgerOp::deposit:  return "deposit";
    case LedgerOp::withdraw: return "withdraw";
  }
  return "deposit";
}

std::string ledger_event_to_json(const LedgerEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"op\":\"";
  line += to_string(ev.op);
  line += "\",\"lock_id\":\"";
  line += jsonlite::escape(ev.lock_id);
  line += "\",\"caller\":\"";
  line += jsonlite::escape(ev.caller);
  line += "\",\"asset\":\"";
  line += jsonlite::escape(ev.asset);
  line += "\",\"amount\":";
  line += std::to_string(ev.amount);
  line += ",\"at\":";
  line += std::to_string(ev.at);
  line += ",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += to_string(ev.error);
  line += "\",\"funds_stranded\":";
  line += ev.funds_stranded ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const size_t b = bucket_for_us(duration_ns / 1000u);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  char buf[32];
  std::string out = "{\"count\":" + std::to_string(count());
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += ",\"p50_us\":";
  out += buf;
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += ",\"p99_us\":";
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// LedgerStats
// ---------------------------------------------------------------------------

void LedgerStats::record(const LedgerEvent& ev) {
  latency.record(ev.duration_ns);
  if (ev.funds_stranded) stranded_transfers.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    if (ev.op == LedgerOp::deposit) {
      deposits_ok.fetch_add(1, std::memory_order_relaxed);
    } else {
      withdrawals_ok.fetch_add(1, std::memory_order_relaxed);
    }
    return;
  }
  failed_operations.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_by_code_[ev.error];
}

uint64_t LedgerStats::failures_for(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  auto it = failures_by_code_.find(code);
  return it == failures_by_code_.end() ? 0 : it->second;
}

std::string LedgerStats::to_json() const {
  std::ostringstream o;
  o << "{\"deposits_ok\":" << deposits_ok.load(std::memory_order_relaxed)
    << ",\"withdrawals_ok\":" << withdrawals_ok.load(std::memory_order_relaxed)
    << ",\"failed_operations\":" << failed_operations.load(std::memory_order_relaxed)
    << ",\"stranded_transfers\":" << stranded_transfers.load(std::memory_order_relaxed)
    << ",\"sink_failures\":" << sink_failures.load(std::memory_order_relaxed)
    << ",\"failures\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [code, count] : failures_by_code_) {
      if (!first) o << ",";
      first = false;
      o << "\"" << to_string(code) << "\":" << count;
    }
  }
  o << "},\"latency\":" << latency.to_json() << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Event sink
// ---------------------------------------------------------------------------

void set_ledger_event_hook(LedgerEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

bool emit_ledger_event(const LedgerEvent& ev, const std::string& log_path) {
  LedgerEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return true;
  }

  std::string path = log_path;
  if (path.empty()) {
    const char* env = std::getenv("VESTLOCK_EVENT_LOG");
    if (env && env[0]) path = env;
  }
  if (path.empty()) return true;

  const std::string line = ledger_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF do not interleave across processes.
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  return std::fclose(f) == 0 && written;
}

}  // namespace vestlock
