#pragma once

// vestlock/audit.hpp - Append-only, hash-chained audit log of lock transitions.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence.
//   3. CHAINED: each entry stores the BLAKE3 "audit:" digest of the previous
//      line; the first entry links to 64 zeros. verify_audit_chain() detects
//      any edit, removal or reorder.
//   4. Audit write failures never roll back a committed ledger transition.
//      They are counted and reported through failure_count().
//
// A withdraw whose release transfer fails after the record was removed is
// written with severity "critical" so stranded funds are never silent.

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

#include "vestlock/types.hpp"

namespace vestlock {

enum class AuditSeverity {
  info,
  critical,
};

std::string to_string(AuditSeverity s);

struct AuditRecord {
  uint64_t      sequence{0};      // assigned by append()
  std::string   previous_digest;  // assigned by append()
  std::string   operation;        // "deposit" | "withdraw" | "withdraw_transfer_failed" | ...
  LockId        lock_id;
  Identity      actor;
  std::string   asset;
  Amount        amount{0};
  Timestamp     ledger_time{0};
  AuditSeverity severity{AuditSeverity::info};
  std::string   error_code;
  std::string   detail;
};

std::string audit_record_to_json(const AuditRecord& r);

class ImmutableAuditLog {
 public:
  // path: file to append to, created if absent. Empty path disables the log;
  // append() then succeeds without writing. An existing log whose last entry
  // cannot be parsed is not opened: enabled() is false, open_error() says why
  // and append() fails.
  explicit ImmutableAuditLog(std::string path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence and previous_digest in place. Returns false (and writes
  // nothing) on I/O failure. Never throws.
  bool append(AuditRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  bool enabled() const { return file_ != nullptr; }
  const std::string& open_error() const { return open_error_; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  FILE* file_{nullptr};
  mutable std::mutex mu_;
  uint64_t seq_{0};
  uint64_t entry_count_{0};
  uint64_t failure_count_{0};
  std::string last_digest_;
  std::string open_error_;
};

struct AuditVerifyResult {
  bool        ok{false};
  uint64_t    entries{0};
  uint64_t    first_bad_sequence{0};  // 0 if ok
  std::string error;

  std::string to_json() const;
};

// Re-walk the chain in path from the first line.
AuditVerifyResult verify_audit_chain(const std::string& path);

}  // namespace vestlock
