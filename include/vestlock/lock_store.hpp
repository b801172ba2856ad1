#pragma once

// vestlock/lock_store.hpp - Lock Record Store interface and backends.
//
// DESIGN INVARIANTS (every backend):
//   1. create() never overwrites: an id that is live OR retired fails with
//      duplicate_id. Ids are never reused after removal.
//   2. After remove() returns none, get() reports nullopt for that id. No
//      tombstone is ever readable as a live lock.
//   3. Reads reflect the latest completed write (no stale-read window).
//   4. A failed write leaves the observable state unchanged.
//
// EXTENSION_POINT: replicated_store
//   Current: process-local map, optionally backed by an NDJSON journal.
//   Upgrade path: a backend that commits journal lines to a replicated log
//   before acknowledging. Invariant 1 must then be checked against the
//   replicated retired set, not a local cache.

#include <cstddef>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "vestlock/types.hpp"

namespace vestlock {

// ---------------------------------------------------------------------------
// ILockStore - abstract record store
// ---------------------------------------------------------------------------
// Thread-safety: all implementations must be safe for concurrent calls.
class ILockStore {
public:
  virtual ~ILockStore() = default;

  // Insert a new Active record under id. Returns duplicate_id if the id is
  // live or retired, store_io_failed if the backend could not persist it.
  virtual ErrorCode create(const LockId &id, const LockRecord &record) = 0;

  // Live record for id, or nullopt.
  virtual std::optional<LockRecord> get(const LockId &id) const = 0;

  // Remove a live record and retire its id. Returns not_found if absent.
  virtual ErrorCode remove(const LockId &id) = 0;

  virtual bool contains(const LockId &id) const = 0;

  // True if the id was ever created in this store, live or retired.
  virtual bool ever_issued(const LockId &id) const = 0;

  // All live records, ordered by id.
  virtual std::vector<LockRecord> list_active() const = 0;

  // Number of live records.
  virtual std::size_t size() const = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryLockStore - ordered in-memory map
// ---------------------------------------------------------------------------
class MemoryLockStore : public ILockStore {
public:
  ErrorCode create(const LockId &id, const LockRecord &record) override;
  std::optional<LockRecord> get(const LockId &id) const override;
  ErrorCode remove(const LockId &id) override;
  bool contains(const LockId &id) const override;
  bool ever_issued(const LockId &id) const override;
  std::vector<LockRecord> list_active() const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "memory"; }

private:
  mutable std::mutex mu_;
  std::map<LockId, LockRecord> live_;
  std::set<LockId> retired_;
};

// ---------------------------------------------------------------------------
// JournalLockStore - durable NDJSON journal
// ---------------------------------------------------------------------------
// Layout: one JSON object per line, appended and flushed per mutation.
//   {"v":1,"op":"create","id":..,"owner":..,"asset":..,"amount":..,
//    "created_at":..,"duration":..}
//   {"v":1,"op":"remove","id":..}
//   {"v":1,"op":"retire","id":..}       (written by compact() only)
//
// The in-memory index is authoritative for reads; the journal is replayed
// into it by open(). A journal write happens before the index is updated,
// so a failed append leaves both unchanged: a partially written line is
// truncated away before the call returns. If that truncation itself fails
// the store refuses every later write with store_io_failed.
//
// EXTENSION_POINT: fsync_policy
//   Current: fflush() per line; the page cache may still lose the tail on
//   power failure. Upgrade: fsync() per line or group commit.
class JournalLockStore : public ILockStore {
public:
  explicit JournalLockStore(std::string path);
  ~JournalLockStore() override;

  JournalLockStore(const JournalLockStore &) = delete;
  JournalLockStore &operator=(const JournalLockStore &) = delete;

  // Replay the journal and open it for append. A missing journal is created
  // unless create_if_missing is false, in which case open() fails.
  // Returns store_io_failed on missing/unreadable/malformed/unknown-version
  // input; *detail receives the reason and line number.
  ErrorCode open(std::string *detail = nullptr, bool create_if_missing = true);

  ErrorCode create(const LockId &id, const LockRecord &record) override;
  std::optional<LockRecord> get(const LockId &id) const override;
  ErrorCode remove(const LockId &id) override;
  bool contains(const LockId &id) const override;
  bool ever_issued(const LockId &id) const override;
  std::vector<LockRecord> list_active() const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "journal"; }

  // Rewrite the journal as live creates plus retire tombstones, via
  // tmp + rename. Returns store_io_failed and keeps the old journal on error.
  ErrorCode compact();

  const std::string &path() const { return path_; }

private:
  bool append_line(const std::string &line);

  std::string path_;
  FILE *file_{nullptr};
  mutable std::mutex mu_;
  std::map<LockId, LockRecord> live_;
  std::set<LockId> retired_;
};

}  // namespace vestlock
