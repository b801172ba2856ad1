#pragma once

// vestlock/collaborators.hpp - External collaborators of the lock ledger.
//
//   IAssetTransfer     - moves an asset between a holder and ledger custody.
//                        The ledger only looks at the returned status.
//   IOwnershipRegistry - owner of a lock wrapped as a transferable position.
//   IClock             - source of "now" in unix seconds.
//
// Implementations are borrowed by the ledger and must outlive it.
// IAssetTransfer implementations may call back into the ledger (a token
// with transfer hooks); the ledger is written to stay consistent when they do.

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "vestlock/types.hpp"

namespace vestlock {

struct TransferStatus {
  bool ok{false};
  std::string reason;  // non-empty if !ok

  static TransferStatus success() { return TransferStatus{true, {}}; }
  static TransferStatus failure(std::string why) { return TransferStatus{false, std::move(why)}; }
};

class IAssetTransfer {
 public:
  virtual ~IAssetTransfer() = default;

  // Move amount of asset from holder into ledger custody.
  virtual TransferStatus transfer_in(const Identity& from, const AssetRef& asset, Amount amount) = 0;

  // Release amount of asset from ledger custody to holder.
  virtual TransferStatus transfer_out(const Identity& to, const AssetRef& asset, Amount amount) = 0;
};

class IOwnershipRegistry {
 public:
  virtual ~IOwnershipRegistry() = default;

  // Current holder of the position wrapping lock id, or nullopt if none.
  virtual std::optional<Identity> owner_of(const LockId& id) const = 0;
};

class IClock {
 public:
  virtual ~IClock() = default;
  virtual Timestamp now() const = 0;
};

// Wall clock, unix seconds.
class SystemClock : public IClock {
 public:
  Timestamp now() const override;
};

// Settable clock for tests and offline evaluation.
class ManualClock : public IClock {
 public:
  explicit ManualClock(Timestamp start = 0) : now_(start) {}
  Timestamp now() const override { return now_.load(std::memory_order_acquire); }
  void set(Timestamp t) { now_.store(t, std::memory_order_release); }
  void advance(Duration d) { now_.fetch_add(d, std::memory_order_acq_rel); }

 private:
  std::atomic<Timestamp> now_;
};

// ---------------------------------------------------------------------------
// BalanceBook - in-process asset ledger implementing IAssetTransfer
// ---------------------------------------------------------------------------
// Holds per-(holder, asset) balances plus one custody balance per asset.
// transfer_in fails with "insufficient balance" rather than going negative.
// Thread-safe.
class BalanceBook : public IAssetTransfer {
 public:
  void credit(const Identity& holder, const AssetRef& asset, Amount amount);
  Amount balance_of(const Identity& holder, const AssetRef& asset) const;
  Amount custody_of(const AssetRef& asset) const;

  TransferStatus transfer_in(const Identity& from, const AssetRef& asset, Amount amount) override;
  TransferStatus transfer_out(const Identity& to, const AssetRef& asset, Amount amount) override;

 private:
  mutable std::mutex mu_;
  std::map<std::pair<Identity, std::string>, Amount> balances_;
  std::map<std::string, Amount> custody_;
};

}  // namespace vestlock
