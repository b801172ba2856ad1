#pragma once

// vestlock/ledger.hpp - Lock lifecycle manager: deposit, withdraw, queries.
//
// STATE MACHINE:
//   (none) --deposit--> Active --withdraw--> Withdrawn (record removed)
//   Nothing re-enters Active; a withdrawn id is retired by the store.
//
// ORDERING (custody/record atomicity):
//   deposit:  validate -> propose id -> transfer_in -> propose again ->
//             store.create -> commit id
//             A failed create refunds the deposit before returning, so the
//             ledger never holds custody without a record. The deriver is
//             only committed after create, so a failed deposit consumes no id.
//   withdraw: checks -> store.remove -> transfer_out
//             The record is gone before the asset moves. A transfer hook that
//             re-enters withdraw() for the same id sees not_found. A failed
//             release is NOT rolled back: the record stays removed, the
//             result carries transfer_failed + funds_stranded, the amount is
//             booked as stranded custody, and a critical audit entry is written.
//
// RE-ENTRANCY:
//   Lifecycle calls are serialized per ledger. With the guard enabled
//   (default) a nested deposit/withdraw from inside a transfer callback fails
//   with reentrant_call and changes nothing. With it disabled, the ordering
//   above still keeps nested calls consistent. Queries are never rejected.
//
// ERRORS:
//   Every failure is reported synchronously in the result and nothing is
//   retried. Apart from the stranded-release case, a failed call changes no
//   ledger state.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vestlock/audit.hpp"
#include "vestlock/collaborators.hpp"
#include "vestlock/config.hpp"
#include "vestlock/id_deriver.hpp"
#include "vestlock/lock_store.hpp"
#include "vestlock/observability.hpp"
#include "vestlock/types.hpp"

namespace vestlock {

struct DepositResult {
  bool        ok{false};
  ErrorCode   error{ErrorCode::none};
  LockId      id;                   // set if ok
  Timestamp   created_at{0};
  Timestamp   maturity{0};
  bool        funds_stranded{false};  // refund after a failed create also failed
  std::string detail;

  std::string to_json() const;
};

struct WithdrawResult {
  bool        ok{false};
  ErrorCode   error{ErrorCode::none};
  LockId      id;
  Amount      amount{0};            // released to the caller if ok
  bool        funds_stranded{false};  // record removed, release failed
  std::string detail;

  std::string to_json() const;
};

struct AssetSolvency {
  std::string asset;
  Amount      locked{0};     // sum of Active amounts
  Amount      releasing{0};  // removed from the store, transfer_out in progress
  Amount      custodied{0};  // held by the ledger
  Amount      stranded{0};   // held with no record (failed release/refund)
  bool        balanced{false};
};

struct SolvencyReport {
  bool ok{true};
  std::vector<AssetSolvency> assets;

  std::string to_json() const;
};

struct LedgerOptions {
  bool        reentrancy_guard{true};
  std::string event_log_path;
};

class LockLedger {
 public:
  // transfer and clock are borrowed and must outlive the ledger. Custody is
  // seeded from the records already in store.
  LockLedger(std::unique_ptr<ILockStore> store,
             std::unique_ptr<IIdDeriver> deriver,
             IAssetTransfer& transfer,
             const IClock& clock,
             LedgerOptions options = {});

  LockLedger(const LockLedger&) = delete;
  LockLedger& operator=(const LockLedger&) = delete;

  // When set, withdraw authorizes against registry->owner_of(id) instead of
  // the stored owner. Borrowed.
  void set_ownership_registry(const IOwnershipRegistry* registry);

  void set_audit_log(std::shared_ptr<ImmutableAuditLog> audit);

  DepositResult deposit(const Identity& caller, const AssetRef& asset,
                        Amount amount, Duration duration);

  WithdrawResult withdraw(const Identity& caller, const LockId& id);

  // Queries. nullopt means no live lock has this id; it is never conflated
  // with a lock that matures at epoch 0.
  std::optional<AssetRef>   get_asset(const LockId& id) const;
  std::optional<Amount>     get_balance(const LockId& id) const;
  std::optional<Amount>     get_balance_at(const LockId& id, Timestamp now) const;
  std::optional<Timestamp>  get_maturity(const LockId& id) const;
  std::optional<LockRecord> get_lock(const LockId& id) const;
  // Locks the given identity may withdraw: registry holder when a registry
  // is set, stored owner otherwise.
  std::vector<LockRecord>   locks_of(const Identity& owner) const;

  Amount custodied(const AssetRef& asset) const;
  Amount stranded(const AssetRef& asset) const;

  // Per asset: locked + releasing == custodied - stranded. Consistent with
  // respect to lifecycle calls on other threads, and also when called from
  // inside a transfer hook mid-withdraw.
  SolvencyReport verify_solvency() const;

  const LedgerStats& stats() const { return stats_; }
  const ILockStore& store() const { return *store_; }
  IdScheme id_scheme() const { return deriver_->scheme(); }

 private:
  DepositResult deposit_locked(const Identity& caller, const AssetRef& asset,
                               Amount amount, Duration duration, LedgerEvent& ev);
  WithdrawResult withdraw_locked(const Identity& caller, const LockId& id, LedgerEvent& ev);
  bool authorized(const Identity& caller, const LockRecord& record) const;
  void audit(AuditRecord record);
  void finish(const LedgerEvent& ev);

  std::unique_ptr<ILockStore> store_;
  std::unique_ptr<IIdDeriver> deriver_;
  IAssetTransfer& transfer_;
  const IClock& clock_;
  LedgerOptions options_;
  const IOwnershipRegistry* registry_{nullptr};
  std::shared_ptr<ImmutableAuditLog> audit_;

  // Serializes lifecycle calls and the cross-record queries; recursive so a
  // nested call on the same thread reaches the guard check instead of
  // deadlocking.
  mutable std::recursive_mutex op_mu_;
  int depth_{0};

  mutable std::mutex book_mu_;
  std::map<std::string, Amount> custody_;
  std::map<std::string, Amount> stranded_;
  std::map<std::string, Amount> releasing_;

  LedgerStats stats_;
};

// ---------------------------------------------------------------------------
// open_ledger - build a ledger from configuration
// ---------------------------------------------------------------------------
// Journal store when store_path is set (replayed before returning), memory
// store otherwise; audit log when audit_log_path is set.
struct LedgerOpenResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string description;
  std::unique_ptr<LockLedger> ledger;
};

LedgerOpenResult open_ledger(const LedgerConfig& config, IAssetTransfer& transfer,
                             const IClock& clock);

}  // namespace vestlock
