#include "vestlock/ledger.hpp"

#include <set>
#include <sstream>

#include "vestlock/jsonlite.hpp"
#include "vestlock/valuation.hpp"

namespace vestlock {

namespace {

struct DepthGuard {
  int& depth;
  explicit DepthGuard(int& d) : depth(d) { ++depth; }
  ~DepthGuard() { --depth; }
};

Amount lookup(const std::map<std::string, Amount>& book, const std::string& key) {
  auto it = book.find(key);
  return it == book.end() ? 0 : it->second;
}

}  // namespace

// ---------------------------------------------------------------------------
// Result serialization
// ---------------------------------------------------------------------------

std::string DepositResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << to_string(error) << "\""
    << ",\"id\":\"" << jsonlite::escape(id) << "\""
    << ",\"created_at\":" << created_at
    << ",\"maturity\":" << maturity
    << ",\"funds_stranded\":" << (funds_stranded ? "true" : "false")
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
  return o.str();
}

std::string WithdrawResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << to_string(error) << "\""
    << ",\"id\":\"" << jsonlite::escape(id) << "\""
    << ",\"amount\":" << amount
    << ",\"funds_stranded\":" << (funds_stranded ? "true" : "false")
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
  return o.str();
}

std::string SolvencyReport::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false") << ",\"assets\":[";
  bool first = true;
  for (const auto& a : assets) {
    if (!first) o << ",";
    first = false;
    o << "{\"asset\":\"" << jsonlite::escape(a.asset) << "\""
      << ",\"locked\":" << a.locked
      << ",\"releasing\":" << a.releasing
      << ",\"custodied\":" << a.custodied
      << ",\"stranded\":" << a.stranded
      << ",\"balanced\":" << (a.balanced ? "true" : "false") << "}";
  }
  o << "]}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LockLedger
// ---------------------------------------------------------------------------

LockLedger::LockLedger(std::unique_ptr<ILockStore> store,
                       std::unique_ptr<IIdDeriver> deriver,
                       IAssetTransfer& transfer,
                       const IClock& clock,
                       LedgerOptions options)
    : store_(std::move(store)),
      deriver_(std::move(deriver)),
      transfer_(transfer),
      clock_(clock),
      options_(std::move(options)) {
  for (const auto& rec : store_->list_active()) {
    custody_[asset_to_string(rec.asset)] += rec.amount;
  }
}

void LockLedger::set_ownership_registry(const IOwnershipRegistry* registry) {
  std::lock_guard<std::recursive_mutex> lk(op_mu_);
  registry_ = registry;
}

void LockLedger::set_audit_log(std::shared_ptr<ImmutableAuditLog> audit) {
  std::lock_guard<std::recursive_mutex> lk(op_mu_);
  audit_ = std::move(audit);
}

DepositResult LockLedger::deposit(const Identity& caller, const AssetRef& asset,
                                  Amount amount, Duration duration) {
  LedgerEvent ev;
  ev.op = LedgerOp::deposit;
  ev.caller = caller;
  ev.asset = asset_to_string(asset);
  ev.amount = amount;

  DepositResult r;
  {
    ScopeTimer timer(ev.duration_ns);
    std::lock_guard<std::recursive_mutex> lk(op_mu_);
    ev.at = clock_.now();
    if (options_.reentrancy_guard && depth_ > 0) {
      r.error = ErrorCode::reentrant_call;
      r.detail = "deposit entered while another ledger operation is in flight";
    } else {
      DepthGuard guard(depth_);
      r = deposit_locked(caller, asset, amount, duration, ev);
    }
  }

  ev.ok = r.ok;
  ev.error = r.error;
  ev.lock_id = r.id;
  ev.funds_stranded = r.funds_stranded;
  finish(ev);
  return r;
}

DepositResult LockLedger::deposit_locked(const Identity& caller, const AssetRef& asset,
                                         Amount amount, Duration duration, LedgerEvent& ev) {
  DepositResult r;
  if (caller.empty()) {
    r.error = ErrorCode::invalid_argument;
    r.detail = "caller identity is empty";
    return r;
  }
  if (const auto* token = std::get_if<TokenAsset>(&asset); token && token->reference.empty()) {
    r.error = ErrorCode::invalid_argument;
    r.detail = "token asset reference is empty";
    return r;
  }
  if (amount == 0) {
    r.error = ErrorCode::invalid_amount;
    r.detail = "amount must be greater than zero";
    return r;
  }
  const Timestamp now = ev.at;
  if (!maturity_fits(now, duration)) {
    r.error = ErrorCode::invalid_duration;
    r.detail = "creation time + duration overflows";
    return r;
  }

  LockRecord record;
  record.owner = caller;
  record.asset = asset;
  record.amount = amount;
  record.created_at = now;
  record.duration = duration;
  record.state = LockState::active;

  // The deriver only advances once the record exists, so a failed deposit
  // consumes no id.
  const LockSeed seed{caller, asset, amount, record.maturity()};
  if (!deriver_->propose(seed, *store_)) {
    r.error = ErrorCode::id_space_exhausted;
    r.detail = "no unused " + to_string(deriver_->scheme()) + " id available";
    return r;
  }

  const TransferStatus in = transfer_.transfer_in(caller, asset, amount);
  if (!in.ok) {
    r.error = ErrorCode::transfer_failed;
    r.detail = "transfer_in failed: " + in.reason;
    return r;
  }

  // Re-derive: a transfer hook may have created locks in the meantime.
  const auto proposal = deriver_->propose(seed, *store_);
  ErrorCode created = ErrorCode::id_space_exhausted;
  if (proposal) {
    record.id = proposal->id;
    ev.lock_id = proposal->id;
    created = store_->create(record.id, record);
  }
  if (created != ErrorCode::none) {
    // Custody without a record is not allowed; hand the deposit back.
    const TransferStatus refund = transfer_.transfer_out(caller, asset, amount);
    if (refund.ok) {
      r.error = created;
      r.detail = "record create failed (" + to_string(created) + "); deposit refunded";
      return r;
    }
    {
      std::lock_guard<std::mutex> lk(book_mu_);
      custody_[ev.asset] += amount;
      stranded_[ev.asset] += amount;
    }
    r.error = ErrorCode::transfer_failed;
    r.funds_stranded = true;
    r.detail = "record create failed (" + to_string(created) +
               ") and refund failed: " + refund.reason;
    AuditRecord a;
    a.operation = "deposit_refund_failed";
    a.lock_id = record.id;
    a.actor = caller;
    a.asset = ev.asset;
    a.amount = amount;
    a.ledger_time = now;
    a.severity = AuditSeverity::critical;
    a.error_code = to_string(r.error);
    a.detail = r.detail;
    audit(std::move(a));
    return r;
  }

  deriver_->commit(seed, *proposal);
  {
    std::lock_guard<std::mutex> lk(book_mu_);
    custody_[ev.asset] += amount;
  }

  r.ok = true;
  r.id = record.id;
  r.created_at = record.created_at;
  r.maturity = record.maturity();

  AuditRecord a;
  a.operation = "deposit";
  a.lock_id = record.id;
  a.actor = caller;
  a.asset = ev.asset;
  a.amount = amount;
  a.ledger_time = now;
  audit(std::move(a));
  return r;
}

WithdrawResult LockLedger::withdraw(const Identity& caller, const LockId& id) {
  LedgerEvent ev;
  ev.op = LedgerOp::withdraw;
  ev.caller = caller;
  ev.lock_id = id;

  WithdrawResult r;
  {
    ScopeTimer timer(ev.duration_ns);
    std::lock_guard<std::recursive_mutex> lk(op_mu_);
    ev.at = clock_.now();
    if (options_.reentrancy_guard && depth_ > 0) {
      r.id = id;
      r.error = ErrorCode::reentrant_call;
      r.detail = "withdraw entered while another ledger operation is in flight";
    } else {
      DepthGuard guard(depth_);
      r = withdraw_locked(caller, id, ev);
    }
  }

  ev.ok = r.ok;
  ev.error = r.error;
  ev.funds_stranded = r.funds_stranded;
  finish(ev);
  return r;
}

WithdrawResult LockLedger::withdraw_locked(const Identity& caller, const LockId& id,
                                           LedgerEvent& ev) {
  WithdrawResult r;
  r.id = id;

  const auto record = store_->get(id);
  if (!record) {
    r.error = ErrorCode::not_found;
    r.detail = "no active lock with id " + id;
    return r;
  }
  ev.asset = asset_to_string(record->asset);
  ev.amount = record->amount;

  if (!authorized(caller, *record)) {
    r.error = ErrorCode::unauthorized;
    r.detail = "caller is not the owner of lock " + id;
    return r;
  }
  const Timestamp now = ev.at;
  if (!is_matured(*record, now)) {
    r.error = ErrorCode::lock_period_ongoing;
    r.detail = "lock matures at " + std::to_string(record->maturity()) +
               ", now " + std::to_string(now);
    return r;
  }

  // Effect before interaction: the lock is gone before any asset moves.
  const ErrorCode removed = store_->remove(id);
  if (removed != ErrorCode::none) {
    r.error = removed;
    r.detail = "record remove failed";
    return r;
  }
  {
    std::lock_guard<std::mutex> lk(book_mu_);
    releasing_[ev.asset] += record->amount;
  }

  const TransferStatus out = transfer_.transfer_out(caller, record->asset, record->amount);
  AuditRecord a;
  a.lock_id = id;
  a.actor = caller;
  a.asset = ev.asset;
  a.amount = record->amount;
  a.ledger_time = now;

  if (!out.ok) {
    {
      std::lock_guard<std::mutex> lk(book_mu_);
      releasing_[ev.asset] -= record->amount;
      stranded_[ev.asset] += record->amount;
    }
    r.error = ErrorCode::transfer_failed;
    r.funds_stranded = true;
    r.detail = "lock " + id + " withdrawn but release failed: " + out.reason;
    a.operation = "withdraw_transfer_failed";
    a.severity = AuditSeverity::critical;
    a.error_code = to_string(r.error);
    a.detail = r.detail;
    audit(std::move(a));
    return r;
  }

  {
    std::lock_guard<std::mutex> lk(book_mu_);
    releasing_[ev.asset] -= record->amount;
    custody_[ev.asset] -= record->amount;
  }
  r.ok = true;
  r.amount = record->amount;
  a.operation = "withdraw";
  audit(std::move(a));
  return r;
}

bool LockLedger::authorized(const Identity& caller, const LockRecord& record) const {
  if (registry_) {
    const auto holder = registry_->owner_of(record.id);
    return holder && *holder == caller;
  }
  return caller == record.owner;
}

void LockLedger::audit(AuditRecord record) {
  if (!audit_) return;
  // Failures are counted by the log; the committed transition stands.
  (void)audit_->append(record);
}

void LockLedger::finish(const LedgerEvent& ev) {
  stats_.record(ev);
  if (!emit_ledger_event(ev, options_.event_log_path)) {
    stats_.record_sink_failure();
  }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<AssetRef> LockLedger::get_asset(const LockId& id) const {
  auto rec = store_->get(id);
  if (!rec) return std::nullopt;
  return rec->asset;
}

std::optional<Amount> LockLedger::get_balance(const LockId& id) const {
  return get_balance_at(id, clock_.now());
}

std::optional<Amount> LockLedger::get_balance_at(const LockId& id, Timestamp now) const {
  auto rec = store_->get(id);
  if (!rec) return std::nullopt;
  return vested_value(*rec, now);
}

std::optional<Timestamp> LockLedger::get_maturity(const LockId& id) const {
  auto rec = store_->get(id);
  if (!rec) return std::nullopt;
  return maturity_of(*rec);
}

std::optional<LockRecord> LockLedger::get_lock(const LockId& id) const {
  return store_->get(id);
}

std::vector<LockRecord> LockLedger::locks_of(const Identity& owner) const {
  std::lock_guard<std::recursive_mutex> lk(op_mu_);
  std::vector<LockRecord> out;
  for (auto& rec : store_->list_active()) {
    if (authorized(owner, rec)) out.push_back(std::move(rec));
  }
  return out;
}

Amount LockLedger::custodied(const AssetRef& asset) const {
  std::lock_guard<std::mutex> lk(book_mu_);
  return lookup(custody_, asset_to_string(asset));
}

Amount LockLedger::stranded(const AssetRef& asset) const {
  std::lock_guard<std::mutex> lk(book_mu_);
  return lookup(stranded_, asset_to_string(asset));
}

SolvencyReport LockLedger::verify_solvency() const {
  // Other threads' lifecycle calls are excluded by op_mu_. A same-thread call
  // from a transfer hook sees an in-flight release through releasing_.
  std::lock_guard<std::recursive_mutex> op_lk(op_mu_);
  using Wide = unsigned __int128;
  std::map<std::string, Wide> locked;
  for (const auto& rec : store_->list_active()) {
    locked[asset_to_string(rec.asset)] += rec.amount;
  }

  SolvencyReport report;
  std::lock_guard<std::mutex> lk(book_mu_);
  std::set<std::string> keys;
  for (const auto& entry : locked) keys.insert(entry.first);
  for (const auto& entry : custody_) keys.insert(entry.first);

  for (const auto& key : keys) {
    AssetSolvency s;
    s.asset = key;
    const Wide sum = locked.count(key) ? locked[key] : 0;
    s.locked = static_cast<Amount>(sum);
    s.releasing = lookup(releasing_, key);
    s.custodied = lookup(custody_, key);
    s.stranded = lookup(stranded_, key);
    s.balanced = s.custodied >= s.stranded &&
                 sum + s.releasing == static_cast<Wide>(s.custodied - s.stranded);
    if (!s.balanced) report.ok = false;
    report.assets.push_back(std::move(s));
  }
  return report;
}

// ---------------------------------------------------------------------------
// open_ledger
// ---------------------------------------------------------------------------

LedgerOpenResult open_ledger(const LedgerConfig& config, IAssetTransfer& transfer,
                             const IClock& clock) {
  LedgerOpenResult out;
  const ConfigResult checked = validate(config);
  if (!checked.ok) {
    out.error = checked.error;
    out.description = checked.description;
    return out;
  }

  std::unique_ptr<ILockStore> store;
  if (config.store_path.empty()) {
    store = std::make_unique<MemoryLockStore>();
  } else {
    auto journal = std::make_unique<JournalLockStore>(config.store_path);
    std::string detail;
    const ErrorCode opened = journal->open(&detail);
    if (opened != ErrorCode::none) {
      out.error = opened;
      out.description = detail;
      return out;
    }
    store = std::move(journal);
  }

  std::shared_ptr<ImmutableAuditLog> audit;
  if (!config.audit_log_path.empty()) {
    audit = std::make_shared<ImmutableAuditLog>(config.audit_log_path);
    if (!audit->enabled()) {
      out.error = ErrorCode::store_io_failed;
      out.description = audit->open_error();
      return out;
    }
  }

  LedgerOptions options;
  options.reentrancy_guard = config.reentrancy_guard;
  options.event_log_path = config.event_log_path;

  out.ledger = std::make_unique<LockLedger>(
      std::move(store),
      make_id_deriver(config.id_scheme, config.sequential_origin, config.max_id_attempts),
      transfer, clock, std::move(options));
  if (audit) out.ledger->set_audit_log(std::move(audit));
  out.ok = true;
  return out;
}

}  // namespace vestlock
