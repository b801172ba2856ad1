#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "vestlock/audit.hpp"
#include "vestlock/collaborators.hpp"
#include "vestlock/config.hpp"
#include "vestlock/hash.hpp"
#include "vestlock/id_deriver.hpp"
#include "vestlock/jsonlite.hpp"
#include "vestlock/ledger.hpp"
#include "vestlock/lock_store.hpp"
#include "vestlock/observability.hpp"
#include "vestlock/position.hpp"
#include "vestlock/valuation.hpp"
#include "vestlock/version.hpp"

namespace fs = std::filesystem;
using namespace vestlock;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

constexpr Timestamp T0 = 1'700'000'000;
const AssetRef kNative = NativeAsset{};

std::string fresh_path(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("vestlock_test_" + name);
  std::error_code ec;
  fs::remove(p, ec);
  return p.string();
}

std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

void write_text(const std::string& path, const std::string& text) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

// Transfer collaborator with injectable failures and optional re-entry into
// the ledger from inside the transfer, as a token with hooks would do.
class HookedTransfer : public IAssetTransfer {
 public:
  explicit HookedTransfer(BalanceBook& book) : book_(book) {}

  TransferStatus transfer_in(const Identity& from, const AssetRef& asset, Amount amount) override {
    ++in_calls;
    if (ledger && reenter_deposit) {
      reenter_deposit = false;
      nested.push_back(ledger->deposit(from, asset, 1, 0).error);
    }
    if (fail_in) return TransferStatus::failure("transfer_in rejected");
    return book_.transfer_in(from, asset, amount);
  }

  TransferStatus transfer_out(const Identity& to, const AssetRef& asset, Amount amount) override {
    ++out_calls;
    last_out_amount = amount;
    if (ledger && check_solvency) {
      const auto report = ledger->verify_solvency();
      solvent_during_out.push_back(report.ok);
      for (const auto& a : report.assets) releasing_during_out += a.releasing;
    }
    if (ledger && !reenter_withdraw.empty()) {
      const LockId id = reenter_withdraw;
      reenter_withdraw.clear();
      nested.push_back(ledger->withdraw(to, id).error);
    }
    if (fail_out) return TransferStatus::failure("transfer_out rejected");
    return book_.transfer_out(to, asset, amount);
  }

  LockLedger* ledger{nullptr};
  bool reenter_deposit{false};
  LockId reenter_withdraw;
  bool fail_in{false};
  bool fail_out{false};
  bool check_solvency{false};
  std::vector<bool> solvent_during_out;
  Amount releasing_during_out{0};
  int in_calls{0};
  int out_calls{0};
  Amount last_out_amount{0};
  std::vector<ErrorCode> nested;

 private:
  BalanceBook& book_;
};

class RejectingStore : public MemoryLockStore {
 public:
  ErrorCode create(const LockId&, const LockRecord&) override {
    return ErrorCode::store_io_failed;
  }
};

class MapRegistry : public IOwnershipRegistry {
 public:
  std::optional<Identity> owner_of(const LockId& id) const override {
    auto it = owners.find(id);
    if (it == owners.end()) return std::nullopt;
    return it->second;
  }
  std::map<LockId, Identity> owners;
};

class MapUnits : public IUnitRegistry {
 public:
  Amount total_units() const override { return total; }
  Amount units_held(const Identity& holder) const override {
    auto it = held.find(holder);
    return it == held.end() ? 0 : it->second;
  }
  Amount total{0};
  std::map<Identity, Amount> held;
};

std::unique_ptr<LockLedger> make_ledger(IAssetTransfer& transfer, const IClock& clock,
                                        bool guard = true,
                                        std::unique_ptr<ILockStore> store = nullptr,
                                        std::unique_ptr<IIdDeriver> deriver = nullptr) {
  if (!store) store = std::make_unique<MemoryLockStore>();
  if (!deriver) deriver = std::make_unique<SequentialIdDeriver>();
  LedgerOptions options;
  options.reentrancy_guard = guard;
  return std::make_unique<LockLedger>(std::move(store), std::move(deriver), transfer, clock,
                                      options);
}

LockRecord record_of(Amount amount, Timestamp created, Duration duration) {
  LockRecord r;
  r.owner = "alice";
  r.amount = amount;
  r.created_at = created;
  r.duration = duration;
  return r;
}

std::vector<LedgerEvent> g_events;
void capture_event(const LedgerEvent& ev) { g_events.push_back(ev); }

// ============================================================================
// Valuation
// ============================================================================

void test_linear_vesting_points() {
  const auto r = record_of(1000, T0, 1000);
  expect(vested_value(r, T0 - 1) == 0, "value before creation is 0");
  expect(vested_value(r, T0) == 0, "value at creation is 0");
  expect(vested_value(r, T0 + 250) == 250, "quarter vested");
  expect(vested_value(r, T0 + 999) == 999, "value just before maturity");
  expect(vested_value(r, T0 + 1000) == 1000, "full value at maturity");
  expect(vested_value(r, T0 + 1'000'000) == 1000, "value capped after maturity");
}

void test_zero_duration_is_matured() {
  const auto r = record_of(42, T0, 0);
  expect(vested_value(r, T0) == 42, "zero-duration lock is fully vested at creation");
  expect(vested_value(r, T0 - 5) == 42, "zero-duration lock is vested regardless of now");
  expect(is_matured(r, T0), "zero-duration lock matured");
}

void test_vesting_rounds_down() {
  const auto r = record_of(10, T0, 3);
  expect(vested_value(r, T0 + 1) == 3, "floor(10/3)");
  expect(vested_value(r, T0 + 2) == 6, "floor(20/3)");
}

void test_vesting_monotonic_and_bounded() {
  const auto r = record_of(7919, T0, 613);
  Amount prev = 0;
  for (Timestamp now = T0 - 10; now <= T0 + 700; ++now) {
    const Amount v = vested_value(r, now);
    expect(v >= prev, "vested value never decreases");
    expect(v <= r.amount, "vested value never exceeds amount");
    prev = v;
  }
}

void test_vesting_wide_product() {
  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  const auto r = record_of(kMax, 0, 3);
  expect(vested_value(r, 1) == kMax / 3, "max amount * 1 / 3 without overflow");
  expect(vested_value(r, 2) == (kMax / 3) * 2, "max amount * 2 / 3 without overflow");

  const auto long_lock = record_of(kMax, 0, kMax - 1);
  expect(vested_value(long_lock, kMax - 2) == kMax - 2, "near-max elapsed stays exact");
}

// ============================================================================
// Lock lifecycle
// ============================================================================

void test_deposit_vest_withdraw_scenario() {
  BalanceBook book;
  book.credit("alice", kNative, 5000);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  const auto dep = ledger->deposit("alice", kNative, 1000, 1000);
  expect(dep.ok, "deposit succeeds: " + dep.detail);
  expect(dep.created_at == T0, "created_at is the clock time");
  expect(dep.maturity == T0 + 1000, "maturity = created_at + duration");
  expect(book.balance_of("alice", kNative) == 4000, "deposit moved into custody");
  expect(book.custody_of(kNative) == 1000, "custody holds the deposit");

  clock.set(T0 + 250);
  expect(ledger->get_balance(dep.id) == std::optional<Amount>(250), "balance at T+250");

  clock.set(T0 + 999);
  const auto early = ledger->withdraw("alice", dep.id);
  expect(!early.ok && early.error == ErrorCode::lock_period_ongoing,
         "withdraw before maturity rejected");
  expect(ledger->get_lock(dep.id).has_value(), "rejected withdraw keeps the lock");

  clock.set(T0 + 1000);
  expect(ledger->get_balance(dep.id) == std::optional<Amount>(1000), "balance at maturity");
  const auto w = ledger->withdraw("alice", dep.id);
  expect(w.ok, "withdraw at maturity succeeds: " + w.detail);
  expect(w.amount == 1000, "withdraw releases the full amount");
  expect(book.balance_of("alice", kNative) == 5000, "owner got the amount back");
  expect(book.custody_of(kNative) == 0, "custody emptied");

  expect(!ledger->get_lock(dep.id).has_value(), "lock gone after withdraw");
  expect(!ledger->get_balance(dep.id).has_value(), "balance query reports not found");
  expect(!ledger->get_maturity(dep.id).has_value(), "maturity query reports not found");
  const auto again = ledger->withdraw("alice", dep.id);
  expect(again.error == ErrorCode::not_found, "second withdraw reports not_found");
}

void test_withdraw_unauthorized() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  const auto dep = ledger->deposit("alice", kNative, 100, 10);
  clock.set(T0 + 10);
  const auto w = ledger->withdraw("bob", dep.id);
  expect(w.error == ErrorCode::unauthorized, "non-owner rejected");
  expect(ledger->get_lock(dep.id).has_value(), "lock intact after unauthorized attempt");
  expect(book.balance_of("bob", kNative) == 0, "nothing released to non-owner");

  clock.set(T0 + 1);
  const auto early = ledger->withdraw("bob", dep.id);
  expect(early.error == ErrorCode::unauthorized, "ownership checked before maturity");
}

void test_deposit_validation() {
  BalanceBook book;
  book.credit("alice", kNative, 1000);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  expect(ledger->deposit("alice", kNative, 0, 10).error == ErrorCode::invalid_amount,
         "zero amount rejected");
  expect(ledger->deposit("", kNative, 10, 10).error == ErrorCode::invalid_argument,
         "empty owner rejected");
  expect(ledger->deposit("alice", TokenAsset{""}, 10, 10).error == ErrorCode::invalid_argument,
         "empty token reference rejected");
  expect(ledger->deposit("alice", kNative, 2000, 10).error == ErrorCode::transfer_failed,
         "insufficient balance surfaces as transfer_failed");

  clock.set(std::numeric_limits<Timestamp>::max() - 5);
  expect(ledger->deposit("alice", kNative, 10, 100).error == ErrorCode::invalid_duration,
         "maturity overflow rejected");

  expect(ledger->store().size() == 0, "no failed deposit left a record");
  expect(book.balance_of("alice", kNative) == 1000, "no failed deposit moved funds");
  expect(ledger->verify_solvency().ok, "books balanced after failures");
}

void test_transfer_out_called_once() {
  BalanceBook book;
  book.credit("alice", kNative, 500);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock);

  const auto dep = ledger->deposit("alice", kNative, 500, 0);
  expect(dep.ok, "zero-duration deposit succeeds");
  expect(transfer.in_calls == 1, "transfer_in once per deposit");
  const auto w = ledger->withdraw("alice", dep.id);
  expect(w.ok, "zero-duration lock withdrawable immediately");
  expect(transfer.out_calls == 1, "transfer_out exactly once per withdraw");
  expect(transfer.last_out_amount == 500, "transfer_out carries the locked amount");
  expect(ledger->withdraw("alice", dep.id).error == ErrorCode::not_found, "no double release");
  expect(transfer.out_calls == 1, "rejected withdraw never transfers");
}

void test_sequential_ids_never_reused() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  const auto a = ledger->deposit("alice", kNative, 10, 0);
  const auto b = ledger->deposit("alice", kNative, 10, 0);
  expect(a.id == "0" && b.id == "1", "sequential ids from origin 0");
  expect(ledger->withdraw("alice", a.id).ok, "withdraw first lock");
  const auto c = ledger->deposit("alice", kNative, 10, 0);
  expect(c.id == "2", "retired id not reissued");
  expect(ledger->store().ever_issued("0"), "retired id remembered");
}

void test_content_ids_distinct_same_instant() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock, true, nullptr, std::make_unique<ContentIdDeriver>());
  expect(ledger->id_scheme() == IdScheme::content, "content scheme selected");

  const auto a = ledger->deposit("alice", kNative, 10, 60);
  const auto b = ledger->deposit("alice", kNative, 10, 60);
  expect(a.ok && b.ok, "identical deposits both succeed");
  expect(a.id != b.id, "identical same-instant deposits get distinct ids");
  expect(is_hex_digest(a.id) && is_hex_digest(b.id), "content ids are BLAKE3 hex");
  expect(ledger->locks_of("alice").size() == 2, "both locks recorded");
}

void test_content_deriver_skips_issued() {
  MemoryLockStore store;
  LockSeed seed{"alice", NativeAsset{}, 10, 100};
  const LockId first = lock_id_hash(ContentIdDeriver::canonical_tuple(seed, 0));
  expect(store.create(first, record_of(10, 0, 100)) == ErrorCode::none, "pre-issue first id");

  ContentIdDeriver deriver(4);
  const auto p = deriver.propose(seed, store);
  expect(p.has_value(), "deriver finds a free id");
  expect(p->id == lock_id_hash(ContentIdDeriver::canonical_tuple(seed, 1)),
         "deriver bumps the nonce past an issued id");
  expect(deriver.propose(seed, store)->id == p->id, "propose alone does not advance");

  ContentIdDeriver tight(1);
  expect(!tight.propose(seed, store).has_value(), "attempt budget exhausted");
}

void test_id_space_exhausted() {
  MemoryLockStore store;
  SequentialIdDeriver last(std::numeric_limits<uint64_t>::max());
  LockSeed seed{"alice", NativeAsset{}, 1, 0};
  const auto p = last.propose(seed, store);
  expect(p && p->id == "18446744073709551615", "last sequential id proposed");
  last.commit(seed, *p);
  expect(!last.propose(seed, store).has_value(), "sequential space exhausted");

  BalanceBook book;
  book.credit("alice", kNative, 10);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock, true, nullptr, std::make_unique<ContentIdDeriver>(0));
  const auto r = ledger->deposit("alice", kNative, 10, 0);
  expect(r.error == ErrorCode::id_space_exhausted, "deposit reports id_space_exhausted");
  expect(book.balance_of("alice", kNative) == 10, "no funds moved without an id");
}

void test_failed_deposit_consumes_no_id() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  expect(ledger->deposit("alice", kNative, 500, 10).error == ErrorCode::transfer_failed,
         "underfunded deposit fails");
  const auto ok = ledger->deposit("alice", kNative, 10, 10);
  expect(ok.ok && ok.id == "0", "first stored lock still gets id 0");

  BalanceBook content_book;
  content_book.credit("alice", kNative, 100);
  auto content = make_ledger(content_book, clock, true, nullptr,
                             std::make_unique<ContentIdDeriver>());
  expect(!content->deposit("alice", kNative, 500, 10).ok, "underfunded content deposit fails");
  content_book.credit("alice", kNative, 400);
  const auto c = content->deposit("alice", kNative, 500, 10);
  const LockSeed seed{"alice", NativeAsset{}, 500, T0 + 10};
  expect(c.ok && c.id == lock_id_hash(ContentIdDeriver::canonical_tuple(seed, 0)),
         "content nonce not consumed by the failed deposit");

  auto rejecting = make_ledger(book, clock, true, std::make_unique<RejectingStore>());
  expect(rejecting->deposit("alice", kNative, 10, 10).error == ErrorCode::store_io_failed,
         "refunded deposit fails");
}

void test_reentrant_deposit_unguarded() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock, false);
  transfer.ledger = ledger.get();

  transfer.reenter_deposit = true;
  const auto dep = ledger->deposit("alice", kNative, 50, 10);
  expect(transfer.nested.size() == 1 && transfer.nested[0] == ErrorCode::none,
         "nested deposit succeeds without guard");
  expect(dep.ok && dep.id == "1", "outer deposit takes the next id");
  expect(ledger->get_lock("0").has_value(), "nested lock holds id 0");
  expect(ledger->verify_solvency().ok, "books balanced");
}

void test_reentrant_withdraw_guarded() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock, true);
  transfer.ledger = ledger.get();

  const auto dep = ledger->deposit("alice", kNative, 100, 0);
  transfer.reenter_withdraw = dep.id;
  const auto w = ledger->withdraw("alice", dep.id);
  expect(w.ok, "outer withdraw succeeds");
  expect(transfer.nested.size() == 1 && transfer.nested[0] == ErrorCode::reentrant_call,
         "nested withdraw rejected by guard");
  expect(transfer.out_calls == 1, "only the outer withdraw released funds");
  expect(book.balance_of("alice", kNative) == 100, "single release");
  expect(ledger->stats().failures_for(ErrorCode::reentrant_call) == 1, "guard rejection counted");
}

void test_reentrant_withdraw_unguarded() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock, false);
  transfer.ledger = ledger.get();

  const auto dep = ledger->deposit("alice", kNative, 100, 0);
  transfer.reenter_withdraw = dep.id;
  const auto w = ledger->withdraw("alice", dep.id);
  expect(w.ok, "outer withdraw succeeds");
  expect(transfer.nested.size() == 1 && transfer.nested[0] == ErrorCode::not_found,
         "record removed before the transfer, nested withdraw sees not_found");
  expect(transfer.out_calls == 1, "funds released once");
  expect(ledger->verify_solvency().ok, "books balanced");
}

void test_solvency_during_release() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock);
  transfer.ledger = ledger.get();

  const auto dep = ledger->deposit("alice", kNative, 100, 0);
  transfer.check_solvency = true;
  expect(ledger->withdraw("alice", dep.id).ok, "withdraw succeeds");
  expect(transfer.solvent_during_out.size() == 1 && transfer.solvent_during_out[0],
         "books balanced while the release is in flight");
  expect(transfer.releasing_during_out == 100, "in-flight amount reported as releasing");

  const auto after = ledger->verify_solvency();
  expect(after.ok && after.assets.size() == 1 && after.assets[0].releasing == 0,
         "nothing releasing once the call returns");

  const auto dep2 = ledger->deposit("alice", kNative, 40, 0);
  transfer.solvent_during_out.clear();
  transfer.fail_out = true;
  expect(ledger->withdraw("alice", dep2.id).funds_stranded, "failed release strands funds");
  expect(transfer.solvent_during_out.size() == 1 && transfer.solvent_during_out[0],
         "balanced during a release that then fails");
  expect(ledger->verify_solvency().ok, "balanced after stranding");
}

void test_reentrant_deposit_guarded() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock, true);
  transfer.ledger = ledger.get();

  transfer.reenter_deposit = true;
  const auto dep = ledger->deposit("alice", kNative, 50, 10);
  expect(dep.ok, "outer deposit succeeds");
  expect(transfer.nested.size() == 1 && transfer.nested[0] == ErrorCode::reentrant_call,
         "nested deposit rejected by guard");
  expect(ledger->store().size() == 1, "only the outer lock exists");
}

void test_stranded_withdraw() {
  BalanceBook book;
  book.credit("alice", kNative, 300);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock);

  const auto dep = ledger->deposit("alice", kNative, 300, 5);
  clock.advance(5);
  transfer.fail_out = true;
  const auto w = ledger->withdraw("alice", dep.id);
  expect(!w.ok && w.error == ErrorCode::transfer_failed, "failed release reported");
  expect(w.funds_stranded, "failed release flagged as stranded");
  expect(!ledger->get_lock(dep.id).has_value(), "record stays removed");
  expect(ledger->stranded(kNative) == 300, "stranded custody booked");
  expect(ledger->custodied(kNative) == 300, "asset still in custody");
  expect(ledger->stats().stranded_transfers.load() == 1, "stranded transfer counted");
  expect(ledger->verify_solvency().ok, "stranded amount accounted for");

  transfer.fail_out = false;
  expect(ledger->withdraw("alice", dep.id).error == ErrorCode::not_found,
         "stranded lock cannot be withdrawn again");
}

void test_failed_create_refunds() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  HookedTransfer transfer(book);
  ManualClock clock(T0);
  auto ledger = make_ledger(transfer, clock, true, std::make_unique<RejectingStore>());

  const auto dep = ledger->deposit("alice", kNative, 60, 10);
  expect(!dep.ok && dep.error == ErrorCode::store_io_failed, "store error reported");
  expect(!dep.funds_stranded, "refund succeeded");
  expect(book.balance_of("alice", kNative) == 100, "deposit refunded");
  expect(ledger->custodied(kNative) == 0, "no custody without a record");

  transfer.fail_out = true;
  const auto stuck = ledger->deposit("alice", kNative, 60, 10);
  expect(stuck.error == ErrorCode::transfer_failed && stuck.funds_stranded,
         "failed refund reported as stranded");
  expect(ledger->stranded(kNative) == 60, "unrefunded deposit booked as stranded");
  expect(ledger->verify_solvency().ok, "stranded deposit accounted for");
}

void test_ownership_registry() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);
  MapRegistry registry;
  ledger->set_ownership_registry(&registry);

  const auto dep = ledger->deposit("alice", kNative, 100, 0);
  expect(ledger->withdraw("alice", dep.id).error == ErrorCode::unauthorized,
         "unregistered position cannot be withdrawn");

  registry.owners[dep.id] = "bob";
  expect(ledger->withdraw("alice", dep.id).error == ErrorCode::unauthorized,
         "original depositor no longer authorized");
  const auto w = ledger->withdraw("bob", dep.id);
  expect(w.ok, "registry holder withdraws");
  expect(book.balance_of("bob", kNative) == 100, "release goes to the holder");
}

void test_locks_of_follows_registry() {
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);
  const auto dep = ledger->deposit("alice", kNative, 100, 10);
  MapRegistry registry;
  ledger->set_ownership_registry(&registry);

  expect(ledger->locks_of("alice").empty(), "unregistered position listed for nobody");
  registry.owners[dep.id] = "bob";
  const auto bobs = ledger->locks_of("bob");
  expect(bobs.size() == 1 && bobs[0].id == dep.id, "registry holder lists the lock");
  expect(ledger->locks_of("alice").empty(), "depositor no longer lists it");

  ledger->set_ownership_registry(nullptr);
  expect(ledger->locks_of("alice").size() == 1, "without a registry the stored owner lists it");
}

void test_queries() {
  BalanceBook book;
  const AssetRef usd = TokenAsset{"usd"};
  book.credit("alice", usd, 100);
  book.credit("alice", kNative, 100);
  ManualClock clock(0);
  auto ledger = make_ledger(book, clock);

  const auto epoch = ledger->deposit("alice", kNative, 5, 0);
  expect(ledger->get_maturity(epoch.id) == std::optional<Timestamp>(0),
         "lock maturing at epoch 0 reports 0");
  expect(!ledger->get_maturity("missing").has_value(), "missing lock distinct from epoch 0");

  clock.set(T0);
  const auto dep = ledger->deposit("alice", usd, 80, 3600);
  expect(ledger->get_asset(dep.id) == std::optional<AssetRef>(usd), "asset query");
  expect(ledger->get_maturity(dep.id) == std::optional<Timestamp>(T0 + 3600), "maturity query");
  expect(ledger->get_balance_at(dep.id, T0 + 1800) == std::optional<Amount>(40),
         "balance at explicit time");
  expect(ledger->locks_of("alice").size() == 2, "locks_of lists owner locks");
  expect(ledger->locks_of("bob").empty(), "locks_of empty for other owner");
  expect(!ledger->get_asset("missing").has_value(), "asset query not found");
}

void test_solvency_per_asset() {
  BalanceBook book;
  const AssetRef usd = TokenAsset{"usd"};
  book.credit("alice", kNative, 100);
  book.credit("alice", usd, 200);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  expect(ledger->deposit("alice", kNative, 100, 10).ok, "native deposit");
  expect(ledger->deposit("alice", usd, 150, 10).ok, "token deposit");
  const auto report = ledger->verify_solvency();
  expect(report.ok, "solvent");
  expect(report.assets.size() == 2, "one entry per asset");
  expect(ledger->custodied(usd) == 150, "token custody");
  expect(book.custody_of(usd) == ledger->custodied(usd), "ledger and transfer agree");
}

void test_concurrent_deposits() {
  BalanceBook book;
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  for (int t = 0; t < kThreads; ++t) book.credit("user" + std::to_string(t), kNative, kPerThread);

  std::vector<std::vector<LockId>> ids(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      const Identity who = "user" + std::to_string(t);
      for (int i = 0; i < kPerThread; ++i) {
        const auto r = ledger->deposit(who, kNative, 1, 100);
        if (r.ok) ids[t].push_back(r.id);
      }
    });
  }
  for (auto& th : threads) th.join();

  std::set<LockId> unique;
  for (const auto& v : ids) unique.insert(v.begin(), v.end());
  expect(unique.size() == static_cast<size_t>(kThreads * kPerThread), "every deposit got a distinct id");
  expect(ledger->store().size() == unique.size(), "store holds every lock");
  expect(ledger->custodied(kNative) == unique.size(), "custody matches locks");
  expect(ledger->verify_solvency().ok, "solvent under concurrency");
}

// ============================================================================
// Fungible position view
// ============================================================================

void test_fungible_position_view() {
  BalanceBook book;
  book.credit("alice", kNative, 1000);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);
  MapUnits units;
  FungiblePositionView view(*ledger, kNative, units);

  expect(view.unit_value("any") == 0, "no units, no unit value");
  expect(view.maturity("whatever") == 0, "maturity ignores the id");

  expect(ledger->deposit("alice", kNative, 1000, 100).ok, "fund the pool");
  units.total = 3;
  units.held["carol"] = 2;
  expect(view.underlying() == 1000, "underlying is ledger custody");
  expect(view.unit_value("x") == 333, "unit value truncates");
  expect(view.holder_value("carol") == 666, "holder value = unit value * units");
  expect(view.holder_value("dave") == 0, "holder without units");
  expect(view.asset("x") == kNative, "pool asset");
}

// ============================================================================
// Durable store
// ============================================================================

void test_journal_replay() {
  const std::string path = fresh_path("journal_replay.ndjson");
  {
    JournalLockStore store(path);
    expect(store.open() == ErrorCode::none, "open fresh journal");
    auto a = record_of(10, T0, 5);
    auto b = record_of(20, T0, 50);
    b.asset = TokenAsset{"usd"};
    expect(store.create("a", a) == ErrorCode::none, "create a");
    expect(store.create("b", b) == ErrorCode::none, "create b");
    expect(store.remove("a") == ErrorCode::none, "remove a");
    expect(store.create("a", a) == ErrorCode::duplicate_id, "retired id rejected");
  }
  JournalLockStore reopened(path);
  std::string detail;
  expect(reopened.open(&detail) == ErrorCode::none, "replay: " + detail);
  expect(reopened.size() == 1, "one live lock after replay");
  expect(!reopened.get("a").has_value(), "removed lock stays removed");
  expect(reopened.ever_issued("a"), "removed id still retired");
  const auto b = reopened.get("b");
  expect(b && b->amount == 20 && b->asset == AssetRef(TokenAsset{"usd"}), "record fields replayed");
  expect(reopened.create("a", record_of(1, 0, 0)) == ErrorCode::duplicate_id,
         "retired id rejected after replay");
}

void test_journal_compact() {
  const std::string path = fresh_path("journal_compact.ndjson");
  {
    JournalLockStore store(path);
    expect(store.open() == ErrorCode::none, "open");
    for (int i = 0; i < 5; ++i) {
      expect(store.create(std::to_string(i), record_of(1, T0, 0)) == ErrorCode::none, "create");
    }
    for (int i = 0; i < 3; ++i) expect(store.remove(std::to_string(i)) == ErrorCode::none, "remove");
    expect(read_lines(path).size() == 8, "journal holds every mutation");
    expect(store.compact() == ErrorCode::none, "compact");
    expect(read_lines(path).size() == 5, "compacted journal: 3 retires + 2 creates");
    expect(store.create("5", record_of(1, T0, 0)) == ErrorCode::none, "append after compact");
  }
  JournalLockStore reopened(path);
  expect(reopened.open() == ErrorCode::none, "replay compacted journal");
  expect(reopened.size() == 3, "live locks survive compaction");
  expect(reopened.ever_issued("0") && !reopened.contains("0"), "tombstone survives compaction");
}

void test_journal_rejects_malformed() {
  const std::string garbage = fresh_path("journal_garbage.ndjson");
  write_text(garbage, "not json\n");
  JournalLockStore bad(garbage);
  std::string detail;
  expect(bad.open(&detail) == ErrorCode::store_io_failed, "malformed journal rejected");
  expect(detail.find("line 1") != std::string::npos, "detail names the line");

  const std::string future = fresh_path("journal_future.ndjson");
  write_text(future, "{\"v\":99,\"op\":\"remove\",\"id\":\"x\"}\n");
  JournalLockStore newer(future);
  expect(newer.open() == ErrorCode::store_io_failed, "unknown format version rejected");

  const std::string orphan = fresh_path("journal_orphan.ndjson");
  write_text(orphan, "{\"v\":1,\"op\":\"remove\",\"id\":\"x\"}\n");
  JournalLockStore dangling(orphan);
  expect(dangling.open() == ErrorCode::store_io_failed, "remove of unknown id rejected");
}

void test_journal_write_failure_truncates() {
  const std::string path = fresh_path("journal_torn.ndjson");
  JournalLockStore store(path);
  expect(store.open() == ErrorCode::none, "open");
  expect(store.create("a", record_of(10, T0, 5)) == ErrorCode::none, "create a");
  const auto before = fs::file_size(path);

  // Cap the file size a few bytes past the current end so the next line is torn.
  std::signal(SIGXFSZ, SIG_IGN);
  rlimit saved{};
  expect(::getrlimit(RLIMIT_FSIZE, &saved) == 0, "read file size limit");
  rlimit capped = saved;
  capped.rlim_cur = static_cast<rlim_t>(before + 10);
  expect(::setrlimit(RLIMIT_FSIZE, &capped) == 0, "cap file size");
  const auto torn = store.create("b", record_of(20, T0, 5));
  expect(::setrlimit(RLIMIT_FSIZE, &saved) == 0, "restore file size limit");
  std::signal(SIGXFSZ, SIG_DFL);

  expect(torn == ErrorCode::store_io_failed, "short write reported");
  expect(!store.get("b").has_value(), "failed create leaves no record");
  expect(fs::file_size(path) == before, "partial line cut from the journal");
  expect(store.create("c", record_of(30, T0, 5)) == ErrorCode::none, "append after failure");

  JournalLockStore reopened(path);
  std::string detail;
  expect(reopened.open(&detail) == ErrorCode::none, "journal still replays: " + detail);
  expect(reopened.size() == 2 && reopened.contains("a") && reopened.contains("c"),
         "only committed records replayed");
  expect(!reopened.ever_issued("b"), "torn id never issued");
}

void test_journal_open_existing_only() {
  const std::string path = fresh_path("journal_missing.ndjson");
  JournalLockStore store(path);
  std::string detail;
  expect(store.open(&detail, false) == ErrorCode::store_io_failed, "missing journal rejected");
  expect(detail.find(path) != std::string::npos, "detail names the path");
  expect(!fs::exists(path), "no empty journal created");
  expect(store.open() == ErrorCode::none && fs::exists(path), "default open creates it");
}

void test_open_ledger_resumes_journal() {
  LedgerConfig config;
  config.store_path = fresh_path("ledger_resume.ndjson");
  BalanceBook book;
  book.credit("alice", kNative, 1000);
  ManualClock clock(T0);
  LockId first;
  {
    auto opened = open_ledger(config, book, clock);
    expect(opened.ok, "open journal ledger: " + opened.description);
    const auto dep = opened.ledger->deposit("alice", kNative, 500, 10);
    expect(dep.ok, "deposit into journal ledger");
    first = dep.id;
  }
  auto opened = open_ledger(config, book, clock);
  expect(opened.ok, "reopen journal ledger");
  auto& ledger = *opened.ledger;
  expect(ledger.get_lock(first).has_value(), "lock survives reopen");
  expect(ledger.custodied(kNative) == 500, "custody seeded from replayed locks");
  const auto next = ledger.deposit("alice", kNative, 100, 10);
  expect(next.ok && next.id != first, "fresh id after replay");

  clock.advance(10);
  expect(ledger.withdraw("alice", first).ok, "withdraw replayed lock");
  expect(ledger.verify_solvency().ok, "solvent after reopen");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_from_json() {
  const auto r = config_from_json(
      "{\"id_scheme\":\"content\",\"max_id_attempts\":8,\"reentrancy_guard\":false,"
      "\"store_path\":\"locks.ndjson\"}");
  expect(r.ok, "valid config parses: " + r.description);
  expect(r.config.id_scheme == IdScheme::content, "scheme parsed");
  expect(r.config.max_id_attempts == 8, "attempts parsed");
  expect(!r.config.reentrancy_guard, "guard flag parsed");
  expect(r.config.store_path == "locks.ndjson", "store path parsed");
  expect(r.config.audit_log_path.empty(), "unset key keeps default");
}

void test_config_rejects_invalid() {
  expect(config_from_json("{\"id_schema\":\"content\"}").error == ErrorCode::config_invalid,
         "unknown key rejected");
  expect(!config_from_json("{\"id_scheme\":\"content\",\"id_scheme\":\"sequential\"}").ok,
         "duplicate key rejected");
  expect(!config_from_json("{\"id_scheme\":\"random\"}").ok, "unknown scheme rejected");
  expect(!config_from_json("{\"id_scheme\":\"content\",\"max_id_attempts\":0}").ok,
         "content scheme needs attempts");
  expect(!config_from_json("{\"store_path\":\"x\",\"audit_log_path\":\"x\"}").ok,
         "store and audit must differ");
  expect(!config_from_json("{} trailing").ok, "trailing data rejected");
  expect(!config_from_file("/nonexistent/vestlock.json").ok, "missing file rejected");
}

void test_config_rejects_wrong_types() {
  const auto guard = config_from_json("{\"reentrancy_guard\":\"false\"}");
  expect(!guard.ok && guard.error == ErrorCode::config_invalid, "quoted boolean rejected");
  expect(guard.description.find("reentrancy_guard") != std::string::npos, "detail names the key");
  expect(config_from_json("{\"store_path\":5}").error == ErrorCode::config_invalid,
         "numeric path rejected");
  expect(config_from_json("{\"max_id_attempts\":\"8\"}").error == ErrorCode::config_invalid,
         "quoted integer rejected");
  expect(config_from_json("{\"sequential_origin\":-1}").error == ErrorCode::config_invalid,
         "negative origin rejected");
  expect(config_from_json("{\"id_scheme\":null}").error == ErrorCode::config_invalid,
         "null scheme rejected");
  expect(config_from_json("{\"audit_log_path\":true}").error == ErrorCode::config_invalid,
         "boolean path rejected");
}

void test_config_env_overrides() {
  ::setenv("VESTLOCK_ID_SCHEME", "content", 1);
  ::setenv("VESTLOCK_REENTRANCY_GUARD", "off", 1);
  const auto r = apply_env_overrides(LedgerConfig{});
  expect(r.ok, "env overrides apply");
  expect(r.config.id_scheme == IdScheme::content, "env scheme applied");
  expect(!r.config.reentrancy_guard, "env guard applied");

  ::setenv("VESTLOCK_REENTRANCY_GUARD", "maybe", 1);
  expect(apply_env_overrides(LedgerConfig{}).error == ErrorCode::config_invalid,
         "bad env flag rejected");
  ::unsetenv("VESTLOCK_ID_SCHEME");
  ::unsetenv("VESTLOCK_REENTRANCY_GUARD");
}

void test_open_ledger_rejects_bad_config() {
  BalanceBook book;
  ManualClock clock(T0);
  LedgerConfig same;
  same.store_path = "dup.ndjson";
  same.audit_log_path = "dup.ndjson";
  expect(open_ledger(same, book, clock).error == ErrorCode::config_invalid,
         "conflicting paths rejected");

  LedgerConfig unwritable;
  unwritable.audit_log_path = "/nonexistent_vestlock_dir/audit.log";
  const auto r = open_ledger(unwritable, book, clock);
  expect(!r.ok && r.error == ErrorCode::store_io_failed, "unopenable audit log rejected");
}

// ============================================================================
// Audit log
// ============================================================================

void test_audit_chain() {
  LedgerConfig config;
  config.audit_log_path = fresh_path("audit_chain.ndjson");
  BalanceBook book;
  book.credit("alice", kNative, 1000);
  ManualClock clock(T0);
  auto opened = open_ledger(config, book, clock);
  expect(opened.ok, "open audited ledger: " + opened.description);

  const auto dep = opened.ledger->deposit("alice", kNative, 1000, 0);
  expect(opened.ledger->withdraw("alice", dep.id).ok, "withdraw");
  expect(opened.ledger->withdraw("alice", dep.id).error == ErrorCode::not_found,
         "rejected call is not audited");

  const auto v = verify_audit_chain(config.audit_log_path);
  expect(v.ok, "chain verifies: " + v.error);
  expect(v.entries == 2, "one entry per committed transition");

  auto lines = read_lines(config.audit_log_path);
  const auto first = jsonlite::parse(lines[0], nullptr);
  expect(jsonlite::get_string(first, "operation") == "deposit", "first entry is the deposit");
  expect(jsonlite::get_string(first, "prev") == std::string(64, '0'), "genesis link");
}

void test_audit_tamper_detected() {
  const std::string path = fresh_path("audit_tamper.ndjson");
  {
    ImmutableAuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      AuditRecord r;
      r.operation = "deposit";
      r.lock_id = std::to_string(i);
      r.amount = 1000;
      expect(log.append(r), "append");
      expect(r.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
  }
  expect(verify_audit_chain(path).ok, "untouched chain verifies");

  auto lines = read_lines(path);
  const auto pos = lines[0].find("\"amount\":1000");
  lines[0].replace(pos, 13, "\"amount\":9999");
  std::string text;
  for (const auto& l : lines) text += l + "\n";
  write_text(path, text);

  const auto v = verify_audit_chain(path);
  expect(!v.ok, "edited entry breaks the chain");
  expect(v.first_bad_sequence == 2, "break reported at the next link");
}

void test_audit_resume_and_critical() {
  const std::string path = fresh_path("audit_resume.ndjson");
  {
    ImmutableAuditLog log(path);
    AuditRecord r;
    r.operation = "deposit";
    expect(log.append(r), "first append");
  }
  {
    ImmutableAuditLog log(path);
    AuditRecord r;
    r.operation = "withdraw_transfer_failed";
    r.severity = AuditSeverity::critical;
    expect(log.append(r), "append after reopen");
    expect(r.sequence == 2, "sequence resumes");
  }
  const auto v = verify_audit_chain(path);
  expect(v.ok && v.entries == 2, "resumed chain verifies");
  expect(read_lines(path)[1].find("\"severity\":\"critical\"") != std::string::npos,
         "critical severity recorded");

  ImmutableAuditLog disabled;
  AuditRecord r;
  expect(disabled.append(r) && !disabled.enabled(), "disabled log accepts silently");
}

void test_audit_unreadable_tail() {
  const std::string path = fresh_path("audit_unreadable.ndjson");
  write_text(path, "{\"seq\":1,\"operation\":\"dep\n");
  {
    ImmutableAuditLog log(path);
    expect(!log.enabled(), "log with unreadable tail not opened");
    expect(log.open_error().find(path) != std::string::npos, "open error names the log");
    AuditRecord r;
    r.operation = "deposit";
    expect(!log.append(r), "append refused");
    expect(log.failure_count() == 1, "refusal counted");
  }
  expect(read_lines(path).size() == 1, "no genesis entry appended");

  LedgerConfig config;
  config.audit_log_path = path;
  BalanceBook book;
  ManualClock clock(T0);
  const auto opened = open_ledger(config, book, clock);
  expect(!opened.ok && opened.error == ErrorCode::store_io_failed,
         "ledger refuses a log it cannot resume");
  expect(opened.description.find("unreadable") != std::string::npos, "reason reported");
}

// ============================================================================
// Observability
// ============================================================================

void test_event_hook_and_stats() {
  g_events.clear();
  set_ledger_event_hook(capture_event);
  BalanceBook book;
  book.credit("alice", kNative, 100);
  ManualClock clock(T0);
  auto ledger = make_ledger(book, clock);

  const auto dep = ledger->deposit("alice", kNative, 100, 10);
  ledger->withdraw("alice", dep.id);
  set_ledger_event_hook(nullptr);

  expect(g_events.size() == 2, "one event per call");
  expect(g_events[0].op == LedgerOp::deposit && g_events[0].ok, "deposit event");
  expect(g_events[0].lock_id == dep.id, "deposit event carries the id");
  expect(g_events[1].error == ErrorCode::lock_period_ongoing, "failed withdraw event");
  expect(g_events[1].asset == "native" && g_events[1].amount == 100, "withdraw event details");

  const auto& stats = ledger->stats();
  expect(stats.deposits_ok.load() == 1, "deposit counted");
  expect(stats.failed_operations.load() == 1, "failure counted");
  expect(stats.failures_for(ErrorCode::lock_period_ongoing) == 1, "failure by code");
  expect(stats.latency.count() == 2, "latency recorded per call");
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(stats.to_json(), &err);
  expect(!err, "stats serialize to valid JSON");
}

void test_event_log_file() {
  set_ledger_event_hook(nullptr);
  const std::string path = fresh_path("events.ndjson");
  BalanceBook book;
  book.credit("alice", kNative, 10);
  ManualClock clock(T0);
  LedgerOptions options;
  options.event_log_path = path;
  LockLedger ledger(std::make_unique<MemoryLockStore>(), std::make_unique<SequentialIdDeriver>(),
                    book, clock, options);
  expect(ledger.deposit("alice", kNative, 10, 0).ok, "deposit");

  const auto lines = read_lines(path);
  expect(lines.size() == 1, "one JSON line per event");
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(lines[0], &err);
  expect(!err, "event line is valid JSON");
  expect(jsonlite::get_string(obj, "op") == "deposit", "event op");
  expect(jsonlite::get_bool(obj, "ok", false), "event outcome");
  expect(ledger.stats().sink_failures.load() == 0, "no sink failures");
}

// ============================================================================
// Hashing and version
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  expect(lock_id_hash("payload") != audit_link_hash("payload"), "lock and audit domains differ");
  expect(lock_id_hash("payload") == hash_domain("lock:", "payload"), "lock domain prefix");
  expect(is_hex_digest(lock_id_hash("x")), "digest is 64 hex chars");
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  expect(m.store_format == version::STORE_FORMAT_VERSION, "store format version");
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(version::manifest_to_json(m), &err);
  expect(!err, "manifest is valid JSON");
  expect(jsonlite::has_key(obj, "store_format"), "manifest names the store format");
}

}  // namespace

int main() {
  std::cout << "=== Vestlock Ledger Test Suite ===\n";

  std::cout << "\n[Valuation]\n";
  run_test("linear vesting points", test_linear_vesting_points);
  run_test("zero duration is matured", test_zero_duration_is_matured);
  run_test("vesting rounds down", test_vesting_rounds_down);
  run_test("vesting monotonic and bounded", test_vesting_monotonic_and_bounded);
  run_test("vesting wide product", test_vesting_wide_product);

  std::cout << "\n[Lock lifecycle]\n";
  run_test("deposit, vest, withdraw", test_deposit_vest_withdraw_scenario);
  run_test("withdraw unauthorized", test_withdraw_unauthorized);
  run_test("deposit validation", test_deposit_validation);
  run_test("transfer_out called once", test_transfer_out_called_once);
  run_test("ownership registry", test_ownership_registry);
  run_test("locks_of follows registry", test_locks_of_follows_registry);
  run_test("queries", test_queries);
  run_test("solvency per asset", test_solvency_per_asset);
  run_test("concurrent deposits (8 threads)", test_concurrent_deposits);

  std::cout << "\n[Identifiers]\n";
  run_test("sequential ids never reused", test_sequential_ids_never_reused);
  run_test("content ids distinct in one instant", test_content_ids_distinct_same_instant);
  run_test("content deriver skips issued ids", test_content_deriver_skips_issued);
  run_test("id space exhausted", test_id_space_exhausted);
  run_test("failed deposit consumes no id", test_failed_deposit_consumes_no_id);

  std::cout << "\n[Re-entrancy and failed transfers]\n";
  run_test("nested withdraw with guard", test_reentrant_withdraw_guarded);
  run_test("nested withdraw without guard", test_reentrant_withdraw_unguarded);
  run_test("solvency during release", test_solvency_during_release);
  run_test("nested deposit with guard", test_reentrant_deposit_guarded);
  run_test("nested deposit without guard", test_reentrant_deposit_unguarded);
  run_test("stranded withdraw", test_stranded_withdraw);
  run_test("failed create refunds", test_failed_create_refunds);

  std::cout << "\n[Fungible position]\n";
  run_test("fungible position view", test_fungible_position_view);

  std::cout << "\n[Durable store]\n";
  run_test("journal replay", test_journal_replay);
  run_test("journal compact", test_journal_compact);
  run_test("journal rejects malformed input", test_journal_rejects_malformed);
  run_test("journal write failure truncates", test_journal_write_failure_truncates);
  run_test("journal open existing only", test_journal_open_existing_only);
  run_test("open_ledger resumes journal", test_open_ledger_resumes_journal);

  std::cout << "\n[Configuration]\n";
  run_test("config from JSON", test_config_from_json);
  run_test("config rejects invalid", test_config_rejects_invalid);
  run_test("config rejects wrong types", test_config_rejects_wrong_types);
  run_test("config env overrides", test_config_env_overrides);
  run_test("open_ledger rejects bad config", test_open_ledger_rejects_bad_config);

  std::cout << "\n[Audit log]\n";
  run_test("audit chain", test_audit_chain);
  run_test("audit tamper detected", test_audit_tamper_detected);
  run_test("audit resume + critical", test_audit_resume_and_critical);
  run_test("audit unreadable tail", test_audit_unreadable_tail);

  std::cout << "\n[Observability]\n";
  run_test("event hook + stats", test_event_hook_and_stats);
  run_test("event log file", test_event_log_file);

  std::cout << "\n[Hashing and version]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
