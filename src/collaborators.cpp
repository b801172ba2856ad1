#include "vestlock/collaborators.hpp"

#include <chrono>
#include <limits>

namespace vestlock {

Timestamp SystemClock::now() const {
  using namespace std::chrono;
  return static_cast<Timestamp>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

void BalanceBook::credit(const Identity& holder, const AssetRef& asset, Amount amount) {
  std::lock_guard<std::mutex> lk(mu_);
  balances_[{holder, asset_to_string(asset)}] += amount;
}

Amount BalanceBook::balance_of(const Identity& holder, const AssetRef& asset) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = balances_.find({holder, asset_to_string(asset)});
  return it == balances_.end() ? 0 : it->second;
}

Amount BalanceBook::custody_of(const AssetRef& asset) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = custody_.find(asset_to_string(asset));
  return it == custody_.end() ? 0 : it->second;
}

TransferStatus BalanceBook::transfer_in(const Identity& from, const AssetRef& asset, Amount amount) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string key = asset_to_string(asset);
  Amount& held = balances_[{from, key}];
  if (held < amount) {
    return TransferStatus::failure("insufficient balance");
  }
  Amount& pool = custody_[key];
  if (pool > std::numeric_limits<Amount>::max() - amount) {
    return TransferStatus::failure("custody overflow");
  }
  held -= amount;
  pool += amount;
  return TransferStatus::success();
}

TransferStatus BalanceBook::transfer_out(const Identity& to, const AssetRef& asset, Amount amount) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string key = asset_to_string(asset);
  Amount& pool = custody_[key];
  if (pool < amount) {
    return TransferStatus::failure("insufficient custody");
  }
  Amount& held = balances_[{to, key}];
  if (held > std::numeric_limits<Amount>::max() - amount) {
    return TransferStatus::failure("balance overflow");
  }
  pool -= amount;
  held += amount;
  return TransferStatus::success();
}

}  // namespace vestlock
