#include "vestlock/position.hpp"

#include <limits>
#include <utility>

namespace vestlock {

FungiblePositionView::FungiblePositionView(const LockLedger& ledger, AssetRef asset,
                                           const IUnitRegistry& units)
    : ledger_(ledger), asset_(std::move(asset)), units_(units) {}

const AssetRef& FungiblePositionView::asset(const LockId&) const { return asset_; }

Timestamp FungiblePositionView::maturity(const LockId&) const { return 0; }

Amount FungiblePositionView::underlying() const {
  const Amount held = ledger_.custodied(asset_);
  const Amount lost = ledger_.stranded(asset_);
  return held > lost ? held - lost : 0;
}

Amount FungiblePositionView::unit_value(const LockId&) const {
  const Amount supply = units_.total_units();
  if (supply == 0) return 0;
  return underlying() / supply;
}

Amount FungiblePositionView::holder_value(const Identity& holder) const {
  using Wide = unsigned __int128;
  const Wide v = static_cast<Wide>(unit_value(LockId{})) * units_.units_held(holder);
  const Wide cap = std::numeric_limits<Amount>::max();
  return static_cast<Amount>(v > cap ? cap : v);
}

}  // namespace vestlock
