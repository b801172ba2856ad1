#pragma once

// vestlock/position.hpp - Fungible-wide position view over ledger custody.
//
// One pool of underlying (what the ledger holds for an asset, minus stranded
// custody) is valued against a unit supply kept by an external registry.
// Per-id maturity is not meaningful for such a pool: maturity(id) ignores the
// id and returns 0, the most-imminent sentinel. unit_value(id) likewise
// ignores the id and returns the value of a single unit.

#include "vestlock/ledger.hpp"
#include "vestlock/types.hpp"

namespace vestlock {

class IUnitRegistry {
 public:
  virtual ~IUnitRegistry() = default;
  virtual Amount total_units() const = 0;
  virtual Amount units_held(const Identity& holder) const = 0;
};

class FungiblePositionView {
 public:
  // ledger and units are borrowed and must outlive the view.
  FungiblePositionView(const LockLedger& ledger, AssetRef asset, const IUnitRegistry& units);

  const AssetRef& asset(const LockId& id) const;
  Timestamp maturity(const LockId& id) const;

  // floor(underlying / total_units); 0 while no units exist.
  Amount unit_value(const LockId& id) const;

  // unit_value * units_held(holder), saturating at the Amount range.
  Amount holder_value(const Identity& holder) const;

  Amount underlying() const;

 private:
  const LockLedger& ledger_;
  AssetRef asset_;
  const IUnitRegistry& units_;
};

}  // namespace vestlock
