#pragma once

// vestlock/id_deriver.hpp - Lock identifier derivation.
//
// Two schemes:
//   sequential - decimal counter from a fixed origin. Reveals creation order
//                and count.
//   content    - hex BLAKE3 over (owner, asset, amount, maturity, nonce) in
//                the "lock:" domain. The per-owner nonce makes two locks with
//                identical (owner, amount, maturity) in the same instant get
//                distinct ids.
//
// Both schemes consult the store only to skip ids it has ever issued, so a
// deriver rebuilt over a replayed journal never proposes a retired id. The
// store's create() remains the final arbiter and fails with duplicate_id.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "vestlock/lock_store.hpp"
#include "vestlock/types.hpp"

namespace vestlock {

enum class IdScheme {
  sequential,
  content,
};

std::string to_string(IdScheme scheme);
std::optional<IdScheme> id_scheme_from_string(const std::string& s);

// Inputs a deriver may fold into an id.
struct LockSeed {
  Identity  owner;
  AssetRef  asset{NativeAsset{}};
  Amount    amount{0};
  Timestamp maturity{0};
};

// A candidate id plus the scheme cursor (counter value or nonce) that
// produced it.
struct IdProposal {
  LockId   id;
  uint64_t cursor{0};
};

// Two-phase derivation: propose() changes no deriver state, commit() advances
// past a proposal once its lock exists. A deposit that fails between the two
// leaves the sequence exactly where it was.
class IIdDeriver {
 public:
  virtual ~IIdDeriver() = default;

  // Next id not yet issued by store, or nullopt when the scheme cannot find
  // one within its attempt budget.
  virtual std::optional<IdProposal> propose(const LockSeed& seed, const ILockStore& store) const = 0;

  virtual void commit(const LockSeed& seed, const IdProposal& proposal) = 0;

  virtual IdScheme scheme() const = 0;
};

class SequentialIdDeriver : public IIdDeriver {
 public:
  explicit SequentialIdDeriver(uint64_t origin = 0) : next_(origin) {}

  std::optional<IdProposal> propose(const LockSeed& seed, const ILockStore& store) const override;
  void commit(const LockSeed& seed, const IdProposal& proposal) override;
  IdScheme scheme() const override { return IdScheme::sequential; }

 private:
  mutable std::mutex mu_;
  uint64_t next_;
  bool exhausted_{false};
};

class ContentIdDeriver : public IIdDeriver {
 public:
  static constexpr uint32_t kDefaultMaxAttempts = 64;

  explicit ContentIdDeriver(uint32_t max_attempts = kDefaultMaxAttempts)
      : max_attempts_(max_attempts) {}

  std::optional<IdProposal> propose(const LockSeed& seed, const ILockStore& store) const override;
  void commit(const LockSeed& seed, const IdProposal& proposal) override;
  IdScheme scheme() const override { return IdScheme::content; }

  // Canonical hashed tuple; stable across releases of the same ID_SCHEME_VERSION.
  static std::string canonical_tuple(const LockSeed& seed, uint64_t nonce);

 private:
  mutable std::mutex mu_;
  uint32_t max_attempts_;
  std::map<Identity, uint64_t> nonces_;
};

std::unique_ptr<IIdDeriver> make_id_deriver(IdScheme scheme, uint64_t sequential_origin,
                                            uint32_t max_attempts);

}  // namespace vestlock
