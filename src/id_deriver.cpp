#include "vestlock/id_deriver.hpp"

#include <limits>

#include "vestlock/hash.hpp"
#include "vestlock/version.hpp"

namespace vestlock {

std::string to_string(IdScheme scheme) {
  switch (scheme) {
    case IdScheme::sequential: return "sequential";
    case IdScheme::content:    return "content";
  }
  return "sequential";
}

std::optional<IdScheme> id_scheme_from_string(const std::string& s) {
  if (s == "sequential") return IdScheme::sequential;
  if (s == "content")    return IdScheme::content;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// SequentialIdDeriver
// ---------------------------------------------------------------------------

std::optional<IdProposal> SequentialIdDeriver::propose(const LockSeed& /*seed*/,
                                                       const ILockStore& store) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (exhausted_) return std::nullopt;
  for (uint64_t cursor = next_;; ++cursor) {
    LockId candidate = std::to_string(cursor);
    if (!store.ever_issued(candidate)) return IdProposal{std::move(candidate), cursor};
    if (cursor == std::numeric_limits<uint64_t>::max()) return std::nullopt;
  }
}

void SequentialIdDeriver::commit(const LockSeed& /*seed*/, const IdProposal& proposal) {
  std::lock_guard<std::mutex> lk(mu_);
  if (exhausted_ || proposal.cursor < next_) return;
  if (proposal.cursor == std::numeric_limits<uint64_t>::max()) {
    exhausted_ = true;
  } else {
    next_ = proposal.cursor + 1;
  }
}

// ---------------------------------------------------------------------------
// ContentIdDeriver
// ---------------------------------------------------------------------------

// Fields are '|'-joined with the owner length-prefixed, so no owner string
// can shift bytes into the asset or amount fields.
std::string ContentIdDeriver::canonical_tuple(const LockSeed& seed, uint64_t nonce) {
  std::string out;
  out.reserve(seed.owner.size() + 96);
  out += "v";
  out += std::to_string(version::ID_SCHEME_VERSION);
  out += '|';
  out += std::to_string(seed.owner.size());
  out += ':';
  out += seed.owner;
  out += '|';
  out += asset_to_string(seed.asset);
  out += '|';
  out += std::to_string(seed.amount);
  out += '|';
  out += std::to_string(seed.maturity);
  out += '|';
  out += std::to_string(nonce);
  return out;
}

std::optional<IdProposal> ContentIdDeriver::propose(const LockSeed& seed,
                                                    const ILockStore& store) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = nonces_.find(seed.owner);
  uint64_t nonce = it == nonces_.end() ? 0 : it->second;
  for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt, ++nonce) {
    LockId candidate = lock_id_hash(canonical_tuple(seed, nonce));
    if (!store.ever_issued(candidate)) return IdProposal{std::move(candidate), nonce};
  }
  return std::nullopt;
}

void ContentIdDeriver::commit(const LockSeed& seed, const IdProposal& proposal) {
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t& nonce = nonces_[seed.owner];
  if (proposal.cursor >= nonce) nonce = proposal.cursor + 1;
}

std::unique_ptr<IIdDeriver> make_id_deriver(IdScheme scheme, uint64_t sequential_origin,
                                            uint32_t max_attempts) {
  if (scheme == IdScheme::content) {
    return std::make_unique<ContentIdDeriver>(max_attempts);
  }
  return std::make_unique<SequentialIdDeriver>(sequential_origin);
}

}  // namespace vestlock
