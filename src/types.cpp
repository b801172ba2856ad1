#include "vestlock/types.hpp"

#include <limits>
#include <sstream>

#include "vestlock/jsonlite.hpp"

namespace vestlock {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::duplicate_id: return "duplicate_id";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::unauthorized: return "unauthorized";
    case ErrorCode::lock_period_ongoing: return "lock_period_ongoing";
    case ErrorCode::transfer_failed: return "transfer_failed";
    case ErrorCode::invalid_amount: return "invalid_amount";
    case ErrorCode::invalid_duration: return "invalid_duration";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::reentrant_call: return "reentrant_call";
    case ErrorCode::id_space_exhausted: return "id_space_exhausted";
    case ErrorCode::store_io_failed: return "store_io_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(LockState state) {
  switch (state) {
    case LockState::active:    return "active";
    case LockState::withdrawn: return "withdrawn";
  }
  return "active";
}

std::string asset_to_string(const AssetRef& asset) {
  if (const auto* token = std::get_if<TokenAsset>(&asset)) {
    return "token:" + token->reference;
  }
  return "native";
}

std::optional<AssetRef> asset_from_string(const std::string& s) {
  if (s == "native") return AssetRef{NativeAsset{}};
  static const std::string kTokenPrefix = "token:";
  if (s.rfind(kTokenPrefix, 0) == 0 && s.size() > kTokenPrefix.size()) {
    return AssetRef{TokenAsset{s.substr(kTokenPrefix.size())}};
  }
  return std::nullopt;
}

bool maturity_fits(Timestamp created_at, Duration duration) {
  return duration <= std::numeric_limits<Timestamp>::max() - created_at;
}

std::string lock_record_to_json(const LockRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"id\":\"" << jsonlite::escape(r.id) << "\""
    << ",\"owner\":\"" << jsonlite::escape(r.owner) << "\""
    << ",\"asset\":\"" << jsonlite::escape(asset_to_string(r.asset)) << "\""
    << ",\"amount\":" << r.amount
    << ",\"created_at\":" << r.created_at
    << ",\"duration\":" << r.duration
    << ",\"maturity\":" << r.maturity()
    << ",\"state\":\"" << to_string(r.state) << "\""
    << "}";
  return o.str();
}

}  // namespace vestlock
