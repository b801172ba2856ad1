#include "vestlock/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <sstream>
#include <variant>

#include "vestlock/jsonlite.hpp"

namespace vestlock {

namespace {

ConfigResult invalid(const LedgerConfig& config, std::string why) {
  ConfigResult r;
  r.ok = false;
  r.config = config;
  r.error = ErrorCode::config_invalid;
  r.description = std::move(why);
  return r;
}

ConfigResult accepted(const LedgerConfig& config) {
  ConfigResult r;
  r.ok = true;
  r.config = config;
  return r;
}

std::optional<bool> parse_flag(const std::string& s) {
  if (s == "1" || s == "true" || s == "on") return true;
  if (s == "0" || s == "false" || s == "off") return false;
  return std::nullopt;
}

// True when key is absent or holds a T.
template <typename T>
bool absent_or(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() || std::holds_alternative<T>(it->second.v);
}

const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

}  // namespace

std::string LedgerConfig::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"id_scheme\":\"" << to_string(id_scheme) << "\""
    << ",\"sequential_origin\":" << sequential_origin
    << ",\"max_id_attempts\":" << max_id_attempts
    << ",\"store_path\":\"" << jsonlite::escape(store_path) << "\""
    << ",\"audit_log_path\":\"" << jsonlite::escape(audit_log_path) << "\""
    << ",\"event_log_path\":\"" << jsonlite::escape(event_log_path) << "\""
    << ",\"reentrancy_guard\":" << (reentrancy_guard ? "true" : "false")
    << "}";
  return o.str();
}

ConfigResult config_from_json(const std::string& json, const LedgerConfig& base) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) return invalid(base, err->code + ": " + err->message);

  static const std::set<std::string> kKnownKeys = {
      "id_scheme",      "sequential_origin", "max_id_attempts", "store_path",
      "audit_log_path", "event_log_path",    "reentrancy_guard",
  };
  for (const auto& [key, value] : obj) {
    if (!kKnownKeys.count(key)) return invalid(base, "unknown config key: " + key);
  }

  // A present key of the wrong type is an error, never a silent default.
  for (const char* key : {"id_scheme", "store_path", "audit_log_path", "event_log_path"}) {
    if (!absent_or<std::string>(obj, key)) return invalid(base, std::string(key) + " must be a string");
  }
  for (const char* key : {"sequential_origin", "max_id_attempts"}) {
    if (!absent_or<std::uint64_t>(obj, key)) {
      return invalid(base, std::string(key) + " must be a non-negative integer");
    }
  }
  if (!absent_or<bool>(obj, "reentrancy_guard")) {
    return invalid(base, "reentrancy_guard must be true or false");
  }

  LedgerConfig c = base;
  if (jsonlite::has_key(obj, "id_scheme")) {
    auto scheme = id_scheme_from_string(jsonlite::get_string(obj, "id_scheme"));
    if (!scheme) return invalid(base, "id_scheme must be \"sequential\" or \"content\"");
    c.id_scheme = *scheme;
  }
  if (jsonlite::has_key(obj, "sequential_origin")) {
    c.sequential_origin = jsonlite::get_u64(obj, "sequential_origin", c.sequential_origin);
  }
  if (jsonlite::has_key(obj, "max_id_attempts")) {
    const auto attempts = jsonlite::get_u64(obj, "max_id_attempts", 0);
    if (attempts > std::numeric_limits<uint32_t>::max()) {
      return invalid(base, "max_id_attempts out of range");
    }
    c.max_id_attempts = static_cast<uint32_t>(attempts);
  }
  c.store_path       = jsonlite::get_string(obj, "store_path", c.store_path);
  c.audit_log_path   = jsonlite::get_string(obj, "audit_log_path", c.audit_log_path);
  c.event_log_path   = jsonlite::get_string(obj, "event_log_path", c.event_log_path);
  c.reentrancy_guard = jsonlite::get_bool(obj, "reentrancy_guard", c.reentrancy_guard);
  return validate(c);
}

ConfigResult config_from_file(const std::string& path, const LedgerConfig& base) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return invalid(base, "cannot read config file: " + path);
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return config_from_json(text, base);
}

ConfigResult apply_env_overrides(const LedgerConfig& base) {
  LedgerConfig c = base;
  if (const char* v = env_value("VESTLOCK_ID_SCHEME")) {
    auto scheme = id_scheme_from_string(v);
    if (!scheme) return invalid(base, std::string("VESTLOCK_ID_SCHEME invalid: ") + v);
    c.id_scheme = *scheme;
  }
  if (const char* v = env_value("VESTLOCK_STORE")) c.store_path = v;
  if (const char* v = env_value("VESTLOCK_AUDIT_LOG")) c.audit_log_path = v;
  if (const char* v = env_value("VESTLOCK_EVENT_LOG")) c.event_log_path = v;
  if (const char* v = env_value("VESTLOCK_REENTRANCY_GUARD")) {
    auto flag = parse_flag(v);
    if (!flag) return invalid(base, std::string("VESTLOCK_REENTRANCY_GUARD invalid: ") + v);
    c.reentrancy_guard = *flag;
  }
  return validate(c);
}

ConfigResult validate(const LedgerConfig& config) {
  if (config.id_scheme == IdScheme::content && config.max_id_attempts == 0) {
    return invalid(config, "max_id_attempts must be > 0 for the content id scheme");
  }
  if (!config.store_path.empty() && config.store_path == config.audit_log_path) {
    return invalid(config, "store_path and audit_log_path must differ");
  }
  if (!config.event_log_path.empty() &&
      (config.event_log_path == config.store_path ||
       config.event_log_path == config.audit_log_path)) {
    return invalid(config, "event_log_path must not share a file with the store or audit log");
  }
  return accepted(config);
}

}  // namespace vestlock
