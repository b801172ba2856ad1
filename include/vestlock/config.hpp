#pragma once

// vestlock/config.hpp - Ledger configuration.
//
// Precedence (lowest to highest): built-in defaults, JSON config file,
// VESTLOCK_* environment variables.
//
//   key                 env                         default
//   id_scheme           VESTLOCK_ID_SCHEME          "sequential"
//   sequential_origin   -                           0
//   max_id_attempts     -                           64
//   store_path          VESTLOCK_STORE              "" (in-memory)
//   audit_log_path      VESTLOCK_AUDIT_LOG          "" (disabled)
//   event_log_path      VESTLOCK_EVENT_LOG          "" (disabled)
//   reentrancy_guard    VESTLOCK_REENTRANCY_GUARD   true

#include <cstdint>
#include <string>

#include "vestlock/id_deriver.hpp"
#include "vestlock/types.hpp"

namespace vestlock {

struct LedgerConfig {
  IdScheme    id_scheme{IdScheme::sequential};
  uint64_t    sequential_origin{0};
  uint32_t    max_id_attempts{ContentIdDeriver::kDefaultMaxAttempts};
  std::string store_path;
  std::string audit_log_path;
  std::string event_log_path;
  bool        reentrancy_guard{true};

  std::string to_json() const;
};

struct ConfigResult {
  bool         ok{false};
  LedgerConfig config;
  ErrorCode    error{ErrorCode::none};
  std::string  description;
};

// Parse a JSON object over base. Unknown keys are rejected so a typo does not
// silently fall back to a default.
ConfigResult config_from_json(const std::string& json, const LedgerConfig& base = {});

ConfigResult config_from_file(const std::string& path, const LedgerConfig& base = {});

// Apply VESTLOCK_* overrides present in the environment.
ConfigResult apply_env_overrides(const LedgerConfig& base);

// Semantic checks independent of the source.
ConfigResult validate(const LedgerConfig& config);

}  // namespace vestlock
