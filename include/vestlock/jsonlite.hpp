#pragma once

// vestlock/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for the configuration file, journal replay and CLI output. Strict:
// duplicate keys, trailing data and NaN/Infinity are rejected.
// Non-negative integers are kept as uint64 so amounts and timestamps round
// trip exactly; anything with a fraction or exponent becomes a double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vestlock::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Parse a JSON object. On failure returns an empty object and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

bool has_key(const Object& obj, const std::string& key);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);

std::string escape(const std::string& s);

}  // namespace vestlock::jsonlite
