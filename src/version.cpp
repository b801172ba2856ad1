#include "vestlock/version.hpp"

#include <sstream>

namespace vestlock {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.ledger_semver   = LEDGER_SEMVER;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"store_format\":" << m.store_format
    << ",\"id_scheme\":" << m.id_scheme
    << ",\"audit_log\":" << m.audit_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"ledger_semver\":\"" << m.ledger_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace vestlock
