#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "vestlock/audit.hpp"
#include "vestlock/hash.hpp"
#include "vestlock/jsonlite.hpp"
#include "vestlock/lock_store.hpp"
#include "vestlock/valuation.hpp"
#include "vestlock/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

std::optional<std::string> flag_value(int argc, char **argv, const std::string &name) {
  for (int i = 2; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == name)
      return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

std::optional<uint64_t> parse_u64(const std::string &s) {
  uint64_t v = 0;
  const char *end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (s.empty() || ec != std::errc() || ptr != end)
    return std::nullopt;
  return v;
}

std::optional<uint64_t> u64_flag(int argc, char **argv, const std::string &name) {
  auto raw = flag_value(argc, argv, name);
  if (!raw)
    return std::nullopt;
  return parse_u64(*raw);
}

int usage(const std::string &why) {
  std::cerr << "{\"error\":\"usage\",\"detail\":\"" << vestlock::jsonlite::escape(why)
            << "\"}\n";
  return kExitUsage;
}

int failure(vestlock::ErrorCode code, const std::string &detail) {
  std::cerr << "{\"error\":\"" << vestlock::to_string(code) << "\",\"detail\":\""
            << vestlock::jsonlite::escape(detail) << "\"}\n";
  return kExitFailed;
}

// Record JSON with the vested value appended when a valuation time is given.
std::string lock_view(const vestlock::LockRecord &r, std::optional<uint64_t> now) {
  std::string out = vestlock::lock_record_to_json(r);
  if (!now)
    return out;
  std::ostringstream extra;
  extra << ",\"now\":" << *now << ",\"vested\":" << vestlock::vested_value(r, *now)
        << ",\"matured\":" << (vestlock::is_matured(r, *now) ? "true" : "false");
  out.insert(out.size() - 1, extra.str());
  return out;
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (vestlock::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (vestlock::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

// Existing journals only; a mistyped path must not create an empty store.
int open_store(vestlock::JournalLockStore &store) {
  std::string detail;
  const auto rc = store.open(&detail, false);
  if (rc != vestlock::ErrorCode::none)
    return failure(rc, detail);
  return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return usage("missing command");
  const std::string cmd = argv[1];

  if (cmd == "health") {
    const auto h = vestlock::hash_runtime_info();
    const bool vectors_ok = verify_hash_vectors();
    std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"hash_vectors_ok\":" << (vectors_ok ? "true" : "false")
              << ",\"store_backends\":[\"memory\",\"journal\"]"
              << ",\"id_schemes\":[\"sequential\",\"content\"]"
              << "}\n";
    return vectors_ok ? kExitOk : kExitFailed;
  }

  if (cmd == "version") {
    std::cout << vestlock::version::manifest_to_json(vestlock::version::current_manifest())
              << "\n";
    return kExitOk;
  }

  if (cmd == "value") {
    const auto amount = u64_flag(argc, argv, "--amount");
    const auto created = u64_flag(argc, argv, "--created");
    const auto duration = u64_flag(argc, argv, "--duration");
    const auto now = u64_flag(argc, argv, "--now");
    if (!amount || !created || !duration || !now)
      return usage("value requires --amount --created --duration --now as unsigned integers");
    if (!vestlock::maturity_fits(*created, *duration))
      return failure(vestlock::ErrorCode::invalid_duration, "created + duration overflows");

    vestlock::LockRecord r;
    r.amount = *amount;
    r.created_at = *created;
    r.duration = *duration;
    std::cout << "{\"amount\":" << r.amount << ",\"created_at\":" << r.created_at
              << ",\"duration\":" << r.duration << ",\"maturity\":" << r.maturity()
              << ",\"now\":" << *now << ",\"vested\":" << vestlock::vested_value(r, *now)
              << ",\"matured\":" << (vestlock::is_matured(r, *now) ? "true" : "false")
              << "}\n";
    return kExitOk;
  }

  if (cmd == "list" || cmd == "show") {
    const auto path = flag_value(argc, argv, "--store");
    if (!path)
      return usage(cmd + " requires --store PATH");
    std::optional<uint64_t> now;
    if (flag_value(argc, argv, "--now")) {
      now = u64_flag(argc, argv, "--now");
      if (!now)
        return usage("--now must be an unsigned integer");
    }

    vestlock::JournalLockStore store(*path);
    if (int rc = open_store(store); rc != kExitOk)
      return rc;

    if (cmd == "show") {
      const auto id = flag_value(argc, argv, "--id");
      if (!id)
        return usage("show requires --id ID");
      const auto rec = store.get(*id);
      if (!rec)
        return failure(vestlock::ErrorCode::not_found, "no active lock with id " + *id);
      std::cout << lock_view(*rec, now) << "\n";
      return kExitOk;
    }

    const auto records = store.list_active();
    std::cout << "{\"backend\":\"" << store.backend_id() << "\",\"count\":" << records.size()
              << ",\"locks\":[";
    for (size_t i = 0; i < records.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << lock_view(records[i], now);
    }
    std::cout << "]}\n";
    return kExitOk;
  }

  if (cmd == "audit-verify") {
    const auto log = flag_value(argc, argv, "--log");
    if (!log)
      return usage("audit-verify requires --log PATH");
    const auto result = vestlock::verify_audit_chain(*log);
    std::cout << result.to_json() << "\n";
    return result.ok ? kExitOk : kExitFailed;
  }

  if (cmd == "compact") {
    const auto path = flag_value(argc, argv, "--store");
    if (!path)
      return usage("compact requires --store PATH");
    vestlock::JournalLockStore store(*path);
    if (int rc = open_store(store); rc != kExitOk)
      return rc;
    const auto rc = store.compact();
    if (rc != vestlock::ErrorCode::none)
      return failure(rc, "journal rewrite failed: " + *path);
    std::cout << "{\"ok\":true,\"live\":" << store.size() << "}\n";
    return kExitOk;
  }

  return usage("unknown command: " + cmd);
}
