#include "vestlock/audit.hpp"

#include <fstream>
#include <sstream>

#include "vestlock/hash.hpp"
#include "vestlock/jsonlite.hpp"
#include "vestlock/version.hpp"

namespace vestlock {

namespace {
const std::string kGenesisDigest(64, '0');
}  // namespace

std::string to_string(AuditSeverity s) {
  switch (s) {
    case AuditSeverity::info:     return "info";
    case AuditSeverity::critical: return "critical";
  }
  return "info";
}

std::string audit_record_to_json(const AuditRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"v\":" << version::AUDIT_LOG_VERSION
    << ",\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"operation\":\"" << jsonlite::escape(r.operation) << "\""
    << ",\"lock_id\":\"" << jsonlite::escape(r.lock_id) << "\""
    << ",\"actor\":\"" << jsonlite::escape(r.actor) << "\""
    << ",\"asset\":\"" << jsonlite::escape(r.asset) << "\""
    << ",\"amount\":" << r.amount
    << ",\"ledger_time\":" << r.ledger_time
    << ",\"severity\":\"" << to_string(r.severity) << "\""
    << ",\"error_code\":\"" << jsonlite::escape(r.error_code) << "\""
    << ",\"detail\":\"" << jsonlite::escape(r.detail) << "\""
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

ImmutableAuditLog::ImmutableAuditLog(std::string path)
    : path_(std::move(path)), last_digest_(kGenesisDigest) {
  if (path_.empty()) return;

  // Resume the chain from the last entry of an existing log.
  {
    std::ifstream ifs(path_, std::ios::binary);
    std::string line, last;
    while (std::getline(ifs, line)) {
      if (!line.empty()) last = line;
    }
    if (!last.empty()) {
      std::optional<jsonlite::JsonError> err;
      const auto obj = jsonlite::parse(last, &err);
      if (err || jsonlite::get_u64(obj, "seq", 0) == 0) {
        // Appending would restart the chain at genesis and break it for good.
        open_error_ = "cannot resume audit chain, unreadable last entry in " + path_;
        return;
      }
      seq_ = jsonlite::get_u64(obj, "seq", 0);
      last_digest_ = audit_link_hash(last);
    }
  }
  file_ = std::fopen(path_.c_str(), "a");
  if (!file_) open_error_ = "cannot open audit log: " + path_;
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool ImmutableAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(mu_);
  if (path_.empty()) return true;
  if (!file_) {
    ++failure_count_;
    return false;
  }

  record.sequence = seq_ + 1;
  record.previous_digest = last_digest_;
  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";

  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), file_) == final_line.size();
  if (std::fflush(file_) != 0 || !written) {
    ++failure_count_;
    return false;
  }
  seq_ = record.sequence;
  last_digest_ = audit_link_hash(line);
  ++entry_count_;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entry_count_;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failure_count_;
}

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------

std::string AuditVerifyResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false")
    << ",\"entries\":" << entries
    << ",\"first_bad_sequence\":" << first_bad_sequence
    << ",\"error\":\"" << jsonlite::escape(error) << "\"}";
  return o.str();
}

AuditVerifyResult verify_audit_chain(const std::string& path) {
  AuditVerifyResult r;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    r.error = "cannot open audit log: " + path;
    return r;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) {
      r.first_bad_sequence = expected_seq;
      r.error = "unparseable entry: " + err->message;
      return r;
    }
    if (jsonlite::get_u64(obj, "v", 0) != version::AUDIT_LOG_VERSION) {
      r.first_bad_sequence = expected_seq;
      r.error = "unsupported audit log version";
      return r;
    }
    if (jsonlite::get_u64(obj, "seq", 0) != expected_seq) {
      r.first_bad_sequence = expected_seq;
      r.error = "sequence gap";
      return r;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      r.first_bad_sequence = expected_seq;
      r.error = "chain link mismatch";
      return r;
    }
    expected_prev = audit_link_hash(line);
    ++expected_seq;
    ++r.entries;
  }
  r.ok = true;
  return r;
}

}  // namespace vestlock
