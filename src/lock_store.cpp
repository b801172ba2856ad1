#include "vestlock/lock_store.hpp"

// Both backends keep live records and retired ids in separate containers so
// that a removed id can never be read back as a lock (invariant 2) and can
// never be created again (invariant 1).

#include <filesystem>
#include <fstream>
#include <random>

#include "vestlock/jsonlite.hpp"
#include "vestlock/version.hpp"

namespace fs = std::filesystem;

namespace vestlock {

namespace {

std::string make_tmp_name(const fs::path &dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the target directory, then rename into place.
bool atomic_write(const fs::path &target, const std::string &data) {
  const fs::path dir =
      target.has_parent_path() ? target.parent_path() : fs::path(".");
  std::error_code ec;
  fs::create_directories(dir, ec);
  const std::string tmp = make_tmp_name(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string create_line(const LockRecord &r) {
  return "{\"v\":" + std::to_string(version::STORE_FORMAT_VERSION) +
         ",\"op\":\"create\",\"id\":\"" + jsonlite::escape(r.id) +
         "\",\"owner\":\"" + jsonlite::escape(r.owner) + "\",\"asset\":\"" +
         jsonlite::escape(asset_to_string(r.asset)) +
         "\",\"amount\":" + std::to_string(r.amount) +
         ",\"created_at\":" + std::to_string(r.created_at) +
         ",\"duration\":" + std::to_string(r.duration) + "}\n";
}

std::string id_line(const char *op, const LockId &id) {
  return "{\"v\":" + std::to_string(version::STORE_FORMAT_VERSION) +
         ",\"op\":\"" + op + "\",\"id\":\"" + jsonlite::escape(id) + "\"}\n";
}

} // namespace

// ---------------------------------------------------------------------------
// MemoryLockStore
// ---------------------------------------------------------------------------

ErrorCode MemoryLockStore::create(const LockId &id, const LockRecord &record) {
  std::lock_guard<std::mutex> lk(mu_);
  if (live_.count(id) || retired_.count(id))
    return ErrorCode::duplicate_id;
  LockRecord stored = record;
  stored.id = id;
  stored.state = LockState::active;
  live_.emplace(id, std::move(stored));
  return ErrorCode::none;
}

std::optional<LockRecord> MemoryLockStore::get(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = live_.find(id);
  if (it == live_.end())
    return std::nullopt;
  return it->second;
}

ErrorCode MemoryLockStore::remove(const LockId &id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = live_.find(id);
  if (it == live_.end())
    return ErrorCode::not_found;
  live_.erase(it);
  retired_.insert(id);
  return ErrorCode::none;
}

bool MemoryLockStore::contains(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(id) != 0;
}

bool MemoryLockStore::ever_issued(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(id) != 0 || retired_.count(id) != 0;
}

std::vector<LockRecord> MemoryLockStore::list_active() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LockRecord> out;
  out.reserve(live_.size());
  for (const auto &[id, rec] : live_)
    out.push_back(rec);
  return out;
}

std::size_t MemoryLockStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.size();
}

// ---------------------------------------------------------------------------
// JournalLockStore
// ---------------------------------------------------------------------------

JournalLockStore::JournalLockStore(std::string path) : path_(std::move(path)) {}

JournalLockStore::~JournalLockStore() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

ErrorCode JournalLockStore::open(std::string *detail, bool create_if_missing) {
  std::lock_guard<std::mutex> lk(mu_);
  auto fail = [&](const std::string &why) {
    if (detail)
      *detail = why;
    live_.clear();
    retired_.clear();
    return ErrorCode::store_io_failed;
  };

  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  live_.clear();
  retired_.clear();

  const bool present = fs::exists(path_);
  if (!present && !create_if_missing)
    return fail("no journal at " + path_);
  if (present) {
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
      return fail("cannot read journal: " + path_);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(ifs, line)) {
      ++line_no;
      if (line.empty())
        continue;
      const std::string where = "journal line " + std::to_string(line_no);

      std::optional<jsonlite::JsonError> err;
      const auto obj = jsonlite::parse(line, &err);
      if (err)
        return fail(where + ": " + err->message);
      if (jsonlite::get_u64(obj, "v", 0) != version::STORE_FORMAT_VERSION)
        return fail(where + ": unsupported store format version");

      const std::string op = jsonlite::get_string(obj, "op");
      const LockId id = jsonlite::get_string(obj, "id");
      if (id.empty())
        return fail(where + ": missing id");

      if (op == "create") {
        if (live_.count(id) || retired_.count(id))
          return fail(where + ": id created twice: " + id);
        auto asset = asset_from_string(jsonlite::get_string(obj, "asset"));
        if (!asset)
          return fail(where + ": invalid asset");
        LockRecord r;
        r.id = id;
        r.owner = jsonlite::get_string(obj, "owner");
        r.asset = *asset;
        r.amount = jsonlite::get_u64(obj, "amount", 0);
        r.created_at = jsonlite::get_u64(obj, "created_at", 0);
        r.duration = jsonlite::get_u64(obj, "duration", 0);
        if (r.owner.empty() || r.amount == 0 ||
            !maturity_fits(r.created_at, r.duration))
          return fail(where + ": invalid lock record");
        live_.emplace(id, std::move(r));
      } else if (op == "remove") {
        if (live_.erase(id) == 0)
          return fail(where + ": remove of unknown id: " + id);
        retired_.insert(id);
      } else if (op == "retire") {
        if (live_.count(id))
          return fail(where + ": retire of live id: " + id);
        retired_.insert(id);
      } else {
        return fail(where + ": unknown op '" + op + "'");
      }
    }
  }

  std::error_code ec;
  const fs::path p(path_);
  if (p.has_parent_path())
    fs::create_directories(p.parent_path(), ec);
  file_ = std::fopen(path_.c_str(), "a");
  if (!file_)
    return fail("cannot open journal for append: " + path_);
  return ErrorCode::none;
}

bool JournalLockStore::append_line(const std::string &line) {
  if (!file_)
    return false;
  std::error_code ec;
  const auto offset = fs::file_size(path_, ec);
  if (ec)
    return false;
  const bool written =
      std::fwrite(line.data(), 1, line.size(), file_) == line.size();
  if (std::fflush(file_) == 0 && written)
    return true;

  // Cut the torn tail so the next append starts on a line boundary. The
  // stream is closed first because stdio may still hold unwritten bytes.
  std::fclose(file_);
  file_ = nullptr;
  fs::resize_file(path_, offset, ec);
  if (!ec)
    file_ = std::fopen(path_.c_str(), "a");
  return false;
}

ErrorCode JournalLockStore::create(const LockId &id, const LockRecord &record) {
  std::lock_guard<std::mutex> lk(mu_);
  if (live_.count(id) || retired_.count(id))
    return ErrorCode::duplicate_id;
  LockRecord stored = record;
  stored.id = id;
  stored.state = LockState::active;
  if (!append_line(create_line(stored)))
    return ErrorCode::store_io_failed;
  live_.emplace(id, std::move(stored));
  return ErrorCode::none;
}

std::optional<LockRecord> JournalLockStore::get(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = live_.find(id);
  if (it == live_.end())
    return std::nullopt;
  return it->second;
}

ErrorCode JournalLockStore::remove(const LockId &id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = live_.find(id);
  if (it == live_.end())
    return ErrorCode::not_found;
  if (!append_line(id_line("remove", id)))
    return ErrorCode::store_io_failed;
  live_.erase(it);
  retired_.insert(id);
  return ErrorCode::none;
}

bool JournalLockStore::contains(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(id) != 0;
}

bool JournalLockStore::ever_issued(const LockId &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(id) != 0 || retired_.count(id) != 0;
}

std::vector<LockRecord> JournalLockStore::list_active() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LockRecord> out;
  out.reserve(live_.size());
  for (const auto &[id, rec] : live_)
    out.push_back(rec);
  return out;
}

std::size_t JournalLockStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.size();
}

ErrorCode JournalLockStore::compact() {
  std::lock_guard<std::mutex> lk(mu_);
  std::string data;
  for (const auto &id : retired_)
    data += id_line("retire", id);
  for (const auto &[id, rec] : live_)
    data += create_line(rec);

  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  const bool ok = atomic_write(path_, data);
  // Reopen whichever journal is now in place; the index is unchanged either way.
  file_ = std::fopen(path_.c_str(), "a");
  if (!ok || !file_)
    return ErrorCode::store_io_failed;
  return ErrorCode::none;
}

} // namespace vestlock
