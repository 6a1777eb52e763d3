#include "tiercache/disk_tier.hpp"

#include "tiercache/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace tiercache {
namespace fs = std::filesystem;
namespace {

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

bool read_file(const fs::path &path, std::string *out, bool *missing,
               std::string *err) {
  *missing = false;
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      *missing = true;
      return false;
    }
    set_err(err, "cannot open " + path.string());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    set_err(err, "read failed " + path.string());
    return false;
  }
  *out = ss.str();
  return true;
}

bool write_file_atomic(const fs::path &path, const std::string &data,
                       std::string *err) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      set_err(err, "cannot create " + tmp.string());
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      set_err(err, "write failed " + tmp.string());
      return false;
    }
  }
  int fd = open(tmp.c_str(), O_RDONLY);
  if (fd < 0) {
    set_err(err, "reopen failed " + tmp.string() + ": " + std::strerror(errno));
    return false;
  }
  const bool synced = fsync(fd) == 0;
  close(fd);
  if (!synced) {
    set_err(err, "fsync failed " + tmp.string());
    return false;
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    set_err(err, "rename " + tmp.string() + ": " + ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool remove_file(const fs::path &path, std::string *err) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    set_err(err, "remove " + path.string() + ": " + ec.message());
    return false;
  }
  return true;
}

} // namespace

DiskTier::DiskTier(DiskTierConfig cfg)
    : cfg_(std::move(cfg)), root_(cfg_.dir) {}

DiskTier::~DiskTier() { stop(); }

fs::path DiskTier::data_path(const std::string &key) const {
  return root_ / "data" / (hash_hex(key) + ".bin");
}

fs::path DiskTier::meta_path(const std::string &key) const {
  return root_ / "meta" / (hash_hex(key) + ".meta");
}

fs::path DiskTier::tag_path(const std::string &tag) const {
  return root_ / "tags" / (hash_hex(tag) + ".tag");
}

bool DiskTier::init(std::string *err) {
  std::error_code ec;
  for (const char *sub : {"data", "meta", "tags"}) {
    fs::create_directories(root_ / sub, ec);
    if (ec) {
      set_err(err, "l3 directory " + (root_ / sub).string() + ": " +
                       ec.message());
      return false;
    }
  }
  const auto marker = root_ / ".writable";
  std::string e;
  if (!write_file_atomic(marker, "ok", &e)) {
    set_err(err, "l3 directory not writable: " + e);
    return false;
  }
  remove_file(marker, nullptr);

  {
    std::lock_guard lock(sweep_mu_);
    stopping_ = false;
  }
  if (cfg_.sweep_interval.count() > 0 && !sweeper_.joinable()) {
    sweeper_ = std::thread([this] { sweep_loop(); });
  }
  logger()->info("l3 ready dir={} sweep_interval_ms={}", root_.string(),
                 cfg_.sweep_interval.count());
  return true;
}

void DiskTier::stop() {
  {
    std::lock_guard lock(sweep_mu_);
    stopping_ = true;
  }
  sweep_cv_.notify_all();
  if (sweeper_.joinable())
    sweeper_.join();
}

bool DiskTier::sweeping() const { return sweeper_.joinable(); }

bool DiskTier::stop_requested() {
  std::lock_guard lock(sweep_mu_);
  return stopping_;
}

DiskTierStats DiskTier::stats() const {
  std::lock_guard lock(mu_);
  return stats_;
}

void DiskTier::sweep_loop() {
  std::unique_lock lock(sweep_mu_);
  while (!stopping_) {
    if (sweep_cv_.wait_for(lock, cfg_.sweep_interval,
                           [this] { return stopping_; }))
      break;
    lock.unlock();
    sweep_expired();
    lock.lock();
  }
}

DiskTier::MetaRead DiskTier::read_meta_locked(const fs::path &path,
                                              EntryMeta *out,
                                              std::string *err) const {
  std::string text;
  bool missing = false;
  if (!read_file(path, &text, &missing, err))
    return missing ? MetaRead::Missing : MetaRead::Corrupt;
  if (!decode_meta(text, out, err))
    return MetaRead::Corrupt;
  return MetaRead::Found;
}

std::optional<CacheEntry> DiskTier::get(const std::string &key,
                                        std::string *err) {
  std::lock_guard lock(mu_);
  EntryMeta meta;
  std::string e;
  switch (read_meta_locked(meta_path(key), &meta, &e)) {
  case MetaRead::Missing:
    return std::nullopt;
  case MetaRead::Corrupt:
    logger()->warn("l3 unreadable metadata key={} err={}", key, e);
    set_err(err, e);
    return std::nullopt;
  case MetaRead::Found:
    break;
  }
  if (meta.key != key)
    return std::nullopt;

  const auto now = Clock::now();
  const auto now_ms = to_epoch_ms(now);
  if (meta.is_expired(now_ms)) {
    if (!remove_entry_locked(key, meta, &e))
      logger()->warn("l3 expired entry cleanup failed key={} err={}", key, e);
    return std::nullopt;
  }

  std::string blob;
  bool missing = false;
  if (!read_file(data_path(key), &blob, &missing, &e)) {
    if (missing)
      return std::nullopt;
    logger()->warn("l3 read failed key={} err={}", key, e);
    set_err(err, e);
    return std::nullopt;
  }
  CacheEntry entry;
  entry.key = key;
  if (!decode_value(blob, &entry.value, &e)) {
    logger()->error("l3 corrupt value key={} err={}", key, e);
    set_err(err, "l3 serialization: " + e);
    return std::nullopt;
  }

  meta.accessed_at_ms = std::max(meta.accessed_at_ms, now_ms);
  ++meta.access_count;
  if (!write_file_atomic(meta_path(key), encode_meta(meta), &e))
    logger()->warn("l3 metadata update failed key={} err={}", key, e);

  entry.tags = meta.tags;
  entry.created_at = from_epoch_ms(meta.created_at_ms);
  entry.last_accessed_at = from_epoch_ms(meta.accessed_at_ms);
  entry.access_count = meta.access_count;
  if (meta.expiry_ms >= 0)
    entry.expiry = from_epoch_ms(meta.expiry_ms);
  return entry;
}

bool DiskTier::set(const std::string &key, const Bytes &value,
                   std::optional<Ttl> ttl, const TagSet &tags,
                   std::string *err) {
  if (key.empty()) {
    set_err(err, "empty key");
    return false;
  }
  std::lock_guard lock(mu_);
  std::string e;
  TagSet old_tags;
  EntryMeta old;
  if (read_meta_locked(meta_path(key), &old, nullptr) == MetaRead::Found &&
      old.key == key)
    old_tags = old.tags;

  const auto now = Clock::now();
  EntryMeta meta;
  meta.key = key;
  meta.tags = tags;
  meta.created_at_ms = to_epoch_ms(now);
  meta.accessed_at_ms = meta.created_at_ms;
  if (auto expiry = expiry_from_ttl(ttl, now))
    meta.expiry_ms = to_epoch_ms(*expiry);

  if (!write_file_atomic(data_path(key), encode_value(value), &e) ||
      !write_file_atomic(meta_path(key), encode_meta(meta), &e)) {
    logger()->warn("l3 set failed key={} err={}", key, e);
    set_err(err, e);
    return false;
  }
  for (const auto &t : tags) {
    if (!add_to_tag_locked(t, key, &e)) {
      logger()->warn("l3 tag index update failed tag={} key={} err={}", t, key,
                     e);
      set_err(err, e);
      return false;
    }
  }
  for (const auto &t : old_tags) {
    if (tags.contains(t))
      continue;
    if (!remove_from_tag_locked(t, key, &e))
      logger()->warn("l3 stale tag cleanup failed tag={} key={} err={}", t,
                     key, e);
  }
  return true;
}

bool DiskTier::del(const std::string &key, std::string *err) {
  std::lock_guard lock(mu_);
  EntryMeta meta;
  std::string e;
  switch (read_meta_locked(meta_path(key), &meta, &e)) {
  case MetaRead::Missing:
    return false;
  case MetaRead::Corrupt:
    logger()->warn("l3 del of entry with unreadable metadata key={} err={}",
                   key, e);
    meta = EntryMeta{};
    meta.key = key;
    break;
  case MetaRead::Found:
    if (meta.key != key)
      return false;
    break;
  }
  if (!remove_entry_locked(key, meta, &e)) {
    logger()->warn("l3 del failed key={} err={}", key, e);
    set_err(err, e);
    return false;
  }
  return true;
}

bool DiskTier::remove_entry_locked(const std::string &key,
                                   const EntryMeta &meta, std::string *err) {
  std::string e;
  for (const auto &t : meta.tags)
    if (!remove_from_tag_locked(t, key, &e))
      logger()->warn("l3 tag index cleanup failed tag={} key={} err={}", t,
                     key, e);
  return remove_file(data_path(key), err) && remove_file(meta_path(key), err);
}

bool DiskTier::read_tag_locked(const std::string &tag,
                               std::vector<std::string> *keys,
                               std::string *err) const {
  keys->clear();
  std::string text;
  bool missing = false;
  if (!read_file(tag_path(tag), &text, &missing, err))
    return missing;
  return decode_key_list(text, keys, err);
}

bool DiskTier::add_to_tag_locked(const std::string &tag, const std::string &key,
                                 std::string *err) {
  std::vector<std::string> keys;
  if (!read_tag_locked(tag, &keys, err))
    return false;
  if (std::find(keys.begin(), keys.end(), key) != keys.end())
    return true;
  keys.push_back(key);
  return write_file_atomic(tag_path(tag), encode_key_list(keys), err);
}

bool DiskTier::remove_from_tag_locked(const std::string &tag,
                                      const std::string &key,
                                      std::string *err) {
  std::vector<std::string> keys;
  if (!read_tag_locked(tag, &keys, err))
    return false;
  auto it = std::find(keys.begin(), keys.end(), key);
  if (it == keys.end())
    return true;
  keys.erase(it);
  if (keys.empty())
    return remove_file(tag_path(tag), err);
  return write_file_atomic(tag_path(tag), encode_key_list(keys), err);
}

std::size_t DiskTier::invalidate_by_tag(const std::string &tag,
                                        std::string *err) {
  std::lock_guard lock(mu_);
  std::string e;
  std::vector<std::string> keys;
  if (!read_tag_locked(tag, &keys, &e)) {
    logger()->warn("l3 invalidate tag={} failed err={}", tag, e);
    set_err(err, e);
    return 0;
  }
  std::size_t removed = 0;
  for (const auto &k : keys) {
    EntryMeta meta;
    // Stale members and digest collisions with another tag are skipped.
    if (read_meta_locked(meta_path(k), &meta, nullptr) != MetaRead::Found ||
        meta.key != k || !meta.tags.contains(tag))
      continue;
    if (remove_entry_locked(k, meta, &e)) {
      ++removed;
    } else {
      logger()->warn("l3 invalidate tag={} key={} failed err={}", tag, k, e);
      set_err(err, e);
    }
  }
  if (!remove_file(tag_path(tag), &e)) {
    logger()->warn("l3 drop tag index tag={} failed err={}", tag, e);
    set_err(err, e);
  }
  return removed;
}

std::vector<fs::path> DiskTier::list_meta_files_locked(std::string *err) const {
  std::vector<fs::path> out;
  std::error_code ec;
  for (fs::directory_iterator it(root_ / "meta", ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() == ".meta")
      out.push_back(it->path());
  }
  if (ec)
    set_err(err, "l3 list " + (root_ / "meta").string() + ": " + ec.message());
  return out;
}

std::size_t DiskTier::invalidate_by_prefix(const std::string &prefix,
                                           std::string *err) {
  std::lock_guard lock(mu_);
  std::string e;
  const auto files = list_meta_files_locked(&e);
  if (!e.empty()) {
    logger()->warn("l3 invalidate prefix={} failed err={}", prefix, e);
    set_err(err, e);
  }
  std::size_t removed = 0;
  for (const auto &path : files) {
    EntryMeta meta;
    if (read_meta_locked(path, &meta, &e) != MetaRead::Found ||
        !meta.key.starts_with(prefix))
      continue;
    if (remove_entry_locked(meta.key, meta, &e)) {
      ++removed;
    } else {
      logger()->warn("l3 invalidate prefix={} key={} failed err={}", prefix,
                     meta.key, e);
      set_err(err, e);
    }
  }
  return removed;
}

bool DiskTier::clear(std::string *err) {
  std::lock_guard lock(mu_);
  std::error_code ec;
  for (const char *sub : {"data", "meta", "tags"}) {
    const auto dir = root_ / sub;
    fs::remove_all(dir, ec);
    if (!ec)
      fs::create_directories(dir, ec);
    if (ec) {
      logger()->error("l3 clear failed dir={} err={}", dir.string(),
                      ec.message());
      set_err(err, ec.message());
      return false;
    }
  }
  return true;
}

std::size_t DiskTier::sweep_expired() {
  std::vector<fs::path> files;
  {
    std::lock_guard lock(mu_);
    std::string e;
    files = list_meta_files_locked(&e);
    if (!e.empty())
      logger()->warn("l3 sweep listing failed err={}", e);
  }
  const auto now_ms = to_epoch_ms(Clock::now());
  std::size_t removed = 0;
  for (const auto &path : files) {
    if (stop_requested()) {
      logger()->debug("l3 sweep cancelled removed={}", removed);
      break;
    }
    std::lock_guard lock(mu_);
    EntryMeta meta;
    std::string e;
    const auto r = read_meta_locked(path, &meta, &e);
    if (r == MetaRead::Missing)
      continue;
    if (r == MetaRead::Corrupt) {
      logger()->warn("l3 sweep skipped {} err={}", path.string(), e);
      continue;
    }
    if (!meta.is_expired(now_ms))
      continue;
    if (remove_entry_locked(meta.key, meta, &e))
      ++removed;
    else
      logger()->warn("l3 sweep failed key={} err={}", meta.key, e);
  }
  {
    std::lock_guard lock(mu_);
    ++stats_.sweeps;
    stats_.swept += removed;
  }
  if (removed > 0)
    logger()->info("l3 sweep removed={}", removed);
  else
    logger()->debug("l3 sweep removed=0 scanned={}", files.size());
  return removed;
}

} // namespace tiercache
