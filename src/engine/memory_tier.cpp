#include "tiercache/memory_tier.hpp"

#include "tiercache/log.hpp"

#include <mutex>
#include <stdexcept>

namespace tiercache {

MemoryTier::MemoryTier(MemoryTierConfig cfg)
    : cfg_(std::move(cfg)), policy_(make_policy(cfg_.strategy)) {
  if (cfg_.capacity == 0)
    throw std::invalid_argument("l1 capacity must be positive");
}

std::optional<CacheEntry> MemoryTier::get(const std::string &key,
                                          std::string *) {
  std::unique_lock lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  const auto now = Clock::now();
  if (it->second.is_expired(now)) {
    erase_locked(key);
    ++stats_.expirations;
    ++stats_.misses;
    return std::nullopt;
  }
  it->second.touch(now);
  policy_->on_access(key);
  ++stats_.hits;
  return it->second;
}

bool MemoryTier::set(const std::string &key, const Bytes &value,
                     std::optional<Ttl> ttl, const TagSet &tags,
                     std::string *err) {
  if (key.empty()) {
    if (err)
      *err = "empty key";
    return false;
  }
  const auto now = Clock::now();
  CacheEntry entry;
  entry.key = key;
  entry.value = value;
  entry.expiry = expiry_from_ttl(ttl, now);
  entry.tags = tags;
  entry.created_at = now;
  entry.last_accessed_at = now;

  std::unique_lock lock(mu_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    deindex_tags_locked(key, it->second.tags);
    it->second = std::move(entry);
    policy_->on_overwrite(key);
  } else {
    if (entries_.size() >= cfg_.capacity)
      evict_for_insert_locked(now);
    entries_.emplace(key, std::move(entry));
    policy_->on_insert(key);
  }
  index_tags_locked(key, tags);
  return true;
}

bool MemoryTier::del(const std::string &key, std::string *) {
  std::unique_lock lock(mu_);
  return erase_locked(key);
}

std::size_t MemoryTier::invalidate_by_tag(const std::string &tag,
                                          std::string *) {
  std::unique_lock lock(mu_);
  auto it = tag_index_.find(tag);
  if (it == tag_index_.end())
    return 0;
  const std::vector<std::string> keys(it->second.begin(), it->second.end());
  std::size_t removed = 0;
  for (const auto &k : keys)
    if (erase_locked(k))
      ++removed;
  return removed;
}

std::size_t MemoryTier::invalidate_by_prefix(const std::string &prefix,
                                             std::string *) {
  std::unique_lock lock(mu_);
  std::vector<std::string> keys;
  for (const auto &[k, _] : entries_)
    if (k.starts_with(prefix))
      keys.push_back(k);
  std::size_t removed = 0;
  for (const auto &k : keys)
    if (erase_locked(k))
      ++removed;
  return removed;
}

bool MemoryTier::clear(std::string *) {
  std::unique_lock lock(mu_);
  entries_.clear();
  tag_index_.clear();
  policy_->clear();
  return true;
}

std::size_t MemoryTier::size() const {
  std::shared_lock lock(mu_);
  return entries_.size();
}

std::vector<std::string> MemoryTier::keys() const {
  std::shared_lock lock(mu_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[k, _] : entries_)
    out.push_back(k);
  return out;
}

TagSet MemoryTier::tags_of(const std::string &key) const {
  std::shared_lock lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return {};
  return it->second.tags;
}

std::unordered_set<std::string>
MemoryTier::tagged_keys(const std::string &tag) const {
  std::shared_lock lock(mu_);
  auto it = tag_index_.find(tag);
  if (it == tag_index_.end())
    return {};
  return it->second;
}

MemoryTierStats MemoryTier::stats() const {
  std::shared_lock lock(mu_);
  return stats_;
}

std::string MemoryTier::policy_name() const { return policy_->name(); }

bool MemoryTier::erase_locked(const std::string &key) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  deindex_tags_locked(key, it->second.tags);
  policy_->on_erase(key);
  entries_.erase(it);
  return true;
}

void MemoryTier::index_tags_locked(const std::string &key, const TagSet &tags) {
  for (const auto &t : tags)
    tag_index_[t].insert(key);
}

void MemoryTier::deindex_tags_locked(const std::string &key,
                                     const TagSet &tags) {
  for (const auto &t : tags) {
    auto it = tag_index_.find(t);
    if (it == tag_index_.end())
      continue;
    it->second.erase(key);
    if (it->second.empty())
      tag_index_.erase(it);
  }
}

void MemoryTier::evict_for_insert_locked(TimePoint now) {
  std::vector<std::string> expired;
  for (const auto &[k, e] : entries_)
    if (e.is_expired(now))
      expired.push_back(k);
  for (const auto &k : expired) {
    erase_locked(k);
    ++stats_.expirations;
  }

  std::size_t safety = entries_.size() + 1;
  while (entries_.size() >= cfg_.capacity && safety-- > 0) {
    auto victim = policy_->pick_victim();
    if (!victim.has_value())
      break;
    if (!erase_locked(*victim)) {
      // Ordering and map disagree; drop the stale position and keep going.
      policy_->on_erase(*victim);
      continue;
    }
    ++stats_.evictions;
    logger()->debug("l1 evicted key={} policy={}", *victim, policy_->name());
  }
}

} // namespace tiercache
