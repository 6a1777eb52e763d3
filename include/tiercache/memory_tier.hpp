#pragma once

#include "tiercache/policy.hpp"
#include "tiercache/tier_store.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tiercache {

struct MemoryTierConfig {
  std::size_t capacity{10000};
  std::optional<Ttl> default_ttl{Ttl(600 * 1000)};
  EvictionStrategy strategy{EvictionStrategy::Lru};
};

struct MemoryTierStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

// L1: bounded in-process map. Values are held as-is, no serialization.
class MemoryTier final : public TierStore {
public:
  // Throws std::invalid_argument when capacity is zero.
  explicit MemoryTier(MemoryTierConfig cfg);

  Tier tier() const override { return Tier::L1; }
  std::optional<Ttl> default_ttl() const override { return cfg_.default_ttl; }

  std::optional<CacheEntry> get(const std::string &key,
                                std::string *err = nullptr) override;
  bool set(const std::string &key, const Bytes &value, std::optional<Ttl> ttl,
           const TagSet &tags, std::string *err = nullptr) override;
  bool del(const std::string &key, std::string *err = nullptr) override;
  std::size_t invalidate_by_tag(const std::string &tag,
                                std::string *err = nullptr) override;
  std::size_t invalidate_by_prefix(const std::string &prefix,
                                   std::string *err = nullptr) override;
  bool clear(std::string *err = nullptr) override;

  std::size_t size() const;
  std::size_t capacity() const { return cfg_.capacity; }
  std::vector<std::string> keys() const;
  TagSet tags_of(const std::string &key) const;
  std::unordered_set<std::string> tagged_keys(const std::string &tag) const;
  MemoryTierStats stats() const;
  std::string policy_name() const;

private:
  bool erase_locked(const std::string &key);
  void index_tags_locked(const std::string &key, const TagSet &tags);
  void deindex_tags_locked(const std::string &key, const TagSet &tags);
  void evict_for_insert_locked(TimePoint now);

  MemoryTierConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::unordered_map<std::string, CacheEntry> entries_;
  std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;
  MemoryTierStats stats_;
  mutable std::shared_mutex mu_;
};

} // namespace tiercache
