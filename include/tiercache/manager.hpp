#pragma once

#include "tiercache/config.hpp"
#include "tiercache/tier_store.hpp"

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tiercache {

using TtlMap = std::map<Tier, Ttl>;

struct TierStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t promotions{0};
  std::uint64_t failures{0};
};

// Front door over L1/L2/L3. Reads walk the tiers fastest first and copy a hit
// into every faster tier; writes, deletes and invalidations fan out to the
// requested tiers. Tier failures are logged and aggregated, never thrown.
class CacheManager {
public:
  // Builds and starts the configured tiers. Throws std::invalid_argument for
  // a bad L1 configuration and std::runtime_error when L2 or L3 cannot start
  // and allow_degraded is off.
  explicit CacheManager(ManagerConfig cfg);
  // Takes ready-to-use stores; a null store means the tier is not configured.
  CacheManager(std::unique_ptr<TierStore> l1, std::unique_ptr<TierStore> l2,
               std::unique_ptr<TierStore> l3);
  ~CacheManager();

  CacheManager(const CacheManager &) = delete;
  CacheManager &operator=(const CacheManager &) = delete;

  // With a tier given only that tier is consulted and nothing is promoted.
  std::optional<Bytes> get(const std::string &key,
                           std::optional<Tier> tier = std::nullopt);
  // TTLs missing from ttls fall back to each tier's default.
  bool set(const std::string &key, const Bytes &value, const TtlMap &ttls = {},
           const TagSet &tags = {},
           const std::vector<Tier> &tiers = all_tiers());
  bool del(const std::string &key,
           const std::vector<Tier> &tiers = all_tiers());
  std::size_t invalidate_by_tag(const std::string &tag,
                                const std::vector<Tier> &tiers = all_tiers());
  std::size_t
  invalidate_by_prefix(const std::string &prefix,
                       const std::vector<Tier> &tiers = all_tiers());
  bool clear(const std::vector<Tier> &tiers = all_tiers());

  // Stops background work. Safe to call more than once.
  void shutdown();

  bool configured(Tier tier) const;
  bool tier_up(Tier tier) const;
  TierStats stats(Tier tier) const;
  std::string info() const;

private:
  struct Counters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> promotions{0};
    std::atomic<std::uint64_t> failures{0};
  };
  struct Slot {
    std::unique_ptr<TierStore> store;
    bool up{false};
    Counters counters;
  };

  Slot &slot(Tier tier) { return slots_[static_cast<std::size_t>(tier)]; }
  const Slot &slot(Tier tier) const {
    return slots_[static_cast<std::size_t>(tier)];
  }
  void install(Tier tier, std::unique_ptr<TierStore> store);
  std::optional<CacheEntry> read_tier(Tier tier, const std::string &key);
  void promote(const CacheEntry &entry, Tier into);

  std::array<Slot, 3> slots_;
  std::once_flag shutdown_once_;
};

} // namespace tiercache
