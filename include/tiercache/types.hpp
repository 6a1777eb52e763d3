#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tiercache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;
using TagSet = std::set<std::string>;
using Ttl = std::chrono::milliseconds;

enum class Tier { L1, L2, L3 };

const std::vector<Tier> &all_tiers();
const char *tier_name(Tier tier);
std::optional<Tier> parse_tier(const std::string &name);

struct CacheEntry {
  std::string key;
  Bytes value;
  std::optional<TimePoint> expiry;
  TagSet tags;
  TimePoint created_at{};
  TimePoint last_accessed_at{};
  std::uint64_t access_count{0};

  bool is_expired(TimePoint now) const {
    return expiry.has_value() && now > *expiry;
  }
  void touch(TimePoint now) {
    if (now > last_accessed_at)
      last_accessed_at = now;
    ++access_count;
  }
};

// Zero or absent TTL means the entry never expires.
std::optional<TimePoint> expiry_from_ttl(std::optional<Ttl> ttl, TimePoint now);

std::int64_t to_epoch_ms(TimePoint t);
TimePoint from_epoch_ms(std::int64_t ms);

} // namespace tiercache
