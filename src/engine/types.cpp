#include "tiercache/types.hpp"

#include <algorithm>
#include <cctype>

namespace tiercache {

const std::vector<Tier> &all_tiers() {
  static const std::vector<Tier> tiers{Tier::L1, Tier::L2, Tier::L3};
  return tiers;
}

const char *tier_name(Tier tier) {
  switch (tier) {
  case Tier::L1:
    return "l1";
  case Tier::L2:
    return "l2";
  case Tier::L3:
    return "l3";
  }
  return "unknown";
}

std::optional<Tier> parse_tier(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "l1")
    return Tier::L1;
  if (lower == "l2")
    return Tier::L2;
  if (lower == "l3")
    return Tier::L3;
  return std::nullopt;
}

std::optional<TimePoint> expiry_from_ttl(std::optional<Ttl> ttl, TimePoint now) {
  if (!ttl.has_value() || ttl->count() <= 0)
    return std::nullopt;
  return now + *ttl;
}

std::int64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch())
          .count());
}

TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

} // namespace tiercache
