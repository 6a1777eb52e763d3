#include "tiercache/manager.hpp"

#include "tiercache/disk_tier.hpp"
#include "tiercache/log.hpp"
#include "tiercache/memory_tier.hpp"
#include "tiercache/remote_tier.hpp"
#include "tiercache/resp_kv_client.hpp"

#include <sstream>
#include <stdexcept>

namespace tiercache {

CacheManager::CacheManager(ManagerConfig cfg) {
  if (!set_log_level(cfg.log_level))
    logger()->warn("unknown log_level {}, keeping current level",
                   cfg.log_level);

  install(Tier::L1, std::make_unique<MemoryTier>(cfg.l1));

  if (cfg.l2.enabled) {
    auto client = std::make_shared<RespKvClient>(cfg.l2.kv);
    auto l2 = std::make_unique<RemoteTier>(std::move(client), cfg.l2);
    std::string err;
    const bool ok = l2->init(&err);
    install(Tier::L2, std::move(l2));
    if (!ok) {
      if (!cfg.allow_degraded)
        throw std::runtime_error(err);
      slot(Tier::L2).up = false;
      logger()->error("l2 down, continuing degraded: {}", err);
    }
  }

  if (cfg.l3.enabled) {
    auto l3 = std::make_unique<DiskTier>(cfg.l3);
    std::string err;
    const bool ok = l3->init(&err);
    install(Tier::L3, std::move(l3));
    if (!ok) {
      if (!cfg.allow_degraded)
        throw std::runtime_error(err);
      slot(Tier::L3).up = false;
      logger()->error("l3 down, continuing degraded: {}", err);
    }
  }
}

CacheManager::CacheManager(std::unique_ptr<TierStore> l1,
                           std::unique_ptr<TierStore> l2,
                           std::unique_ptr<TierStore> l3) {
  install(Tier::L1, std::move(l1));
  install(Tier::L2, std::move(l2));
  install(Tier::L3, std::move(l3));
}

CacheManager::~CacheManager() { shutdown(); }

void CacheManager::install(Tier tier, std::unique_ptr<TierStore> store) {
  if (!store)
    return;
  if (store->tier() != tier)
    logger()->warn("store for {} reports tier {}", tier_name(tier),
                   tier_name(store->tier()));
  auto &s = slot(tier);
  s.store = std::move(store);
  s.up = true;
}

bool CacheManager::configured(Tier tier) const {
  return slot(tier).store != nullptr;
}

bool CacheManager::tier_up(Tier tier) const {
  const auto &s = slot(tier);
  return s.store != nullptr && s.up;
}

TierStats CacheManager::stats(Tier tier) const {
  const auto &c = slot(tier).counters;
  TierStats out;
  out.hits = c.hits.load();
  out.misses = c.misses.load();
  out.promotions = c.promotions.load();
  out.failures = c.failures.load();
  return out;
}

std::optional<CacheEntry> CacheManager::read_tier(Tier tier,
                                                  const std::string &key) {
  auto &s = slot(tier);
  if (!s.store)
    return std::nullopt;
  if (!s.up) {
    ++s.counters.failures;
    return std::nullopt;
  }
  std::string err;
  auto entry = s.store->get(key, &err);
  if (entry.has_value()) {
    ++s.counters.hits;
    return entry;
  }
  if (!err.empty())
    ++s.counters.failures;
  ++s.counters.misses;
  return std::nullopt;
}

void CacheManager::promote(const CacheEntry &entry, Tier into) {
  auto &s = slot(into);
  if (!s.store || !s.up)
    return;
  std::string err;
  if (s.store->set(entry.key, entry.value, s.store->default_ttl(), entry.tags,
                   &err)) {
    ++s.counters.promotions;
    return;
  }
  ++s.counters.failures;
  logger()->warn("promotion into {} failed key={} err={}", tier_name(into),
                 entry.key, err);
}

std::optional<Bytes> CacheManager::get(const std::string &key,
                                       std::optional<Tier> tier) {
  if (key.empty())
    return std::nullopt;
  if (tier.has_value()) {
    auto entry = read_tier(*tier, key);
    if (!entry.has_value())
      return std::nullopt;
    return std::move(entry->value);
  }

  if (auto entry = read_tier(Tier::L1, key))
    return std::move(entry->value);

  if (auto entry = read_tier(Tier::L2, key)) {
    promote(*entry, Tier::L1);
    return std::move(entry->value);
  }

  if (auto entry = read_tier(Tier::L3, key)) {
    promote(*entry, Tier::L2);
    promote(*entry, Tier::L1);
    return std::move(entry->value);
  }
  return std::nullopt;
}

bool CacheManager::set(const std::string &key, const Bytes &value,
                       const TtlMap &ttls, const TagSet &tags,
                       const std::vector<Tier> &tiers) {
  if (key.empty()) {
    logger()->warn("set rejected: empty key");
    return false;
  }
  bool ok = true;
  for (const auto t : tiers) {
    auto &s = slot(t);
    if (!s.store)
      continue;
    if (!s.up) {
      ++s.counters.failures;
      ok = false;
      continue;
    }
    auto it = ttls.find(t);
    const std::optional<Ttl> ttl =
        it != ttls.end() ? std::optional<Ttl>(it->second)
                         : s.store->default_ttl();
    std::string err;
    if (!s.store->set(key, value, ttl, tags, &err)) {
      ++s.counters.failures;
      logger()->warn("set on {} failed key={} err={}", tier_name(t), key, err);
      ok = false;
    }
  }
  return ok;
}

bool CacheManager::del(const std::string &key, const std::vector<Tier> &tiers) {
  if (key.empty()) {
    logger()->warn("del rejected: empty key");
    return false;
  }
  bool failed = false;
  bool removed = false;
  for (const auto t : tiers) {
    auto &s = slot(t);
    if (!s.store)
      continue;
    if (!s.up) {
      ++s.counters.failures;
      failed = true;
      continue;
    }
    std::string err;
    if (s.store->del(key, &err)) {
      removed = true;
    } else if (!err.empty()) {
      ++s.counters.failures;
      logger()->warn("del on {} failed key={} err={}", tier_name(t), key, err);
      failed = true;
    }
  }
  return removed && !failed;
}

std::size_t CacheManager::invalidate_by_tag(const std::string &tag,
                                            const std::vector<Tier> &tiers) {
  std::size_t total = 0;
  for (const auto t : tiers) {
    auto &s = slot(t);
    if (!s.store)
      continue;
    if (!s.up) {
      ++s.counters.failures;
      continue;
    }
    std::string err;
    total += s.store->invalidate_by_tag(tag, &err);
    if (!err.empty()) {
      ++s.counters.failures;
      logger()->warn("invalidate tag={} on {} incomplete err={}", tag,
                     tier_name(t), err);
    }
  }
  logger()->debug("invalidated tag={} count={}", tag, total);
  return total;
}

std::size_t CacheManager::invalidate_by_prefix(const std::string &prefix,
                                               const std::vector<Tier> &tiers) {
  std::size_t total = 0;
  for (const auto t : tiers) {
    auto &s = slot(t);
    if (!s.store)
      continue;
    if (!s.up) {
      ++s.counters.failures;
      continue;
    }
    std::string err;
    total += s.store->invalidate_by_prefix(prefix, &err);
    if (!err.empty()) {
      ++s.counters.failures;
      logger()->warn("invalidate prefix={} on {} incomplete err={}", prefix,
                     tier_name(t), err);
    }
  }
  logger()->debug("invalidated prefix={} count={}", prefix, total);
  return total;
}

bool CacheManager::clear(const std::vector<Tier> &tiers) {
  bool ok = true;
  for (const auto t : tiers) {
    auto &s = slot(t);
    if (!s.store)
      continue;
    if (!s.up) {
      ++s.counters.failures;
      ok = false;
      continue;
    }
    std::string err;
    if (!s.store->clear(&err)) {
      ++s.counters.failures;
      logger()->warn("clear on {} failed err={}", tier_name(t), err);
      ok = false;
    }
  }
  return ok;
}

void CacheManager::shutdown() {
  std::call_once(shutdown_once_, [this] {
    for (auto &s : slots_)
      if (s.store)
        s.store->stop();
    logger()->debug("cache manager shut down");
  });
}

std::string CacheManager::info() const {
  std::ostringstream os;
  for (const auto t : all_tiers()) {
    const char *name = tier_name(t);
    const auto &s = slot(t);
    const auto st = stats(t);
    os << name << "_status:"
       << (!s.store ? "disabled" : (s.up ? "up" : "down")) << "\n";
    os << name << "_hits:" << st.hits << "\n";
    os << name << "_misses:" << st.misses << "\n";
    os << name << "_promotions:" << st.promotions << "\n";
    os << name << "_failures:" << st.failures << "\n";
  }
  if (const auto *l1 = dynamic_cast<const MemoryTier *>(
          slot(Tier::L1).store.get())) {
    const auto st = l1->stats();
    os << "l1_size:" << l1->size() << "\n";
    os << "l1_capacity:" << l1->capacity() << "\n";
    os << "l1_evictions:" << st.evictions << "\n";
    os << "l1_expirations:" << st.expirations << "\n";
    os << "l1_policy:" << l1->policy_name() << "\n";
  }
  if (const auto *l3 =
          dynamic_cast<const DiskTier *>(slot(Tier::L3).store.get())) {
    const auto st = l3->stats();
    os << "l3_sweeps:" << st.sweeps << "\n";
    os << "l3_swept:" << st.swept << "\n";
  }
  return os.str();
}

} // namespace tiercache
