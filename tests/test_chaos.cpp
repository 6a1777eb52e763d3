#include "catch2/catch_test_macros.hpp"
#include "tiercache/manager.hpp"

#include <filesystem>
#include <random>
#include <unistd.h>

using namespace tiercache;

TEST_CASE("chaos churn keeps L1 bounded and tags consistent", "[chaos]") {
  MemoryTierConfig cfg;
  cfg.capacity = 256;
  cfg.strategy = EvictionStrategy::Ttl;
  MemoryTier t(cfg);
  std::mt19937_64 rng(42);
  for (int i = 0; i < 20000; ++i) {
    const auto key = std::string("k") + std::to_string(rng() % 2000);
    const auto tag = std::string("t") + std::to_string(rng() % 16);
    switch (rng() % 6) {
    case 0:
    case 1:
      t.set(key, Bytes(static_cast<std::size_t>(rng() % 128 + 1), 'a'),
            rng() % 2 ? std::optional<Ttl>(Ttl(rng() % 5)) : std::nullopt,
            {tag});
      break;
    case 2:
      t.get(key);
      break;
    case 3:
      t.del(key);
      break;
    case 4:
      t.invalidate_by_tag(tag);
      break;
    default:
      t.invalidate_by_prefix(key);
      break;
    }
    REQUIRE(t.size() <= 256);
  }
  for (const auto &k : t.keys())
    for (const auto &tag : t.tags_of(k))
      CHECK(t.tagged_keys(tag).contains(k));
}

TEST_CASE("chaos churn across memory, remote and disk tiers", "[chaos]") {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("tiercache_chaos_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);

  MemoryTierConfig c1;
  c1.capacity = 64;
  RemoteTierConfig c2;
  c2.enabled = true;
  DiskTierConfig c3;
  c3.dir = dir.string();
  c3.sweep_interval = std::chrono::milliseconds(20);
  auto l3 = std::make_unique<DiskTier>(c3);
  REQUIRE(l3->init());
  {
    CacheManager m(std::make_unique<MemoryTier>(c1),
                   std::make_unique<RemoteTier>(
                       std::make_shared<MemoryKvClient>(), c2),
                   std::move(l3));
    std::mt19937_64 rng(7);
    for (int i = 0; i < 3000; ++i) {
      const auto key = std::string("k") + std::to_string(rng() % 300);
      const Bytes value{static_cast<std::uint8_t>(rng() % 256)};
      switch (rng() % 5) {
      case 0:
        REQUIRE(m.set(key, value, {{Tier::L3, Ttl(rng() % 10)}},
                      {"g" + std::to_string(rng() % 4)}));
        break;
      case 1:
      case 2:
        m.get(key);
        break;
      case 3:
        m.del(key);
        break;
      default:
        m.invalidate_by_tag("g" + std::to_string(rng() % 4));
        break;
      }
    }
    for (const auto t : all_tiers())
      CHECK(m.stats(t).failures == 0);
    m.shutdown();
  }
  std::filesystem::remove_all(dir);
}
