#include "tiercache/manager.hpp"

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <filesystem>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace tiercache;
namespace fs = std::filesystem;

namespace {
Bytes b(const std::string &s) { return Bytes(s.begin(), s.end()); }

std::string str(const std::optional<Bytes> &v) {
  return v ? std::string(v->begin(), v->end()) : std::string("<miss>");
}

struct TempDir {
  fs::path path;
  TempDir() {
    static int seq = 0;
    path = fs::temp_directory_path() /
           ("tiercache_mgr_" + std::to_string(::getpid()) + "_" +
            std::to_string(seq++));
    fs::remove_all(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

int listen_local(int *port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
      listen(fd, 16) < 0) {
    close(fd);
    return -1;
  }
  socklen_t len = sizeof(addr);
  getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  *port = ntohs(addr.sin_port);
  return fd;
}

int closed_port() {
  int port = 0;
  int fd = listen_local(&port);
  close(fd);
  return port;
}

// A tier whose backend rejects every call.
class BrokenTier : public TierStore {
public:
  explicit BrokenTier(Tier t) : tier_(t) {}
  Tier tier() const override { return tier_; }
  std::optional<Ttl> default_ttl() const override { return std::nullopt; }
  std::optional<CacheEntry> get(const std::string &,
                                std::string *err) override {
    fail(err);
    return std::nullopt;
  }
  bool set(const std::string &, const Bytes &, std::optional<Ttl>,
           const TagSet &, std::string *err) override {
    return fail(err);
  }
  bool del(const std::string &, std::string *err) override { return fail(err); }
  std::size_t invalidate_by_tag(const std::string &, std::string *err) override {
    fail(err);
    return 0;
  }
  std::size_t invalidate_by_prefix(const std::string &,
                                   std::string *err) override {
    fail(err);
    return 0;
  }
  bool clear(std::string *err) override { return fail(err); }

private:
  static bool fail(std::string *err) {
    if (err)
      *err = "backend unavailable";
    return false;
  }
  Tier tier_;
};

struct Stack {
  TempDir dir;
  MemoryTier *l1{nullptr};
  std::shared_ptr<MemoryKvClient> kv = std::make_shared<MemoryKvClient>();
  RemoteTier *l2{nullptr};
  DiskTier *l3{nullptr};
  std::unique_ptr<CacheManager> manager;

  Stack() {
    MemoryTierConfig c1;
    c1.capacity = 128;
    auto t1 = std::make_unique<MemoryTier>(c1);
    l1 = t1.get();

    RemoteTierConfig c2;
    c2.enabled = true;
    auto t2 = std::make_unique<RemoteTier>(kv, c2);
    l2 = t2.get();

    DiskTierConfig c3;
    c3.dir = dir.path.string();
    c3.sweep_interval = std::chrono::milliseconds(0);
    auto t3 = std::make_unique<DiskTier>(c3);
    if (!t3->init())
      throw std::runtime_error("disk tier init failed");
    l3 = t3.get();

    manager = std::make_unique<CacheManager>(std::move(t1), std::move(t2),
                                             std::move(t3));
  }
};
} // namespace

TEST_CASE("a disk hit is promoted into every faster tier", "[manager]") {
  Stack s;
  REQUIRE(s.l3->set("user:42", b("alice"), std::nullopt, {"users"}));
  CHECK_FALSE(s.l1->get("user:42").has_value());

  CHECK(str(s.manager->get("user:42")) == "alice");
  auto in_l1 = s.l1->get("user:42");
  REQUIRE(in_l1.has_value());
  CHECK(in_l1->tags == TagSet{"users"});
  // Promoted copies take the receiving tier's default TTL.
  CHECK(in_l1->expiry.has_value());
  auto in_l2 = s.l2->get("user:42");
  REQUIRE(in_l2.has_value());
  CHECK(in_l2->tags == TagSet{"users"});

  CHECK(s.manager->stats(Tier::L3).hits == 1);
  CHECK(s.manager->stats(Tier::L2).promotions == 1);
  CHECK(s.manager->stats(Tier::L1).promotions == 1);

  CHECK(str(s.manager->get("user:42")) == "alice");
  CHECK(s.manager->stats(Tier::L1).hits == 1);
  CHECK(s.manager->stats(Tier::L3).hits == 1);
}

TEST_CASE("a remote hit is promoted into L1 only", "[manager]") {
  Stack s;
  REQUIRE(s.l2->set("k", b("v"), std::nullopt, {}));
  CHECK(str(s.manager->get("k")) == "v");
  CHECK(s.l1->get("k").has_value());
  CHECK_FALSE(s.l3->get("k").has_value());
}

TEST_CASE("reading one tier neither falls through nor promotes",
          "[manager]") {
  Stack s;
  REQUIRE(s.l3->set("k", b("disk"), std::nullopt, {}));
  CHECK_FALSE(s.manager->get("k", Tier::L1).has_value());
  CHECK(str(s.manager->get("k", Tier::L3)) == "disk");
  CHECK_FALSE(s.l1->get("k").has_value());
  CHECK_FALSE(s.l2->get("k").has_value());
}

TEST_CASE("set honours per-tier TTLs and defaults", "[manager][ttl]") {
  Stack s;
  REQUIRE(s.manager->set("k", b("v"), {{Tier::L1, Ttl(40)}}, {"t"}));
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK_FALSE(s.l1->get("k").has_value());
  CHECK(s.l2->get("k").has_value());
  auto in_l3 = s.l3->get("k");
  REQUIRE(in_l3.has_value());
  REQUIRE(in_l3->expiry.has_value());
  CHECK(*in_l3->expiry > Clock::now() + std::chrono::hours(23));

  REQUIRE(s.manager->set("only-l1", b("v"), {}, {}, {Tier::L1}));
  CHECK(s.l1->get("only-l1").has_value());
  CHECK_FALSE(s.l2->get("only-l1").has_value());
  CHECK_FALSE(s.l3->get("only-l1").has_value());
}

TEST_CASE("fan-out operations cover every requested tier", "[manager]") {
  Stack s;
  REQUIRE(s.manager->set("user:1", b("a"), {}, {"users"}));
  REQUIRE(s.manager->set("user:2", b("b"), {}, {"users"}));
  REQUIRE(s.manager->set("order:1", b("c"), {}, {"orders"}));

  CHECK(s.manager->invalidate_by_tag("users") == 6);
  CHECK_FALSE(s.manager->get("user:1").has_value());
  CHECK(s.manager->invalidate_by_prefix("order:", {Tier::L1, Tier::L3}) == 2);
  CHECK(str(s.manager->get("order:1")) == "c");

  CHECK(s.manager->del("order:1"));
  CHECK_FALSE(s.manager->del("order:1"));
  CHECK_FALSE(s.manager->get("order:1").has_value());

  REQUIRE(s.manager->set("x", b("1")));
  REQUIRE(s.manager->clear());
  CHECK_FALSE(s.manager->get("x").has_value());
  CHECK(s.l1->size() == 0);
}

TEST_CASE("a failing tier is reported without hiding the others",
          "[manager][failure]") {
  MemoryTierConfig c1;
  c1.capacity = 16;
  CacheManager m(std::make_unique<MemoryTier>(c1),
                 std::make_unique<BrokenTier>(Tier::L2), nullptr);
  CHECK_FALSE(m.configured(Tier::L3));

  CHECK_FALSE(m.set("k", b("v"), {}, {"t"}));
  CHECK(str(m.get("k")) == "v");
  CHECK(m.stats(Tier::L2).failures == 1);

  CHECK(m.set("l1", b("v"), {}, {}, {Tier::L1, Tier::L3}));
  CHECK(m.invalidate_by_tag("t") == 1);
  CHECK(m.stats(Tier::L2).failures == 2);
  CHECK_FALSE(m.del("k"));
  CHECK_FALSE(m.clear());

  // Misses in L1 fall through the broken tier.
  CHECK_FALSE(m.get("absent").has_value());
  CHECK(m.stats(Tier::L2).misses >= 1);
}

TEST_CASE("a hung remote tier falls through to disk", "[manager][timeout]") {
  int port = 0;
  int fd = listen_local(&port);
  REQUIRE(fd >= 0);
  TempDir dir;

  RespKvConfig kv;
  kv.port = port;
  kv.timeout = std::chrono::milliseconds(100);
  RemoteTierConfig c2;
  c2.enabled = true;
  c2.kv = kv;
  DiskTierConfig c3;
  c3.dir = dir.path.string();
  c3.sweep_interval = std::chrono::milliseconds(0);
  auto l3 = std::make_unique<DiskTier>(c3);
  REQUIRE(l3->init());
  REQUIRE(l3->set("k", b("from-disk"), std::nullopt, {}));

  CacheManager m(std::make_unique<MemoryTier>(MemoryTierConfig{}),
                 std::make_unique<RemoteTier>(
                     std::make_shared<RespKvClient>(kv), c2),
                 std::move(l3));
  const auto start = std::chrono::steady_clock::now();
  CHECK(str(m.get("k")) == "from-disk");
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
  CHECK(m.stats(Tier::L2).failures >= 1);
  CHECK(str(m.get("k", Tier::L1)) == "from-disk");
  close(fd);
}

TEST_CASE("startup failure throws unless degraded mode is allowed",
          "[manager][config]") {
  ManagerConfig cfg;
  cfg.l2.enabled = true;
  cfg.l2.kv.port = closed_port();
  cfg.l2.kv.timeout = std::chrono::milliseconds(200);
  cfg.l3.enabled = false;
  CHECK_THROWS_AS(CacheManager(cfg), std::runtime_error);

  cfg.allow_degraded = true;
  CacheManager m(cfg);
  CHECK(m.configured(Tier::L2));
  CHECK_FALSE(m.tier_up(Tier::L2));
  CHECK(m.tier_up(Tier::L1));
  CHECK_FALSE(m.configured(Tier::L3));

  CHECK_FALSE(m.set("k", b("v")));
  CHECK(str(m.get("k")) == "v");
  CHECK(m.set("k", b("v"), {}, {}, {Tier::L1, Tier::L3}));
  CHECK(m.info().find("l2_status:down") != std::string::npos);
  CHECK(m.info().find("l3_status:disabled") != std::string::npos);

  ManagerConfig bad;
  bad.l1.capacity = 0;
  bad.l3.enabled = false;
  CHECK_THROWS_AS(CacheManager(bad), std::invalid_argument);
}

TEST_CASE("empty keys are rejected", "[manager]") {
  Stack s;
  CHECK_FALSE(s.manager->set("", b("v")));
  CHECK_FALSE(s.manager->get("").has_value());
  CHECK_FALSE(s.manager->del(""));
}

TEST_CASE("shutdown stops tiers once and info reports counters",
          "[manager]") {
  TempDir dir;
  ManagerConfig cfg;
  cfg.l3.dir = dir.path.string();
  cfg.l3.sweep_interval = std::chrono::hours(1);
  CacheManager m(cfg);
  REQUIRE(m.set("k", b("v")));
  REQUIRE(m.get("k").has_value());
  CHECK_FALSE(m.get("nope").has_value());

  const auto info = m.info();
  CHECK(info.find("l1_status:up") != std::string::npos);
  CHECK(info.find("l1_hits:1") != std::string::npos);
  CHECK(info.find("l3_misses:1") != std::string::npos);
  CHECK(info.find("l1_policy:lru") != std::string::npos);
  CHECK(info.find("l3_sweeps:") != std::string::npos);

  const auto start = std::chrono::steady_clock::now();
  m.shutdown();
  m.shutdown();
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
}

TEST_CASE("concurrent writers leave each tier with a single value",
          "[manager][concurrency]") {
  Stack s;
  std::vector<std::thread> threads;
  for (int w = 0; w < 6; ++w) {
    threads.emplace_back([&s, w] {
      for (int i = 0; i < 40; ++i) {
        const std::string v = "w" + std::to_string(w);
        s.manager->set("shared", b(v), {}, {v});
        s.manager->get("shared");
      }
    });
  }
  for (auto &t : threads)
    t.join();

  for (TierStore *tier : std::initializer_list<TierStore *>{s.l1, s.l3}) {
    auto e = tier->get("shared");
    REQUIRE(e.has_value());
    const std::string v(e->value.begin(), e->value.end());
    CHECK(e->tags == TagSet{v});
  }
  // L2 access metadata is last-writer-wins, so only the value is checked.
  auto remote = s.l2->get("shared");
  REQUIRE(remote.has_value());
  CHECK(remote->value.size() == 2);
  CHECK(remote->value[0] == 'w');
}
