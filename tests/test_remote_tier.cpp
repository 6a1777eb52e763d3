#include "tiercache/remote_tier.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <thread>

using namespace tiercache;

namespace {
Bytes b(const std::string &s) { return Bytes(s.begin(), s.end()); }

// Refuses writes to metadata records.
class MetaWriteFailingKv : public MemoryKvClient {
public:
  using MemoryKvClient::MemoryKvClient;
  bool set(const std::string &key, const std::string &value,
           std::optional<Ttl> ttl, std::string *err = nullptr) override {
    if (key.starts_with("tiercache:m:")) {
      if (err)
        *err = "injected meta failure";
      return false;
    }
    return MemoryKvClient::set(key, value, ttl, err);
  }
};

// Records the backend key of every single-key write, in order.
class RecordingKv : public MemoryKvClient {
public:
  RecordingKv() : MemoryKvClient(MemoryKvOptions{false, true}) {}
  bool set(const std::string &key, const std::string &value,
           std::optional<Ttl> ttl, std::string *err = nullptr) override {
    writes.push_back("set " + key);
    return MemoryKvClient::set(key, value, ttl, err);
  }
  bool sadd(const std::string &key, const std::vector<std::string> &members,
            std::string *err = nullptr) override {
    writes.push_back("sadd " + key);
    return MemoryKvClient::sadd(key, members, err);
  }
  bool srem(const std::string &key, const std::vector<std::string> &members,
            std::string *err = nullptr) override {
    writes.push_back("srem " + key);
    return MemoryKvClient::srem(key, members, err);
  }
  std::vector<std::string> writes;
};

class UnreachableKv : public MemoryKvClient {
public:
  bool ping(std::string *err = nullptr) override {
    if (err)
      *err = "connection refused";
    return false;
  }
};

RemoteTierConfig tier_config() {
  RemoteTierConfig cfg;
  cfg.enabled = true;
  return cfg;
}
} // namespace

TEST_CASE("remote tier stores value, metadata and tag records", "[l2]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.init());

  REQUIRE(tier.set("user:42", b("alice"), std::nullopt, {"users"}));
  CHECK(kv->get("tiercache:v:user:42").has_value());
  CHECK(kv->get("tiercache:m:user:42").has_value());
  std::vector<std::string> members;
  REQUIRE(kv->smembers("tiercache:t:user:42", &members));
  CHECK(members == std::vector<std::string>{"users"});
  REQUIRE(kv->smembers("tiercache:i:users", &members));
  CHECK(members == std::vector<std::string>{"user:42"});

  auto first = tier.get("user:42");
  REQUIRE(first.has_value());
  CHECK(first->value == b("alice"));
  CHECK(first->tags == TagSet{"users"});
  CHECK(first->access_count == 1);
  CHECK_FALSE(first->expiry.has_value());
  auto second = tier.get("user:42");
  REQUIRE(second.has_value());
  CHECK(second->access_count == 2);
  CHECK(second->last_accessed_at >= second->created_at);
}

TEST_CASE("remote tier relies on backend expiry", "[l2][ttl]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("v"), Ttl(40), {"t"}));
  auto e = tier.get("k");
  REQUIRE(e.has_value());
  CHECK(e->expiry.has_value());
  CHECK(kv->deadline_of("tiercache:t:k").has_value());
  CHECK(kv->deadline_of("tiercache:m:k").has_value());
  CHECK_FALSE(kv->deadline_of("tiercache:i:t").has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  std::string err;
  CHECK_FALSE(tier.get("k", &err).has_value());
  CHECK(err.empty());
}

TEST_CASE("remote tier reports corrupt envelopes as failures", "[l2]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(kv->set(tier.value_key("k"), "not an envelope", std::nullopt));
  std::string err;
  CHECK_FALSE(tier.get("k", &err).has_value());
  CHECK(err.find("serialization") != std::string::npos);
}

TEST_CASE("metadata update failure does not fail the read", "[l2]") {
  auto kv = std::make_shared<MetaWriteFailingKv>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("v"), std::nullopt, {}));
  std::string err;
  auto e = tier.get("k", &err);
  REQUIRE(e.has_value());
  CHECK(e->value == b("v"));
  CHECK(err.empty());
}

TEST_CASE("without batching the value is written first", "[l2][ordering]") {
  auto kv = std::make_shared<RecordingKv>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("v"), Ttl(60000), {"a", "b"}));

  REQUIRE(kv->writes.size() == 5);
  CHECK(kv->writes[0] == "set tiercache:v:k");
  CHECK(kv->writes[1] == "set tiercache:m:k");
  CHECK(kv->writes[2] == "sadd tiercache:t:k");
  CHECK(kv->writes[3] == "sadd tiercache:i:a");
  CHECK(kv->writes[4] == "sadd tiercache:i:b");

  kv->writes.clear();
  REQUIRE(tier.set("k", b("v2"), Ttl(60000), {"b"}));
  CHECK(kv->writes.front() == "set tiercache:v:k");
  CHECK(std::find(kv->writes.begin(), kv->writes.end(),
                  "srem tiercache:i:a") != kv->writes.end());
}

TEST_CASE("a write interrupted after the value leaves it readable",
          "[l2][ordering]") {
  auto kv = std::make_shared<MetaWriteFailingKv>(MemoryKvOptions{false, true});
  RemoteTier tier(kv, tier_config());
  std::string err;
  CHECK_FALSE(tier.set("k", b("v"), std::nullopt, {"t"}, &err));
  CHECK(err == "injected meta failure");
  auto e = tier.get("k");
  REQUIRE(e.has_value());
  CHECK(e->value == b("v"));
}

TEST_CASE("remote tag invalidation skips stale index members", "[l2][tags]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("a", b("1"), std::nullopt, {"t"}));
  REQUIRE(tier.set("b", b("2"), std::nullopt, {"t"}));
  REQUIRE(tier.set("c", b("3"), std::nullopt, {"other"}));
  // Simulate "b" expiring while its index membership lingers.
  REQUIRE(kv->del({tier.value_key("b"), tier.meta_key("b"), tier.tags_key("b")},
                  nullptr));

  CHECK(tier.invalidate_by_tag("t") == 1);
  CHECK_FALSE(tier.get("a").has_value());
  CHECK(tier.get("c").has_value());
  CHECK_FALSE(kv->get(tier.index_key("t")).has_value());
  std::vector<std::string> members;
  REQUIRE(kv->smembers(tier.index_key("t"), &members));
  CHECK(members.empty());
}

TEST_CASE("remote overwrite drops the key from old tag indices",
          "[l2][tags]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("1"), std::nullopt, {"old"}));
  REQUIRE(tier.set("k", b("2"), std::nullopt, {"new"}));
  std::vector<std::string> members;
  REQUIRE(kv->smembers(tier.index_key("old"), &members));
  CHECK(members.empty());
  CHECK(tier.invalidate_by_tag("old") == 0);
  CHECK(tier.get("k")->tags == TagSet{"new"});
}

TEST_CASE("remote tag invalidation ignores keys re-written without the tag",
          "[l2][tags]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("old"), Ttl(20), {"users"}));
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  // The old tag set expired, so the rewrite cannot unlink "k" from the index.
  REQUIRE(tier.set("k", b("new"), std::nullopt, {}));
  std::vector<std::string> members;
  REQUIRE(kv->smembers(tier.index_key("users"), &members));
  CHECK(members == std::vector<std::string>{"k"});

  std::string err;
  CHECK(tier.invalidate_by_tag("users", &err) == 0);
  CHECK(err.empty());
  auto e = tier.get("k");
  REQUIRE(e.has_value());
  CHECK(e->value == b("new"));
}

TEST_CASE("remote prefix invalidation counts only entries", "[l2][prefix]") {
  for (bool native : {true, false}) {
    auto kv = std::make_shared<MemoryKvClient>(MemoryKvOptions{true, native});
    RemoteTier tier(kv, tier_config());
    REQUIRE(tier.set("user:1", b("a"), std::nullopt, {"users"}));
    REQUIRE(tier.set("user:2", b("b"), Ttl(60000), {"users"}));
    REQUIRE(tier.set("order:1", b("c"), std::nullopt, {"users"}));

    CHECK(tier.invalidate_by_prefix("user:") == 2);
    CHECK_FALSE(tier.get("user:1").has_value());
    CHECK_FALSE(kv->get(tier.meta_key("user:2")).has_value());
    CHECK(tier.get("order:1").has_value());
    CHECK(tier.invalidate_by_prefix("user:") == 0);
  }
}

TEST_CASE("remote delete and clear", "[l2]") {
  auto kv = std::make_shared<MemoryKvClient>();
  RemoteTier tier(kv, tier_config());
  REQUIRE(tier.set("k", b("v"), std::nullopt, {"t"}));
  CHECK(tier.del("k"));
  CHECK_FALSE(tier.del("k"));
  std::vector<std::string> members;
  REQUIRE(kv->smembers(tier.index_key("t"), &members));
  CHECK(members.empty());

  REQUIRE(kv->set("foreign", "x", std::nullopt));
  REQUIRE(tier.set("a", b("1"), std::nullopt, {"t"}));
  REQUIRE(tier.clear());
  REQUIRE(tier.clear());
  CHECK(kv->key_count() == 1);
  CHECK(kv->get("foreign").has_value());
}

TEST_CASE("remote tier init fails when the backend is unreachable", "[l2]") {
  RemoteTier tier(std::make_shared<UnreachableKv>(), tier_config());
  std::string err;
  CHECK_FALSE(tier.init(&err));
  CHECK(err.find("connection refused") != std::string::npos);
}
