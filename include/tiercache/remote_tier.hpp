#pragma once

#include "tiercache/kv_client.hpp"
#include "tiercache/record.hpp"
#include "tiercache/resp_kv_client.hpp"
#include "tiercache/tier_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tiercache {

struct RemoteTierConfig {
  bool enabled{false};
  RespKvConfig kv;
  std::string key_prefix{"tiercache:"};
  std::optional<Ttl> default_ttl{Ttl(3600 * 1000)};
};

// L2: entries kept on a KvClient backend. Backend keys, with ns = key_prefix:
//   <ns>v:<key>  value envelope
//   <ns>m:<key>  access metadata record
//   <ns>t:<key>  set of the key's tags
//   <ns>i:<tag>  set of keys carrying the tag
// The value, metadata and tag-set keys share the entry's TTL; tag indices do
// not expire and may hold stale members.
class RemoteTier final : public TierStore {
public:
  RemoteTier(std::shared_ptr<KvClient> client, RemoteTierConfig cfg);

  // Pings the backend.
  bool init(std::string *err = nullptr);

  Tier tier() const override { return Tier::L2; }
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

  std::string value_key(const std::string &key) const;
  std::string meta_key(const std::string &key) const;
  std::string tags_key(const std::string &key) const;
  std::string index_key(const std::string &tag) const;

private:
  bool apply(const std::vector<KvOp> &ops, std::string *err);
  bool apply_one(const KvOp &op, std::string *err);
  void touch_meta(const std::string &key, EntryMeta meta, TimePoint now);
  bool list_keys(const std::string &prefix, std::vector<std::string> *out,
                 std::string *err);

  std::shared_ptr<KvClient> client_;
  RemoteTierConfig cfg_;
};

} // namespace tiercache
