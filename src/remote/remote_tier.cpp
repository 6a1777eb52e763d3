#include "tiercache/remote_tier.hpp"

#include "tiercache/log.hpp"

#include <algorithm>

namespace tiercache {
namespace {

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

std::string to_wire(const Bytes &b) { return std::string(b.begin(), b.end()); }

std::optional<Ttl> effective_ttl(std::optional<Ttl> ttl) {
  if (ttl.has_value() && ttl->count() > 0)
    return ttl;
  return std::nullopt;
}

constexpr std::size_t kDelChunk = 512;

} // namespace

RemoteTier::RemoteTier(std::shared_ptr<KvClient> client, RemoteTierConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {}

bool RemoteTier::init(std::string *err) {
  std::string e;
  if (!client_->ping(&e)) {
    set_err(err, "l2 backend unreachable: " + e);
    return false;
  }
  return true;
}

std::string RemoteTier::value_key(const std::string &key) const {
  return cfg_.key_prefix + "v:" + key;
}
std::string RemoteTier::meta_key(const std::string &key) const {
  return cfg_.key_prefix + "m:" + key;
}
std::string RemoteTier::tags_key(const std::string &key) const {
  return cfg_.key_prefix + "t:" + key;
}
std::string RemoteTier::index_key(const std::string &tag) const {
  return cfg_.key_prefix + "i:" + tag;
}

std::optional<CacheEntry> RemoteTier::get(const std::string &key,
                                          std::string *err) {
  std::string e;
  auto blob = client_->get(value_key(key), &e);
  if (!blob.has_value()) {
    if (!e.empty()) {
      logger()->warn("l2 get failed key={} err={}", key, e);
      set_err(err, e);
    }
    return std::nullopt;
  }

  CacheEntry entry;
  entry.key = key;
  if (!decode_value(*blob, &entry.value, &e)) {
    logger()->error("l2 corrupt value key={} err={}", key, e);
    set_err(err, "l2 serialization: " + e);
    return std::nullopt;
  }

  const auto now = Clock::now();
  EntryMeta meta;
  bool have_meta = false;
  std::string meta_err;
  auto raw_meta = client_->get(meta_key(key), &meta_err);
  if (raw_meta.has_value())
    have_meta = decode_meta(*raw_meta, &meta, &meta_err);
  if (!have_meta) {
    if (!meta_err.empty())
      logger()->warn("l2 metadata unreadable key={} err={}", key, meta_err);
    meta.key = key;
    meta.created_at_ms = to_epoch_ms(now);
    meta.accessed_at_ms = meta.created_at_ms;
  }
  if (meta.is_expired(to_epoch_ms(now)))
    return std::nullopt;

  entry.tags = meta.tags;
  entry.created_at = from_epoch_ms(meta.created_at_ms);
  entry.last_accessed_at = from_epoch_ms(meta.accessed_at_ms);
  entry.access_count = meta.access_count;
  if (meta.expiry_ms >= 0)
    entry.expiry = from_epoch_ms(meta.expiry_ms);
  entry.touch(now);

  if (have_meta)
    touch_meta(key, std::move(meta), now);
  return entry;
}

void RemoteTier::touch_meta(const std::string &key, EntryMeta meta,
                            TimePoint now) {
  const auto now_ms = to_epoch_ms(now);
  meta.accessed_at_ms = std::max(meta.accessed_at_ms, now_ms);
  ++meta.access_count;
  std::optional<Ttl> remaining;
  if (meta.expiry_ms >= 0) {
    if (meta.expiry_ms <= now_ms)
      return;
    remaining = Ttl(meta.expiry_ms - now_ms);
  }
  std::string e;
  if (!client_->set(meta_key(key), encode_meta(meta), remaining, &e))
    logger()->warn("l2 metadata update failed key={} err={}", key, e);
}

bool RemoteTier::set(const std::string &key, const Bytes &value,
                     std::optional<Ttl> ttl, const TagSet &tags,
                     std::string *err) {
  if (key.empty()) {
    set_err(err, "empty key");
    return false;
  }
  std::string e;
  std::vector<std::string> old_tags;
  if (!client_->smembers(tags_key(key), &old_tags, &e)) {
    logger()->warn("l2 set failed reading old tags key={} err={}", key, e);
    set_err(err, e);
    return false;
  }

  const auto now = Clock::now();
  const auto live_ttl = effective_ttl(ttl);
  EntryMeta meta;
  meta.key = key;
  meta.tags = tags;
  meta.created_at_ms = to_epoch_ms(now);
  meta.accessed_at_ms = meta.created_at_ms;
  if (auto expiry = expiry_from_ttl(live_ttl, now))
    meta.expiry_ms = to_epoch_ms(*expiry);

  std::vector<KvOp> ops;
  ops.push_back(KvOp::set(value_key(key), encode_value(value), live_ttl));
  ops.push_back(KvOp::set(meta_key(key), encode_meta(meta), live_ttl));
  ops.push_back(KvOp::del(tags_key(key)));
  if (!tags.empty()) {
    ops.push_back(KvOp::sadd(tags_key(key),
                             std::vector<std::string>(tags.begin(), tags.end())));
    if (live_ttl.has_value())
      ops.push_back(KvOp::pexpire(tags_key(key), *live_ttl));
  }
  for (const auto &t : old_tags)
    if (!tags.contains(t))
      ops.push_back(KvOp::srem(index_key(t), {key}));
  for (const auto &t : tags)
    ops.push_back(KvOp::sadd(index_key(t), {key}));

  if (!apply(ops, &e)) {
    logger()->warn("l2 set failed key={} err={}", key, e);
    set_err(err, e);
    return false;
  }
  return true;
}

bool RemoteTier::apply(const std::vector<KvOp> &ops, std::string *err) {
  if (client_->supports_batch())
    return client_->exec_batch(ops, err);
  for (const auto &op : ops)
    if (!apply_one(op, err))
      return false;
  return true;
}

bool RemoteTier::apply_one(const KvOp &op, std::string *err) {
  switch (op.kind) {
  case KvOp::Kind::Set:
    return client_->set(op.key, op.value, op.ttl, err);
  case KvOp::Kind::Del:
    return client_->del({op.key}, nullptr, err);
  case KvOp::Kind::SAdd:
    return client_->sadd(op.key, op.members, err);
  case KvOp::Kind::SRem:
    return client_->srem(op.key, op.members, err);
  case KvOp::Kind::PExpire:
    return op.ttl.has_value() ? client_->pexpire(op.key, *op.ttl, err) : true;
  }
  return true;
}

bool RemoteTier::del(const std::string &key, std::string *err) {
  std::string e;
  std::vector<std::string> tags;
  if (!client_->smembers(tags_key(key), &tags, &e)) {
    logger()->warn("l2 del failed reading tags key={} err={}", key, e);
    set_err(err, e);
    return false;
  }
  std::size_t removed = 0;
  if (!client_->del({value_key(key)}, &removed, &e) ||
      !client_->del({meta_key(key), tags_key(key)}, nullptr, &e)) {
    logger()->warn("l2 del failed key={} err={}", key, e);
    set_err(err, e);
    return false;
  }
  for (const auto &t : tags) {
    if (!client_->srem(index_key(t), {key}, &e))
      logger()->warn("l2 tag index cleanup failed tag={} key={} err={}", t,
                     key, e);
  }
  return removed > 0;
}

std::size_t RemoteTier::invalidate_by_tag(const std::string &tag,
                                          std::string *err) {
  std::string e;
  std::vector<std::string> members;
  if (!client_->smembers(index_key(tag), &members, &e)) {
    logger()->warn("l2 invalidate tag={} failed err={}", tag, e);
    set_err(err, e);
    return 0;
  }
  std::size_t removed = 0;
  for (const auto &k : members) {
    // The index outlives per-key tag sets; only keys still tagged go.
    std::vector<std::string> current;
    std::string tags_err;
    if (!client_->smembers(tags_key(k), &current, &tags_err)) {
      logger()->warn("l2 read tags key={} failed err={}", k, tags_err);
      set_err(err, tags_err);
      continue;
    }
    if (std::find(current.begin(), current.end(), tag) == current.end())
      continue;
    std::string del_err;
    if (del(k, &del_err))
      ++removed;
    else if (!del_err.empty())
      set_err(err, del_err);
  }
  if (!client_->del({index_key(tag)}, nullptr, &e)) {
    logger()->warn("l2 drop tag index tag={} failed err={}", tag, e);
    set_err(err, e);
  }
  return removed;
}

bool RemoteTier::list_keys(const std::string &prefix,
                           std::vector<std::string> *out, std::string *err) {
  if (client_->supports_prefix_scan())
    return client_->scan(prefix, out, err);
  std::vector<std::string> all;
  if (!client_->scan("", &all, err))
    return false;
  out->clear();
  for (auto &k : all)
    if (k.starts_with(prefix))
      out->push_back(std::move(k));
  return true;
}

std::size_t RemoteTier::invalidate_by_prefix(const std::string &prefix,
                                             std::string *err) {
  const std::string vprefix = cfg_.key_prefix + "v:";
  std::string e;
  std::vector<std::string> found;
  if (!list_keys(vprefix + prefix, &found, &e)) {
    logger()->warn("l2 invalidate prefix={} scan failed err={}", prefix, e);
    set_err(err, e);
    return 0;
  }
  std::size_t removed = 0;
  for (const auto &vk : found) {
    std::string del_err;
    if (del(vk.substr(vprefix.size()), &del_err))
      ++removed;
    else if (!del_err.empty())
      set_err(err, del_err);
  }
  return removed;
}

bool RemoteTier::clear(std::string *err) {
  std::string e;
  std::vector<std::string> found;
  if (!list_keys(cfg_.key_prefix, &found, &e)) {
    logger()->warn("l2 clear scan failed err={}", e);
    set_err(err, e);
    return false;
  }
  for (std::size_t i = 0; i < found.size(); i += kDelChunk) {
    const auto end = std::min(found.size(), i + kDelChunk);
    std::vector<std::string> chunk(found.begin() + i, found.begin() + end);
    if (!client_->del(chunk, nullptr, &e)) {
      logger()->warn("l2 clear failed err={}", e);
      set_err(err, e);
      return false;
    }
  }
  return true;
}

} // namespace tiercache
