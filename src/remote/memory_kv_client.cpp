#include "tiercache/kv_client.hpp"

namespace tiercache {

KvOp KvOp::set(std::string key, std::string value, std::optional<Ttl> ttl) {
  KvOp op;
  op.kind = Kind::Set;
  op.key = std::move(key);
  op.value = std::move(value);
  op.ttl = ttl;
  return op;
}

KvOp KvOp::del(std::string key) {
  KvOp op;
  op.kind = Kind::Del;
  op.key = std::move(key);
  return op;
}

KvOp KvOp::sadd(std::string key, std::vector<std::string> members) {
  KvOp op;
  op.kind = Kind::SAdd;
  op.key = std::move(key);
  op.members = std::move(members);
  return op;
}

KvOp KvOp::srem(std::string key, std::vector<std::string> members) {
  KvOp op;
  op.kind = Kind::SRem;
  op.key = std::move(key);
  op.members = std::move(members);
  return op;
}

KvOp KvOp::pexpire(std::string key, Ttl ttl) {
  KvOp op;
  op.kind = Kind::PExpire;
  op.key = std::move(key);
  op.ttl = ttl;
  return op;
}

MemoryKvClient::MemoryKvClient(MemoryKvOptions opts) : opts_(opts) {}

bool MemoryKvClient::ping(std::string *) { return true; }

std::optional<std::string> MemoryKvClient::get(const std::string &key,
                                               std::string *err) {
  std::lock_guard lock(mu_);
  auto *item = find_live_locked(key, Clock::now());
  if (!item)
    return std::nullopt;
  if (!std::holds_alternative<std::string>(item->data)) {
    if (err)
      *err = "WRONGTYPE key holds a set";
    return std::nullopt;
  }
  return std::get<std::string>(item->data);
}

bool MemoryKvClient::set(const std::string &key, const std::string &value,
                         std::optional<Ttl> ttl, std::string *err) {
  std::lock_guard lock(mu_);
  return apply_locked(KvOp::set(key, value, ttl), Clock::now(), err);
}

bool MemoryKvClient::del(const std::vector<std::string> &keys,
                         std::size_t *removed, std::string *) {
  std::lock_guard lock(mu_);
  const auto now = Clock::now();
  std::size_t n = 0;
  for (const auto &k : keys) {
    if (find_live_locked(k, now)) {
      items_.erase(k);
      ++n;
    }
  }
  if (removed)
    *removed = n;
  return true;
}

bool MemoryKvClient::sadd(const std::string &key,
                          const std::vector<std::string> &members,
                          std::string *err) {
  std::lock_guard lock(mu_);
  return apply_locked(KvOp::sadd(key, members), Clock::now(), err);
}

bool MemoryKvClient::srem(const std::string &key,
                          const std::vector<std::string> &members,
                          std::string *err) {
  std::lock_guard lock(mu_);
  return apply_locked(KvOp::srem(key, members), Clock::now(), err);
}

bool MemoryKvClient::smembers(const std::string &key,
                              std::vector<std::string> *out, std::string *err) {
  std::lock_guard lock(mu_);
  out->clear();
  auto *item = find_live_locked(key, Clock::now());
  if (!item)
    return true;
  if (!std::holds_alternative<std::set<std::string>>(item->data)) {
    if (err)
      *err = "WRONGTYPE key holds a string";
    return false;
  }
  const auto &s = std::get<std::set<std::string>>(item->data);
  out->assign(s.begin(), s.end());
  return true;
}

bool MemoryKvClient::pexpire(const std::string &key, Ttl ttl,
                             std::string *err) {
  std::lock_guard lock(mu_);
  return apply_locked(KvOp::pexpire(key, ttl), Clock::now(), err);
}

bool MemoryKvClient::scan(const std::string &prefix,
                          std::vector<std::string> *out, std::string *err) {
  if (!prefix.empty() && !opts_.prefix_scan) {
    if (err)
      *err = "backend has no prefix scan";
    return false;
  }
  std::lock_guard lock(mu_);
  out->clear();
  const auto now = Clock::now();
  for (auto it = items_.lower_bound(prefix); it != items_.end();) {
    if (!it->first.starts_with(prefix))
      break;
    if (it->second.deadline.has_value() && *it->second.deadline <= now) {
      it = items_.erase(it);
      continue;
    }
    out->push_back(it->first);
    ++it;
  }
  return true;
}

bool MemoryKvClient::exec_batch(const std::vector<KvOp> &ops,
                                std::string *err) {
  if (!opts_.batch) {
    if (err)
      *err = "backend has no batch support";
    return false;
  }
  std::lock_guard lock(mu_);
  const auto now = Clock::now();
  for (const auto &op : ops) {
    if (op.kind == KvOp::Kind::SAdd || op.kind == KvOp::Kind::SRem) {
      auto *item = find_live_locked(op.key, now);
      if (item && !std::holds_alternative<std::set<std::string>>(item->data)) {
        if (err)
          *err = "WRONGTYPE in batch for " + op.key;
        return false;
      }
    }
  }
  for (const auto &op : ops)
    if (!apply_locked(op, now, err))
      return false;
  return true;
}

std::size_t MemoryKvClient::key_count() {
  std::lock_guard lock(mu_);
  const auto now = Clock::now();
  std::size_t n = 0;
  for (const auto &[_, item] : items_)
    if (!item.deadline.has_value() || *item.deadline > now)
      ++n;
  return n;
}

std::optional<TimePoint> MemoryKvClient::deadline_of(const std::string &key) {
  std::lock_guard lock(mu_);
  auto *item = find_live_locked(key, Clock::now());
  if (!item)
    return std::nullopt;
  return item->deadline;
}

MemoryKvClient::Item *MemoryKvClient::find_live_locked(const std::string &key,
                                                       TimePoint now) {
  auto it = items_.find(key);
  if (it == items_.end())
    return nullptr;
  if (it->second.deadline.has_value() && *it->second.deadline <= now) {
    items_.erase(it);
    return nullptr;
  }
  return &it->second;
}

bool MemoryKvClient::apply_locked(const KvOp &op, TimePoint now,
                                  std::string *err) {
  switch (op.kind) {
  case KvOp::Kind::Set: {
    Item item;
    item.data = op.value;
    item.deadline = expiry_from_ttl(op.ttl, now);
    items_[op.key] = std::move(item);
    return true;
  }
  case KvOp::Kind::Del:
    items_.erase(op.key);
    return true;
  case KvOp::Kind::SAdd: {
    auto *item = find_live_locked(op.key, now);
    if (!item) {
      Item fresh;
      fresh.data = std::set<std::string>{};
      item = &(items_[op.key] = std::move(fresh));
    }
    auto *s = std::get_if<std::set<std::string>>(&item->data);
    if (!s) {
      if (err)
        *err = "WRONGTYPE key holds a string";
      return false;
    }
    s->insert(op.members.begin(), op.members.end());
    return true;
  }
  case KvOp::Kind::SRem: {
    auto *item = find_live_locked(op.key, now);
    if (!item)
      return true;
    auto *s = std::get_if<std::set<std::string>>(&item->data);
    if (!s) {
      if (err)
        *err = "WRONGTYPE key holds a string";
      return false;
    }
    for (const auto &m : op.members)
      s->erase(m);
    if (s->empty())
      items_.erase(op.key);
    return true;
  }
  case KvOp::Kind::PExpire: {
    auto *item = find_live_locked(op.key, now);
    if (!item || !op.ttl.has_value())
      return true;
    if (op.ttl->count() <= 0) {
      items_.erase(op.key);
      return true;
    }
    item->deadline = now + *op.ttl;
    return true;
  }
  }
  return true;
}

} // namespace tiercache
