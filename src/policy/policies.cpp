#include "tiercache/policy.hpp"

#include <algorithm>
#include <cctype>
#include <list>
#include <unordered_map>

namespace tiercache {
namespace {

// Doubly linked key order with O(1) move/erase. Front is the next victim.
class KeyOrder {
public:
  void push_back(const std::string &key) {
    erase(key);
    order_.push_back(key);
    pos_[key] = std::prev(order_.end());
  }
  void move_to_back(const std::string &key) {
    auto it = pos_.find(key);
    if (it == pos_.end())
      return;
    order_.splice(order_.end(), order_, it->second);
  }
  void erase(const std::string &key) {
    auto it = pos_.find(key);
    if (it == pos_.end())
      return;
    order_.erase(it->second);
    pos_.erase(it);
  }
  std::optional<std::string> front() const {
    if (order_.empty())
      return std::nullopt;
    return order_.front();
  }
  void clear() {
    order_.clear();
    pos_.clear();
  }

private:
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> pos_;
};

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  void on_insert(const std::string &key) override { order_.push_back(key); }
  void on_access(const std::string &key) override { order_.move_to_back(key); }
  void on_overwrite(const std::string &key) override {
    order_.move_to_back(key);
  }
  void on_erase(const std::string &key) override { order_.erase(key); }
  std::optional<std::string> pick_victim() const override {
    return order_.front();
  }
  void clear() override { order_.clear(); }

private:
  KeyOrder order_;
};

class FifoPolicy : public IEvictionPolicy {
public:
  std::string name() const override { return "fifo"; }
  void on_insert(const std::string &key) override { order_.push_back(key); }
  void on_access(const std::string &) override {}
  void on_overwrite(const std::string &key) override {
    order_.move_to_back(key);
  }
  void on_erase(const std::string &key) override { order_.erase(key); }
  std::optional<std::string> pick_victim() const override {
    return order_.front();
  }
  void clear() override { order_.clear(); }

private:
  KeyOrder order_;
};

// Expired entries are reclaimed by the tier before a victim is requested; when
// nothing has expired the insertion order guarantees progress.
class TtlPolicy final : public FifoPolicy {
public:
  std::string name() const override { return "ttl"; }
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy(EvictionStrategy strategy) {
  switch (strategy) {
  case EvictionStrategy::Fifo:
    return std::make_unique<FifoPolicy>();
  case EvictionStrategy::Ttl:
    return std::make_unique<TtlPolicy>();
  case EvictionStrategy::Lru:
    break;
  }
  return std::make_unique<LruPolicy>();
}

bool parse_strategy(const std::string &name, EvictionStrategy &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "lru")
    out = EvictionStrategy::Lru;
  else if (lower == "fifo")
    out = EvictionStrategy::Fifo;
  else if (lower == "ttl")
    out = EvictionStrategy::Ttl;
  else
    return false;
  return true;
}

const char *strategy_name(EvictionStrategy strategy) {
  switch (strategy) {
  case EvictionStrategy::Lru:
    return "lru";
  case EvictionStrategy::Fifo:
    return "fifo";
  case EvictionStrategy::Ttl:
    return "ttl";
  }
  return "lru";
}

} // namespace tiercache
