#pragma once

#include <memory>
#include <optional>
#include <string>

namespace tiercache {

enum class EvictionStrategy { Lru, Fifo, Ttl };

// Ordering bookkeeping for the in-process tier. The tier owns the entries and
// runs the expiry pass itself; the policy only answers "who goes next".
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const std::string &key) = 0;
  virtual void on_access(const std::string &key) = 0;
  virtual void on_overwrite(const std::string &key) = 0;
  virtual void on_erase(const std::string &key) = 0;
  virtual std::optional<std::string> pick_victim() const = 0;
  virtual void clear() = 0;
};

std::unique_ptr<IEvictionPolicy> make_policy(EvictionStrategy strategy);
bool parse_strategy(const std::string &name, EvictionStrategy &out);
const char *strategy_name(EvictionStrategy strategy);

} // namespace tiercache
