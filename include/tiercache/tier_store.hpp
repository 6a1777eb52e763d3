#pragma once

#include "tiercache/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tiercache {

// Common contract of every cache tier.
//
// A miss is std::nullopt with *err left empty. A backend failure also yields
// std::nullopt / false / 0 but fills *err (when given) and is logged by the
// tier. Implementations never throw from these calls.
class TierStore {
public:
  virtual ~TierStore() = default;

  virtual Tier tier() const = 0;
  virtual std::optional<Ttl> default_ttl() const = 0;

  virtual std::optional<CacheEntry> get(const std::string &key,
                                        std::string *err = nullptr) = 0;
  virtual bool set(const std::string &key, const Bytes &value,
                   std::optional<Ttl> ttl, const TagSet &tags,
                   std::string *err = nullptr) = 0;
  virtual bool del(const std::string &key, std::string *err = nullptr) = 0;
  virtual std::size_t invalidate_by_tag(const std::string &tag,
                                        std::string *err = nullptr) = 0;
  virtual std::size_t invalidate_by_prefix(const std::string &prefix,
                                           std::string *err = nullptr) = 0;
  virtual bool clear(std::string *err = nullptr) = 0;

  // Stops background work. Called by the manager on shutdown.
  virtual void stop() {}
};

} // namespace tiercache
