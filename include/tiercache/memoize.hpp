#pragma once

#include "tiercache/log.hpp"
#include "tiercache/manager.hpp"

#include <cstring>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tiercache {

// Byte codec for memoized results. Specialize for your own types.
template <typename T, typename Enable = void> struct ValueCodec;

template <> struct ValueCodec<std::string> {
  static Bytes encode(const std::string &v) { return Bytes(v.begin(), v.end()); }
  static std::optional<std::string> decode(const Bytes &b) {
    return std::string(b.begin(), b.end());
  }
};

template <> struct ValueCodec<Bytes> {
  static Bytes encode(const Bytes &v) { return v; }
  static std::optional<Bytes> decode(const Bytes &b) { return b; }
};

// Host byte order; the cache is not a portable exchange format.
template <typename T>
struct ValueCodec<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
  static Bytes encode(T v) {
    Bytes out(sizeof(T));
    std::memcpy(out.data(), &v, sizeof(T));
    return out;
  }
  static std::optional<T> decode(const Bytes &b) {
    if (b.size() != sizeof(T))
      return std::nullopt;
    T v;
    std::memcpy(&v, b.data(), sizeof(T));
    return v;
  }
};

namespace detail {

template <typename A> void append_key_part(std::string &key, const A &arg) {
  using D = std::decay_t<A>;
  if constexpr (std::is_same_v<D, bool>) {
    key += arg ? ":true" : ":false";
  } else if constexpr (std::is_floating_point_v<D>) {
    std::ostringstream os;
    os << std::setprecision(17) << arg;
    key += ':';
    key += os.str();
  } else if constexpr (std::is_arithmetic_v<D>) {
    key += ':';
    key += std::to_string(arg);
  } else if constexpr (std::is_convertible_v<const D &, std::string_view>) {
    key += ':';
    for (char c : std::string_view(arg)) {
      if (c == ':' || c == '\\')
        key += '\\';
      key += c;
    }
  }
  // Anything else is not part of the key.
}

} // namespace detail

// "[prefix:]name:arg1:arg2..." over the scalar arguments. String arguments
// have ':' and backslash escaped with a backslash.
template <typename... Args>
std::string make_cache_key(const std::string &prefix, const std::string &name,
                           const Args &...args) {
  std::string key = prefix.empty() ? name : prefix + ":" + name;
  (detail::append_key_part(key, args), ...);
  return key;
}

struct MemoizeOptions {
  std::string key_prefix;
  // Per-tier TTLs; a tier missing from the map uses its default.
  TtlMap ttls;
  TagSet tags;
  std::vector<Tier> tiers = all_tiers();
};

template <typename R, typename... Args> class Memoized {
public:
  Memoized(CacheManager *manager, std::string name,
           std::function<R(Args...)> fn, MemoizeOptions opts)
      : manager_(manager), name_(std::move(name)), fn_(std::move(fn)),
        opts_(std::move(opts)) {}

  R operator()(Args... args) const {
    if (!manager_)
      return fn_(args...);
    const std::string key = key_for(args...);
    if (auto cached = manager_->get(key)) {
      if (auto v = ValueCodec<R>::decode(*cached))
        return std::move(*v);
      logger()->warn("memoize {}: cached value for {} undecodable, recomputing",
                     name_, key);
    }
    R result = fn_(args...);
    if (!manager_->set(key, ValueCodec<R>::encode(result), opts_.ttls,
                       opts_.tags,
                       opts_.tiers))
      logger()->warn("memoize {}: storing {} failed", name_, key);
    return result;
  }

  std::string key_for(const Args &...args) const {
    return make_cache_key(opts_.key_prefix, name_, args...);
  }

  const std::string &name() const { return name_; }

private:
  CacheManager *manager_;
  std::string name_;
  std::function<R(Args...)> fn_;
  MemoizeOptions opts_;
};

template <typename R, typename... Args>
Memoized<R, Args...> make_memoized(CacheManager *manager, std::string name,
                                   std::function<R(Args...)> fn,
                                   MemoizeOptions opts = {}) {
  return Memoized<R, Args...>(manager, std::move(name), std::move(fn),
                              std::move(opts));
}

// A null manager calls fn directly on every invocation.
template <typename F>
auto memoize(CacheManager *manager, std::string name, F fn,
             MemoizeOptions opts = {}) {
  return make_memoized(manager, std::move(name), std::function{std::move(fn)},
                       std::move(opts));
}

} // namespace tiercache
