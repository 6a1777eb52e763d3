#pragma once

#include "tiercache/types.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tiercache {

struct KvOp {
  enum class Kind { Set, Del, SAdd, SRem, PExpire };
  Kind kind{Kind::Set};
  std::string key;
  std::string value;
  std::vector<std::string> members;
  std::optional<Ttl> ttl;

  static KvOp set(std::string key, std::string value, std::optional<Ttl> ttl);
  static KvOp del(std::string key);
  static KvOp sadd(std::string key, std::vector<std::string> members);
  static KvOp srem(std::string key, std::vector<std::string> members);
  static KvOp pexpire(std::string key, Ttl ttl);
};

// Backend boundary of the networked tier. Every call returns false (or an
// empty optional) on failure and fills *err; a missing key is not a failure.
class KvClient {
public:
  virtual ~KvClient() = default;

  virtual bool ping(std::string *err = nullptr) = 0;
  virtual std::optional<std::string> get(const std::string &key,
                                         std::string *err = nullptr) = 0;
  // A TTL of zero or none stores the key without expiry.
  virtual bool set(const std::string &key, const std::string &value,
                   std::optional<Ttl> ttl, std::string *err = nullptr) = 0;
  virtual bool del(const std::vector<std::string> &keys, std::size_t *removed,
                   std::string *err = nullptr) = 0;
  virtual bool sadd(const std::string &key,
                    const std::vector<std::string> &members,
                    std::string *err = nullptr) = 0;
  virtual bool srem(const std::string &key,
                    const std::vector<std::string> &members,
                    std::string *err = nullptr) = 0;
  virtual bool smembers(const std::string &key, std::vector<std::string> *out,
                        std::string *err = nullptr) = 0;
  virtual bool pexpire(const std::string &key, Ttl ttl,
                       std::string *err = nullptr) = 0;
  // Enumerates keys. Backends without native prefix scanning must be called
  // with an empty prefix and return the whole key space.
  virtual bool scan(const std::string &prefix, std::vector<std::string> *out,
                    std::string *err = nullptr) = 0;
  virtual bool exec_batch(const std::vector<KvOp> &ops,
                          std::string *err = nullptr) = 0;

  virtual bool supports_batch() const = 0;
  virtual bool supports_prefix_scan() const = 0;
};

struct MemoryKvOptions {
  bool batch{true};
  bool prefix_scan{true};
};

// In-process backend with native expiring keys. Used for embedded deployments
// and as the reference backend in tests.
class MemoryKvClient : public KvClient {
public:
  explicit MemoryKvClient(MemoryKvOptions opts = {});

  bool ping(std::string *err = nullptr) override;
  std::optional<std::string> get(const std::string &key,
                                 std::string *err = nullptr) override;
  bool set(const std::string &key, const std::string &value,
           std::optional<Ttl> ttl, std::string *err = nullptr) override;
  bool del(const std::vector<std::string> &keys, std::size_t *removed,
           std::string *err = nullptr) override;
  bool sadd(const std::string &key, const std::vector<std::string> &members,
            std::string *err = nullptr) override;
  bool srem(const std::string &key, const std::vector<std::string> &members,
            std::string *err = nullptr) override;
  bool smembers(const std::string &key, std::vector<std::string> *out,
                std::string *err = nullptr) override;
  bool pexpire(const std::string &key, Ttl ttl,
               std::string *err = nullptr) override;
  bool scan(const std::string &prefix, std::vector<std::string> *out,
            std::string *err = nullptr) override;
  bool exec_batch(const std::vector<KvOp> &ops,
                  std::string *err = nullptr) override;

  bool supports_batch() const override { return opts_.batch; }
  bool supports_prefix_scan() const override { return opts_.prefix_scan; }

  std::size_t key_count();
  std::optional<TimePoint> deadline_of(const std::string &key);

private:
  struct Item {
    std::variant<std::string, std::set<std::string>> data;
    std::optional<TimePoint> deadline;
  };

  Item *find_live_locked(const std::string &key, TimePoint now);
  bool apply_locked(const KvOp &op, TimePoint now, std::string *err);

  MemoryKvOptions opts_;
  std::map<std::string, Item> items_;
  std::mutex mu_;
};

} // namespace tiercache
