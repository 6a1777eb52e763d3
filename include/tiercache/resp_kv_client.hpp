#pragma once

#include "tiercache/kv_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace tiercache {

struct RespKvConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::string password;
  int db{0};
  std::chrono::milliseconds timeout{500};
  std::size_t scan_count{1000};
};

// Redis backend on one hiredis connection. Calls are serialized on the
// connection; any I/O error or timeout drops the connection and the next call
// reconnects.
class RespKvClient final : public KvClient {
public:
  explicit RespKvClient(RespKvConfig cfg);
  ~RespKvClient() override;

  RespKvClient(const RespKvClient &) = delete;
  RespKvClient &operator=(const RespKvClient &) = delete;

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

  bool supports_batch() const override { return true; }
  bool supports_prefix_scan() const override { return true; }

  bool connected() const;

  // Escapes glob metacharacters so the prefix matches literally in SCAN MATCH.
  static std::string glob_escape(const std::string &prefix);

private:
  struct ReplyDeleter {
    void operator()(redisReply *r) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected_locked(std::string *err);
  void disconnect_locked(std::string *err, const char *what);
  bool append_locked(const std::vector<std::string> &args, std::string *err);
  ReplyPtr read_reply_locked(std::string *err);
  // Sends one command and returns its reply; error replies are failures.
  ReplyPtr command(const std::vector<std::string> &args, std::string *err);
  ReplyPtr command_locked(const std::vector<std::string> &args,
                          std::string *err);
  static std::vector<std::string> op_args(const KvOp &op);

  RespKvConfig cfg_;
  std::unique_ptr<redisContext, void (*)(redisContext *)> ctx_;
  mutable std::mutex mu_;
};

} // namespace tiercache
