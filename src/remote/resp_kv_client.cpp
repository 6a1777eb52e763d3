#include "tiercache/resp_kv_client.hpp"

#include <hiredis/hiredis.h>

#include <cerrno>
#include <set>
#include <sys/time.h>

namespace tiercache {
namespace {

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

timeval to_timeval(std::chrono::milliseconds ms) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

// hiredis reports an expired SO_RCVTIMEO as an I/O error with EAGAIN.
std::string describe(const redisContext *c, int saved_errno) {
  if (c == nullptr)
    return "no connection";
  const std::string msg = c->errstr[0] != '\0' ? c->errstr : "unknown error";
  if (c->err == REDIS_ERR_IO &&
      (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK ||
       msg == "Resource temporarily unavailable"))
    return "read timeout";
  if (msg.find("timeout") != std::string::npos ||
      msg.find("timed out") != std::string::npos)
    return "timeout: " + msg;
  return msg;
}

std::string reply_text(const redisReply *r) {
  if (r->str == nullptr)
    return {};
  return std::string(r->str, r->len);
}

std::string ttl_ms_arg(Ttl ttl) { return std::to_string(ttl.count()); }

void to_argv(const std::vector<std::string> &args,
             std::vector<const char *> &argv, std::vector<std::size_t> &lens) {
  argv.clear();
  lens.clear();
  argv.reserve(args.size());
  lens.reserve(args.size());
  for (const auto &a : args) {
    argv.push_back(a.data());
    lens.push_back(a.size());
  }
}

} // namespace

void RespKvClient::ReplyDeleter::operator()(redisReply *r) const {
  freeReplyObject(r);
}

RespKvClient::RespKvClient(RespKvConfig cfg)
    : cfg_(std::move(cfg)), ctx_(nullptr, redisFree) {}

RespKvClient::~RespKvClient() = default;

bool RespKvClient::connected() const {
  std::lock_guard lock(mu_);
  return ctx_ != nullptr;
}

std::string RespKvClient::glob_escape(const std::string &prefix) {
  std::string out;
  out.reserve(prefix.size());
  for (char c : prefix) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

bool RespKvClient::ping(std::string *err) {
  auto r = command({"PING"}, err);
  if (!r)
    return false;
  if (r->type != REDIS_REPLY_STATUS || reply_text(r.get()) != "PONG") {
    set_err(err, "unexpected PING reply");
    return false;
  }
  return true;
}

std::optional<std::string> RespKvClient::get(const std::string &key,
                                             std::string *err) {
  auto r = command({"GET", key}, err);
  if (!r || r->type == REDIS_REPLY_NIL)
    return std::nullopt;
  if (r->type != REDIS_REPLY_STRING) {
    set_err(err, "unexpected GET reply");
    return std::nullopt;
  }
  return reply_text(r.get());
}

bool RespKvClient::set(const std::string &key, const std::string &value,
                       std::optional<Ttl> ttl, std::string *err) {
  std::vector<std::string> args{"SET", key, value};
  if (ttl.has_value() && ttl->count() > 0) {
    args.push_back("PX");
    args.push_back(ttl_ms_arg(*ttl));
  }
  auto r = command(args, err);
  if (!r)
    return false;
  if (r->type != REDIS_REPLY_STATUS) {
    set_err(err, "unexpected SET reply");
    return false;
  }
  return true;
}

bool RespKvClient::del(const std::vector<std::string> &keys,
                       std::size_t *removed, std::string *err) {
  if (removed)
    *removed = 0;
  if (keys.empty())
    return true;
  std::vector<std::string> args{"DEL"};
  args.insert(args.end(), keys.begin(), keys.end());
  auto r = command(args, err);
  if (!r)
    return false;
  if (r->type != REDIS_REPLY_INTEGER) {
    set_err(err, "unexpected DEL reply");
    return false;
  }
  if (removed)
    *removed = static_cast<std::size_t>(r->integer);
  return true;
}

bool RespKvClient::sadd(const std::string &key,
                        const std::vector<std::string> &members,
                        std::string *err) {
  if (members.empty())
    return true;
  std::vector<std::string> args{"SADD", key};
  args.insert(args.end(), members.begin(), members.end());
  return command(args, err) != nullptr;
}

bool RespKvClient::srem(const std::string &key,
                        const std::vector<std::string> &members,
                        std::string *err) {
  if (members.empty())
    return true;
  std::vector<std::string> args{"SREM", key};
  args.insert(args.end(), members.begin(), members.end());
  return command(args, err) != nullptr;
}

bool RespKvClient::smembers(const std::string &key,
                            std::vector<std::string> *out, std::string *err) {
  out->clear();
  auto r = command({"SMEMBERS", key}, err);
  if (!r)
    return false;
  if (r->type != REDIS_REPLY_ARRAY) {
    set_err(err, "unexpected SMEMBERS reply");
    return false;
  }
  for (std::size_t i = 0; i < r->elements; ++i)
    out->push_back(reply_text(r->element[i]));
  return true;
}

bool RespKvClient::pexpire(const std::string &key, Ttl ttl, std::string *err) {
  return command({"PEXPIRE", key, ttl_ms_arg(ttl)}, err) != nullptr;
}

bool RespKvClient::scan(const std::string &prefix,
                        std::vector<std::string> *out, std::string *err) {
  out->clear();
  std::set<std::string> seen;
  const std::string pattern = glob_escape(prefix) + "*";
  std::string cursor = "0";
  do {
    auto r = command({"SCAN", cursor, "MATCH", pattern, "COUNT",
                      std::to_string(cfg_.scan_count)},
                     err);
    if (!r)
      return false;
    if (r->type != REDIS_REPLY_ARRAY || r->elements != 2 ||
        r->element[1]->type != REDIS_REPLY_ARRAY) {
      set_err(err, "unexpected SCAN reply");
      return false;
    }
    cursor = reply_text(r->element[0]);
    const redisReply *keys = r->element[1];
    for (std::size_t i = 0; i < keys->elements; ++i) {
      auto k = reply_text(keys->element[i]);
      if (seen.insert(k).second)
        out->push_back(std::move(k));
    }
  } while (cursor != "0");
  return true;
}

bool RespKvClient::exec_batch(const std::vector<KvOp> &ops, std::string *err) {
  std::vector<std::vector<std::string>> cmds;
  cmds.reserve(ops.size());
  for (const auto &op : ops) {
    auto args = op_args(op);
    if (!args.empty())
      cmds.push_back(std::move(args));
  }
  if (cmds.empty())
    return true;

  std::lock_guard lock(mu_);
  if (!ensure_connected_locked(err))
    return false;
  // Pipelined: MULTI, the queued commands and EXEC go out in one write.
  if (!append_locked({"MULTI"}, err))
    return false;
  for (const auto &c : cmds)
    if (!append_locked(c, err))
      return false;
  if (!append_locked({"EXEC"}, err))
    return false;

  // +OK for MULTI, +QUEUED per command, then the EXEC result array.
  std::string queue_err;
  for (std::size_t i = 0; i < cmds.size() + 1; ++i) {
    auto r = read_reply_locked(err);
    if (!r)
      return false;
    if (r->type == REDIS_REPLY_ERROR && queue_err.empty())
      queue_err = reply_text(r.get());
  }
  auto exec = read_reply_locked(err);
  if (!exec)
    return false;
  if (!queue_err.empty()) {
    set_err(err, "batch rejected: " + queue_err);
    return false;
  }
  if (exec->type != REDIS_REPLY_ARRAY) {
    set_err(err, "batch aborted: " + reply_text(exec.get()));
    return false;
  }
  for (std::size_t i = 0; i < exec->elements; ++i) {
    if (exec->element[i]->type == REDIS_REPLY_ERROR) {
      set_err(err, "batch command failed: " + reply_text(exec->element[i]));
      return false;
    }
  }
  return true;
}

std::vector<std::string> RespKvClient::op_args(const KvOp &op) {
  switch (op.kind) {
  case KvOp::Kind::Set: {
    std::vector<std::string> args{"SET", op.key, op.value};
    if (op.ttl.has_value() && op.ttl->count() > 0) {
      args.push_back("PX");
      args.push_back(ttl_ms_arg(*op.ttl));
    }
    return args;
  }
  case KvOp::Kind::Del:
    return {"DEL", op.key};
  case KvOp::Kind::SAdd:
  case KvOp::Kind::SRem: {
    if (op.members.empty())
      return {};
    std::vector<std::string> args{op.kind == KvOp::Kind::SAdd ? "SADD" : "SREM",
                                  op.key};
    args.insert(args.end(), op.members.begin(), op.members.end());
    return args;
  }
  case KvOp::Kind::PExpire:
    if (!op.ttl.has_value())
      return {};
    return {"PEXPIRE", op.key, ttl_ms_arg(*op.ttl)};
  }
  return {};
}

RespKvClient::ReplyPtr RespKvClient::command(
    const std::vector<std::string> &args, std::string *err) {
  std::lock_guard lock(mu_);
  if (!ensure_connected_locked(err))
    return nullptr;
  auto r = command_locked(args, err);
  if (r && r->type == REDIS_REPLY_ERROR) {
    set_err(err, reply_text(r.get()));
    return nullptr;
  }
  return r;
}

RespKvClient::ReplyPtr RespKvClient::command_locked(
    const std::vector<std::string> &args, std::string *err) {
  std::vector<const char *> argv;
  std::vector<std::size_t> lens;
  to_argv(args, argv, lens);
  void *raw = redisCommandArgv(ctx_.get(), static_cast<int>(argv.size()),
                               argv.data(), lens.data());
  if (raw == nullptr) {
    disconnect_locked(err, args.front().c_str());
    return nullptr;
  }
  return ReplyPtr(static_cast<redisReply *>(raw));
}

bool RespKvClient::append_locked(const std::vector<std::string> &args,
                                 std::string *err) {
  std::vector<const char *> argv;
  std::vector<std::size_t> lens;
  to_argv(args, argv, lens);
  if (redisAppendCommandArgv(ctx_.get(), static_cast<int>(argv.size()),
                             argv.data(), lens.data()) != REDIS_OK) {
    disconnect_locked(err, args.front().c_str());
    return false;
  }
  return true;
}

RespKvClient::ReplyPtr RespKvClient::read_reply_locked(std::string *err) {
  void *raw = nullptr;
  if (redisGetReply(ctx_.get(), &raw) != REDIS_OK || raw == nullptr) {
    disconnect_locked(err, "reply");
    return nullptr;
  }
  return ReplyPtr(static_cast<redisReply *>(raw));
}

bool RespKvClient::ensure_connected_locked(std::string *err) {
  if (ctx_)
    return true;
  const timeval tv = to_timeval(cfg_.timeout);
  ctx_.reset(redisConnectWithTimeout(cfg_.host.c_str(), cfg_.port, tv));
  if (!ctx_) {
    set_err(err, "cannot allocate redis context");
    return false;
  }
  if (ctx_->err != 0) {
    disconnect_locked(err, "connect");
    return false;
  }
  if (redisSetTimeout(ctx_.get(), tv) != REDIS_OK) {
    disconnect_locked(err, "set timeout");
    return false;
  }

  if (!cfg_.password.empty()) {
    auto r = command_locked({"AUTH", cfg_.password}, err);
    if (!r)
      return false;
    if (r->type == REDIS_REPLY_ERROR) {
      set_err(err, "AUTH failed: " + reply_text(r.get()));
      ctx_.reset();
      return false;
    }
  }
  if (cfg_.db != 0) {
    auto r = command_locked({"SELECT", std::to_string(cfg_.db)}, err);
    if (!r)
      return false;
    if (r->type == REDIS_REPLY_ERROR) {
      set_err(err, "SELECT failed: " + reply_text(r.get()));
      ctx_.reset();
      return false;
    }
  }
  return true;
}

void RespKvClient::disconnect_locked(std::string *err, const char *what) {
  const int saved_errno = errno;
  set_err(err, std::string(what) + ": " + describe(ctx_.get(), saved_errno));
  ctx_.reset();
}

} // namespace tiercache
