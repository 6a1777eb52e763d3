#include "tiercache/config.hpp"
#include "tiercache/log.hpp"
#include "tiercache/manager.hpp"
#include "tiercache/resp.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <netinet/in.h>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>
#include <vector>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<std::string> split_csv(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream in(s);
  while (std::getline(in, cur, ','))
    if (!cur.empty())
      out.push_back(cur);
  return out;
}

bool parse_tiers(const std::string &csv, std::vector<tiercache::Tier> &out) {
  out.clear();
  for (const auto &name : split_csv(csv)) {
    auto t = tiercache::parse_tier(name);
    if (!t.has_value())
      return false;
    if (std::find(out.begin(), out.end(), *t) == out.end())
      out.push_back(*t);
  }
  return !out.empty();
}

struct ClientState {
  tiercache::RespParser parser;
  std::string out;
};

struct ServerStats {
  std::uint64_t rejected_requests{0};
  std::uint64_t request_count{0};
};

using Command = std::vector<std::string>;

// Trailing "TIERS l1,l2" option shared by the fan-out commands. Returns false
// on a malformed option list.
bool parse_tier_option(const Command &cmd, std::size_t from,
                       std::vector<tiercache::Tier> &tiers) {
  tiers = tiercache::all_tiers();
  if (from == cmd.size())
    return true;
  if (from + 2 != cmd.size() || upper(cmd[from]) != "TIERS")
    return false;
  return parse_tiers(cmd[from + 1], tiers);
}

std::string handle_set(tiercache::CacheManager &mgr, const Command &cmd) {
  if (cmd.size() < 3)
    return tiercache::resp_error(
        "SET key value [EX s] [PX ms] [TAGS a,b] [TIERS l1,l2,l3]");
  std::optional<tiercache::Ttl> ttl;
  tiercache::TagSet tags;
  std::vector<tiercache::Tier> tiers = tiercache::all_tiers();
  for (std::size_t i = 3; i < cmd.size(); i += 2) {
    if (i + 1 >= cmd.size())
      return tiercache::resp_error("syntax error");
    const auto opt = upper(cmd[i]);
    std::uint64_t n = 0;
    if (opt == "EX" || opt == "PX") {
      if (!parse_u64(cmd[i + 1], n))
        return tiercache::resp_error("invalid numeric argument");
      ttl = tiercache::Ttl(static_cast<tiercache::Ttl::rep>(
          opt == "EX" ? n * 1000 : n));
    } else if (opt == "TAGS") {
      for (auto &t : split_csv(cmd[i + 1]))
        tags.insert(std::move(t));
    } else if (opt == "TIERS") {
      if (!parse_tiers(cmd[i + 1], tiers))
        return tiercache::resp_error("invalid tier list");
    } else {
      return tiercache::resp_error("syntax error");
    }
  }
  tiercache::TtlMap ttls;
  if (ttl.has_value())
    for (const auto t : tiers)
      ttls[t] = *ttl;
  const tiercache::Bytes value(cmd[2].begin(), cmd[2].end());
  if (!mgr.set(cmd[1], value, ttls, tags, tiers))
    return tiercache::resp_error("write failed on one or more tiers");
  return tiercache::resp_simple("OK");
}

std::string handle_get(tiercache::CacheManager &mgr, const Command &cmd) {
  std::optional<tiercache::Tier> tier;
  if (cmd.size() == 4 && upper(cmd[2]) == "TIER") {
    tier = tiercache::parse_tier(cmd[3]);
    if (!tier.has_value())
      return tiercache::resp_error("invalid tier");
  } else if (cmd.size() != 2) {
    return tiercache::resp_error("GET key [TIER l1|l2|l3]");
  }
  auto v = mgr.get(cmd[1], tier);
  if (!v)
    return tiercache::resp_null();
  return tiercache::resp_bulk(std::string(v->begin(), v->end()));
}

std::string handle_invalidate(tiercache::CacheManager &mgr,
                              const Command &cmd) {
  std::vector<tiercache::Tier> tiers;
  if (cmd.size() < 3 || !parse_tier_option(cmd, 3, tiers))
    return tiercache::resp_error("INVALIDATE TAG|PREFIX value [TIERS ...]");
  const auto mode = upper(cmd[1]);
  if (mode == "TAG")
    return tiercache::resp_integer(
        static_cast<long long>(mgr.invalidate_by_tag(cmd[2], tiers)));
  if (mode == "PREFIX")
    return tiercache::resp_integer(
        static_cast<long long>(mgr.invalidate_by_prefix(cmd[2], tiers)));
  return tiercache::resp_error("INVALIDATE TAG|PREFIX value [TIERS ...]");
}

} // namespace

int main(int argc, char **argv) {
  int port = 6380;
  std::size_t max_connections = 512;
  std::size_t max_pending_out = 1 << 20;
  std::size_t max_cmds_per_iteration = 64;
  std::string config_path;
  std::optional<std::string> l3_dir;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--port" && i + 1 < argc)
      port = std::stoi(argv[++i]);
    else if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--l3-dir" && i + 1 < argc)
      l3_dir = argv[++i];
  }

  tiercache::ManagerConfig cfg;
  if (!config_path.empty()) {
    std::string err;
    if (!tiercache::load_manager_config(config_path, cfg, &err)) {
      tiercache::logger()->error("config {}: {}", config_path, err);
      return 1;
    }
  }
  if (l3_dir.has_value())
    cfg.l3.dir = *l3_dir;

  std::unique_ptr<tiercache::CacheManager> manager;
  try {
    manager = std::make_unique<tiercache::CacheManager>(cfg);
  } catch (const std::exception &e) {
    tiercache::logger()->error("startup failed: {}", e.what());
    return 1;
  }

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  int one = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(port);
  if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    tiercache::logger()->error("bind failed port={}: {}", port,
                               std::strerror(errno));
    return 1;
  }
  if (listen(server_fd, 128) < 0) {
    tiercache::logger()->error("listen failed: {}", std::strerror(errno));
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);
  std::unordered_map<int, ClientState> clients;
  ServerStats stats;
  tiercache::logger()->info("tiercache_server listening on {}", port);

  while (running) {
    fd_set readfds, writefds;
    FD_ZERO(&readfds);
    FD_ZERO(&writefds);
    FD_SET(server_fd, &readfds);
    int maxfd = server_fd;
    for (const auto &[fd, st] : clients) {
      FD_SET(fd, &readfds);
      if (!st.out.empty())
        FD_SET(fd, &writefds);
      maxfd = std::max(maxfd, fd);
    }
    timeval tv{0, 20000};
    int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
    if (n < 0)
      continue;

    if (FD_ISSET(server_fd, &readfds)) {
      int cfd = accept(server_fd, nullptr, nullptr);
      if (cfd >= 0) {
        if (clients.size() >= max_connections) {
          const auto msg = tiercache::resp_error("connection limit reached");
          send(cfd, msg.data(), msg.size(), 0);
          close(cfd);
          ++stats.rejected_requests;
        } else {
          clients[cfd] = {};
        }
      }
    }

    std::vector<int> to_close;
    for (auto &[fd, st] : clients) {
      if (FD_ISSET(fd, &readfds)) {
        char buf[4096];
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r <= 0) {
          to_close.push_back(fd);
          continue;
        }
        st.parser.feed(std::string(buf, static_cast<std::size_t>(r)));
        std::size_t processed = 0;
        while (processed < max_cmds_per_iteration) {
          auto cmd = st.parser.next_command();
          if (!cmd.has_value())
            break;
          ++processed;
          ++stats.request_count;

          if (cmd->size() == 1 && cmd->front() == "__MALFORMED__") {
            ++stats.rejected_requests;
            st.out += tiercache::resp_error("malformed RESP");
            break;
          }
          if (cmd->empty()) {
            ++stats.rejected_requests;
            st.out += tiercache::resp_error("empty command");
            continue;
          }

          const std::string op_name = upper((*cmd)[0]);
          std::string reply;
          if (op_name == "PING") {
            reply = tiercache::resp_simple("PONG");
          } else if (op_name == "SET") {
            reply = handle_set(*manager, *cmd);
          } else if (op_name == "GET") {
            reply = cmd->size() < 2 ? tiercache::resp_error("GET key")
                                    : handle_get(*manager, *cmd);
          } else if (op_name == "DEL") {
            std::vector<tiercache::Tier> tiers;
            if (cmd->size() < 2 || !parse_tier_option(*cmd, 2, tiers))
              reply = tiercache::resp_error("DEL key [TIERS l1,l2,l3]");
            else
              reply = tiercache::resp_integer(
                  manager->del((*cmd)[1], tiers) ? 1 : 0);
          } else if (op_name == "INVALIDATE") {
            reply = handle_invalidate(*manager, *cmd);
          } else if (op_name == "CLEAR") {
            std::vector<tiercache::Tier> tiers;
            if (!parse_tier_option(*cmd, 1, tiers))
              reply = tiercache::resp_error("CLEAR [TIERS l1,l2,l3]");
            else if (manager->clear(tiers))
              reply = tiercache::resp_simple("OK");
            else
              reply = tiercache::resp_error("clear failed on one or more tiers");
          } else if (op_name == "INFO") {
            std::ostringstream info;
            info << manager->info();
            info << "connected_clients:" << clients.size() << "\n";
            info << "total_requests:" << stats.request_count << "\n";
            info << "rejected_requests:" << stats.rejected_requests << "\n";
            reply = tiercache::resp_bulk(info.str());
          } else {
            reply = tiercache::resp_error("unknown command");
          }
          if (reply.rfind("-", 0) == 0)
            ++stats.rejected_requests;
          st.out += reply;

          if (st.out.size() > max_pending_out) {
            to_close.push_back(fd);
            break;
          }
        }
      }

      if (FD_ISSET(fd, &writefds) && !st.out.empty()) {
        const std::size_t send_bytes =
            std::min<std::size_t>(st.out.size(), 8192);
        ssize_t w = send(fd, st.out.data(), send_bytes, 0);
        if (w <= 0)
          to_close.push_back(fd);
        else
          st.out.erase(0, static_cast<std::size_t>(w));
      }
    }

    std::sort(to_close.begin(), to_close.end());
    to_close.erase(std::unique(to_close.begin(), to_close.end()),
                   to_close.end());
    for (int fd : to_close) {
      close(fd);
      clients.erase(fd);
    }
  }

  tiercache::logger()->info("shutting down");
  for (auto &[fd, _] : clients)
    close(fd);
  close(server_fd);
  manager->shutdown();
  return 0;
}
