#include "tiercache/config.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tiercache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = std::numeric_limits<std::uint64_t>::max();
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key, bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

std::uint64_t clamp_u(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

std::optional<Ttl> ttl_from_seconds(std::uint64_t s) {
  if (s == 0)
    return std::nullopt;
  return Ttl(static_cast<Ttl::rep>(s) * 1000);
}

constexpr std::uint64_t kMaxTtlSeconds = 10ULL * 365 * 86400;
} // namespace

bool load_manager_config(const std::string &path, ManagerConfig &cfg,
                         std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  ManagerConfig next = cfg;
  std::uint64_t u;
  std::string s;
  bool b;

  if (extract_u64(text, "l1_capacity", u))
    next.l1.capacity = static_cast<std::size_t>(clamp_u(u, 1, 100000000));
  if (extract_u64(text, "l1_ttl_s", u))
    next.l1.default_ttl = ttl_from_seconds(clamp_u(u, 0, kMaxTtlSeconds));
  if (extract_string(text, "l1_strategy", s) &&
      !parse_strategy(s, next.l1.strategy)) {
    if (err)
      *err = "unknown l1_strategy: " + s;
    return false;
  }

  if (extract_bool(text, "l2_enabled", b))
    next.l2.enabled = b;
  if (extract_string(text, "l2_host", s))
    next.l2.kv.host = s;
  if (extract_u64(text, "l2_port", u))
    next.l2.kv.port = static_cast<int>(clamp_u(u, 1, 65535));
  if (extract_string(text, "l2_password", s))
    next.l2.kv.password = s;
  if (extract_u64(text, "l2_db", u))
    next.l2.kv.db = static_cast<int>(clamp_u(u, 0, 15));
  if (extract_string(text, "l2_namespace", s))
    next.l2.key_prefix = s;
  if (extract_u64(text, "l2_ttl_s", u))
    next.l2.default_ttl = ttl_from_seconds(clamp_u(u, 0, kMaxTtlSeconds));
  if (extract_u64(text, "l2_timeout_ms", u))
    next.l2.kv.timeout =
        std::chrono::milliseconds(clamp_u(u, 1, 60 * 1000));

  if (extract_bool(text, "l3_enabled", b))
    next.l3.enabled = b;
  if (extract_string(text, "l3_dir", s)) {
    if (s.empty()) {
      if (err)
        *err = "l3_dir must not be empty";
      return false;
    }
    next.l3.dir = s;
  }
  if (extract_u64(text, "l3_ttl_s", u))
    next.l3.default_ttl = ttl_from_seconds(clamp_u(u, 0, kMaxTtlSeconds));
  if (extract_u64(text, "l3_sweep_interval_s", u))
    next.l3.sweep_interval =
        std::chrono::milliseconds(clamp_u(u, 1, 86400) * 1000);

  if (extract_bool(text, "allow_degraded", b))
    next.allow_degraded = b;
  if (extract_string(text, "log_level", s))
    next.log_level = s;

  cfg = std::move(next);
  return true;
}

} // namespace tiercache
