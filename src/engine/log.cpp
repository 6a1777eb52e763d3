#include "tiercache/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <mutex>

namespace tiercache {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (spdlog::get("tiercache"))
      return;
    try {
      auto l = spdlog::stdout_color_mt("tiercache");
      l->set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "tiercache logger init failed: " << e.what() << "\n";
    }
  });
  auto l = spdlog::get("tiercache");
  if (!l)
    return spdlog::default_logger();
  return l;
}

bool set_log_level(const std::string &level) {
  const auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off")
    return false;
  logger()->set_level(lvl);
  return true;
}

} // namespace tiercache
