#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tiercache {

// Shared "tiercache" logger. Created on first use with a stdout colour sink;
// an application may register its own logger under the same name beforehand.
std::shared_ptr<spdlog::logger> logger();

bool set_log_level(const std::string &level);

} // namespace tiercache
