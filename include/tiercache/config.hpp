#pragma once

#include "tiercache/disk_tier.hpp"
#include "tiercache/memory_tier.hpp"
#include "tiercache/remote_tier.hpp"

#include <string>

namespace tiercache {

struct ManagerConfig {
  MemoryTierConfig l1;
  RemoteTierConfig l2;
  DiskTierConfig l3;
  // Keep running with a tier marked down when it fails to start.
  bool allow_degraded{false};
  std::string log_level{"info"};
};

// Reads a flat JSON object, e.g.
//   {"l1_capacity": 5000, "l1_strategy": "fifo", "l2_enabled": true,
//    "l2_host": "10.0.0.5", "l3_dir": "/var/cache/app"}
// Unknown keys are ignored and numbers are clamped. TTLs are in seconds, 0
// meaning no expiry. On failure cfg is left untouched.
bool load_manager_config(const std::string &path, ManagerConfig &cfg,
                         std::string *err = nullptr);

} // namespace tiercache
