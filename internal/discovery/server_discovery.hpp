#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "workstream/v1.hpp"

namespace workstream::discovery {

struct DiscoveryOptions {
  std::string               cache_root;
  std::string               project_name;
  std::string               host               = "127.0.0.1";
  uint16_t                  default_port       = 3001;
  int                       port_scan_attempts = 10;
  std::string               health_path        = "/api/health";
  std::chrono::milliseconds health_timeout{2000};

  static DiscoveryOptions FromConfig(const workstream::runtime::config::RuntimeConfig& config);
};

struct DiscoveryResult {
  uint16_t                                  port     = 0;
  bool                                      existing = false;
  std::optional<workstream::v1::ServerLock> lock;
};

/*
  Decides whether a live server already owns the project or which port a new
  one should bind. A lock whose process is gone or whose health probe fails is
  treated as stale and removed.
*/
class ServerDiscovery {
 public:
  explicit ServerDiscovery(DiscoveryOptions options);

  DiscoveryResult Discover() const;

  const std::string& LockPath() const {
    return lock_path_;
  }

 private:
  DiscoveryOptions options_;
  std::string      lock_path_;
};

} // namespace workstream::discovery
