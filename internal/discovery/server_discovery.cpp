#include "server_discovery.hpp"

#include "internal/discovery/server_lock.hpp"
#include "internal/observability/logging.hpp"

namespace workstream::discovery {

DiscoveryOptions DiscoveryOptions::FromConfig(const workstream::runtime::config::RuntimeConfig& config) {
  DiscoveryOptions options;
  options.cache_root         = config.lock().cache_root();
  options.project_name       = config.project().name();
  options.host               = config.server().bind_host();
  options.default_port       = static_cast<uint16_t>(config.server().port() != 0 ? config.server().port() : config.server().default_port());
  options.port_scan_attempts = config.server().port_scan_attempts();
  options.health_path        = config.server().health_path();
  options.health_timeout     = std::chrono::milliseconds(config.server().health_timeout_ms());
  return options;
}

ServerDiscovery::ServerDiscovery(DiscoveryOptions options)
    : options_(std::move(options)), lock_path_(LockFilePath(options_.cache_root, options_.project_name)) {
}

DiscoveryResult ServerDiscovery::Discover() const {
  auto lock = ReadLockFile(lock_path_);
  if (lock) {
    const bool alive   = IsProcessAlive(lock->pid());
    const bool healthy = alive && ProbeHealth(options_.host, static_cast<uint16_t>(lock->port()), options_.health_path, options_.health_timeout);

    if (healthy) {
      WORKSTREAM_LOG_INFO("found running server", {observability::IntField("pid", lock->pid()), observability::IntField("port", lock->port())});
      DiscoveryResult result;
      result.port     = static_cast<uint16_t>(lock->port());
      result.existing = true;
      result.lock     = std::move(lock);
      return result;
    }

    WORKSTREAM_LOG_WARN("removing stale server lock", {observability::IntField("pid", lock->pid()),
                                                       observability::IntField("port", lock->port()),
                                                       observability::BoolField("process_alive", alive)});
    RemoveLockFile(lock_path_);
  }

  DiscoveryResult result;
  result.port = FindAvailablePort(options_.host, options_.default_port, options_.port_scan_attempts);
  return result;
}

} // namespace workstream::discovery
