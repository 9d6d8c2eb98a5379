#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "workstream/v1.hpp"

namespace workstream::discovery {

// <cache_root>/projects/<project_name>/.api-server.lock
std::string LockFilePath(const std::string& cache_root, const std::string& project_name);

// Missing, unreadable or corrupt lock files all read as absent.
std::optional<workstream::v1::ServerLock> ReadLockFile(const std::string& path);

// Full overwrite through a sibling temp file and rename(2). Throws on I/O failure.
void WriteLockFile(const std::string& path, const workstream::v1::ServerLock& lock);

// True if the file is gone afterwards.
bool RemoveLockFile(const std::string& path);

// kill(pid, 0); EPERM still means the process exists.
bool IsProcessAlive(int pid);

// HTTP/1.1 GET with one deadline covering connect, write and read.
bool ProbeHealth(const std::string& host, uint16_t port, const std::string& path, std::chrono::milliseconds timeout);

bool IsPortAvailable(const std::string& host, uint16_t port);

// First bindable port in [start, start + attempts). Throws util::ResourceExhausted.
uint16_t FindAvailablePort(const std::string& host, uint16_t start, int attempts);

/*
  RAII owner of the lock file for the process that won the race.

  Writes the lock on construction and removes it on destruction, but only
  while the file still names this process.
*/
class ServerLockGuard {
 public:
  ServerLockGuard(std::string path, workstream::v1::ServerLock lock);
  ~ServerLockGuard();

  ServerLockGuard(const ServerLockGuard&)            = delete;
  ServerLockGuard& operator=(const ServerLockGuard&) = delete;

  void Release();

  const workstream::v1::ServerLock& Lock() const {
    return lock_;
  }

 private:
  std::string                path_;
  workstream::v1::ServerLock lock_;
  bool                       released_ = false;
};

} // namespace workstream::discovery
