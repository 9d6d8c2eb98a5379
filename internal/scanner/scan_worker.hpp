#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace workstream::scanner {

class CommitScanner;

/*
  Background worker that re-runs the commit scan on a fixed interval.

  Owned by the server process; started once the HTTP port is bound.
*/
class ScanWorker {
 public:
  ScanWorker(std::shared_ptr<CommitScanner> scanner, std::chrono::seconds interval);
  ~ScanWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<CommitScanner> scanner_;
  std::chrono::seconds           interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace workstream::scanner
