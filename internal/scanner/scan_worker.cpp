#include "scan_worker.hpp"

#include "commit_scanner.hpp"
#include "internal/observability/logging.hpp"

namespace workstream::scanner {

ScanWorker::ScanWorker(std::shared_ptr<CommitScanner> scanner, std::chrono::seconds interval)
    : scanner_(std::move(scanner)), interval_(interval) {
}

ScanWorker::~ScanWorker() {
  Stop();
}

void ScanWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ScanWorker::Run, this);
}

void ScanWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ScanWorker::Run() {
  while (running_) {
    try {
      auto summary = scanner_->ScanAll();
      if (summary.commits_added > 0) {
        WORKSTREAM_LOG_INFO("periodic scan recorded new commits", {observability::IntField("commits_added", summary.commits_added)});
      }
    } catch (const std::exception& e) {
      WORKSTREAM_LOG_ERROR("periodic scan failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace workstream::scanner
