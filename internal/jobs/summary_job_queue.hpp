#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/summary_job_record.hpp"

namespace workstream::jobs {

/*
  Sink for post-retirement summary work. Retirement only needs Enqueue.
*/
class SummaryJobQueue {
 public:
  virtual ~SummaryJobQueue() = default;

  // Returns the assigned job id.
  virtual int64_t Enqueue(db::model::SummaryJobRecord job) = 0;
};

/*
  Work table backed by summary_jobs.

  Lifecycle:
    pending -> running -> done
                       -> pending (attempts left) | failed
*/
class LedgerSummaryJobQueue final : public SummaryJobQueue {
 public:
  LedgerSummaryJobQueue(std::shared_ptr<db::Repository> repository, int max_attempts = 3);

  int64_t Enqueue(db::model::SummaryJobRecord job) override;

  // Oldest pending job with attempts left, moved to running.
  std::optional<db::model::SummaryJobRecord> ClaimNext();

  void MarkDone(int64_t id);
  void MarkFailed(int64_t id, const std::string& error);

  std::optional<db::model::SummaryJobRecord> Get(int64_t id);
  std::vector<db::model::SummaryJobRecord>   ListByStatus(const std::optional<workstream::model::SummaryJobStatus>& status);

 private:
  db::model::SummaryJobRecord Load(db::Transaction& tx, int64_t id);

  std::shared_ptr<db::Repository> repository_;
  int                             max_attempts_;
};

} // namespace workstream::jobs
