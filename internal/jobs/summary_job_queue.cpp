#include "summary_job_queue.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace workstream::jobs {

using db::model::SummaryJobRecord;
using workstream::model::SummaryJobStatus;

LedgerSummaryJobQueue::LedgerSummaryJobQueue(std::shared_ptr<db::Repository> repository, int max_attempts)
    : repository_(std::move(repository)), max_attempts_(max_attempts > 0 ? max_attempts : 1) {
}

int64_t LedgerSummaryJobQueue::Enqueue(SummaryJobRecord job) {
  if (job.stream_id.empty()) throw util::InvalidArgument("streamId", "summary job requires a stream id");

  job.status        = SummaryJobStatus::kPending;
  job.attempts      = 0;
  job.max_attempts  = max_attempts_;
  job.error_message = std::nullopt;
  job.started_at    = std::nullopt;
  job.completed_at  = std::nullopt;
  job.created_at    = util::ToIso8601(util::Now());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertSummaryJob(*tx, job), "enqueue summary job for " + job.stream_id);
  tx->Commit();

  WORKSTREAM_LOG_INFO("summary job queued", {observability::IntField("job_id", job.id), observability::StringField("stream_id", job.stream_id)});
  return job.id;
}

std::optional<SummaryJobRecord> LedgerSummaryJobQueue::ClaimNext() {
  auto tx  = repository_->Begin();
  auto job = repository_->NextPendingSummaryJob(*tx);
  if (!job) {
    tx->Commit();
    return std::nullopt;
  }

  job->status     = SummaryJobStatus::kRunning;
  job->attempts  += 1;
  job->started_at = util::ToIso8601(util::Now());
  db::ThrowIfDbError(repository_->UpdateSummaryJob(*tx, *job), "claim summary job " + std::to_string(job->id));
  tx->Commit();
  return job;
}

void LedgerSummaryJobQueue::MarkDone(int64_t id) {
  auto tx  = repository_->Begin();
  auto job = Load(*tx, id);

  job.status        = SummaryJobStatus::kDone;
  job.error_message = std::nullopt;
  job.completed_at  = util::ToIso8601(util::Now());
  db::ThrowIfDbError(repository_->UpdateSummaryJob(*tx, job), "complete summary job " + std::to_string(id));
  tx->Commit();
}

void LedgerSummaryJobQueue::MarkFailed(int64_t id, const std::string& error) {
  auto tx  = repository_->Begin();
  auto job = Load(*tx, id);

  job.error_message = error;
  if (job.attempts < job.max_attempts) {
    job.status = SummaryJobStatus::kPending;
  } else {
    job.status       = SummaryJobStatus::kFailed;
    job.completed_at = util::ToIso8601(util::Now());
  }
  db::ThrowIfDbError(repository_->UpdateSummaryJob(*tx, job), "fail summary job " + std::to_string(id));
  tx->Commit();

  WORKSTREAM_LOG_WARN("summary job failed", {observability::IntField("job_id", id),
                                             observability::IntField("attempts", job.attempts),
                                             observability::StringField("status", workstream::model::ToString(job.status)),
                                             observability::StringField("error", error)});
}

std::optional<SummaryJobRecord> LedgerSummaryJobQueue::Get(int64_t id) {
  auto tx  = repository_->BeginRead();
  auto job = repository_->GetSummaryJob(*tx, id);
  tx->Commit();
  return job;
}

std::vector<SummaryJobRecord> LedgerSummaryJobQueue::ListByStatus(const std::optional<SummaryJobStatus>& status) {
  auto tx   = repository_->BeginRead();
  auto jobs = repository_->ListSummaryJobs(*tx, status);
  tx->Commit();
  return jobs;
}

SummaryJobRecord LedgerSummaryJobQueue::Load(db::Transaction& tx, int64_t id) {
  auto job = repository_->GetSummaryJob(tx, id);
  if (!job) throw util::NotFound("summary job not found: " + std::to_string(id));
  return *job;
}

} // namespace workstream::jobs
