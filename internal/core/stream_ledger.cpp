#include "stream_ledger.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace workstream::core {

using db::model::CommitRecord;
using db::model::HistoryRecord;
using db::model::StreamRecord;
using db::model::StreamUpdate;
using workstream::model::HistoryEventType;
using workstream::model::StreamStatus;

namespace {

void ValidateProgress(int progress) {
  if (progress < 0 || progress > 100) {
    throw util::InvalidArgument("progress", "progress must be between 0 and 100, got " + std::to_string(progress));
  }
}

HistoryRecord MakeEvent(const std::string& stream_id, HistoryEventType type, std::optional<std::string> old_value,
                        std::optional<std::string> new_value, const std::string& now) {
  HistoryRecord event;
  event.stream_id  = stream_id;
  event.event_type = type;
  event.old_value  = std::move(old_value);
  event.new_value  = std::move(new_value);
  event.timestamp  = now;
  return event;
}

std::string StatusText(StreamStatus status) {
  return std::string(workstream::model::ToString(status));
}

StreamRecord Reload(db::Repository& repository, db::Transaction& tx, const std::string& id) {
  auto record = repository.GetStream(tx, id);
  if (!record) throw util::NotFound("stream not found: " + id);
  return *record;
}

} // namespace

StreamLedger::StreamLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

StreamRecord StreamLedger::Insert(StreamRecord stream) {
  if (stream.id.empty()) throw util::InvalidArgument("id", "stream id is required");
  if (stream.title.empty()) throw util::InvalidArgument("title", "stream title is required");
  if (stream.branch.empty()) throw util::InvalidArgument("branch", "stream branch is required");

  const auto now      = util::ToIso8601(util::Now());
  stream.status       = StreamStatus::kInitializing;
  stream.progress     = 0;
  stream.created_at   = now;
  stream.updated_at   = now;
  stream.completed_at = std::nullopt;
  if (stream.blocked_by && stream.blocked_by->empty()) stream.blocked_by = std::nullopt;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertStream(*tx, stream), "insert stream " + stream.id);
  db::ThrowIfDbError(repository_->InsertHistory(*tx, MakeEvent(stream.id, HistoryEventType::kCreated, std::nullopt,
                                                               StatusText(stream.status), now)),
                     "record history for " + stream.id);
  tx->Commit();

  WORKSTREAM_LOG_INFO("stream created", {observability::StringField("stream_id", stream.id),
                                         observability::StringField("branch", stream.branch)});
  return stream;
}

StreamRecord StreamLedger::Update(const std::string& id, const StreamUpdate& update) {
  if (update.progress) ValidateProgress(*update.progress);
  if (update.current_phase && *update.current_phase < 0) {
    throw util::InvalidArgument("currentPhase", "currentPhase must be >= 0");
  }

  auto tx      = repository_->Begin();
  auto current = Reload(*repository_, *tx, id);

  if (update.Empty()) {
    tx->Commit();
    return current;
  }

  const auto now = util::ToIso8601(util::Now());

  StreamUpdate fields  = update;
  const bool completes = fields.status && *fields.status == StreamStatus::kCompleted;
  if (completes) fields.status.reset();

  db::ThrowIfDbError(repository_->UpdateStream(*tx, id, fields, now), "update stream " + id);
  if (completes) {
    db::ThrowIfDbError(repository_->CompleteStream(*tx, id, now), "complete stream " + id);
  }

  if (update.status && *update.status != current.status) {
    db::ThrowIfDbError(repository_->InsertHistory(*tx, MakeEvent(id, HistoryEventType::kStatusChanged, StatusText(current.status),
                                                                 StatusText(*update.status), now)),
                       "record history for " + id);
  }
  if (update.progress && *update.progress != current.progress) {
    db::ThrowIfDbError(repository_->InsertHistory(*tx, MakeEvent(id, HistoryEventType::kProgressUpdated, std::to_string(current.progress),
                                                                 std::to_string(*update.progress), now)),
                       "record history for " + id);
  }

  auto updated = Reload(*repository_, *tx, id);
  tx->Commit();
  return updated;
}

StreamRecord StreamLedger::Complete(const std::string& id) {
  auto tx      = repository_->Begin();
  auto current = Reload(*repository_, *tx, id);

  const auto now = util::ToIso8601(util::Now());
  db::ThrowIfDbError(repository_->CompleteStream(*tx, id, now), "complete stream " + id);

  if (current.status != StreamStatus::kCompleted) {
    db::ThrowIfDbError(repository_->InsertHistory(*tx, MakeEvent(id, HistoryEventType::kStatusChanged, StatusText(current.status),
                                                                 StatusText(StreamStatus::kCompleted), now)),
                       "record history for " + id);
  }

  auto updated = Reload(*repository_, *tx, id);
  tx->Commit();
  return updated;
}

std::optional<StreamRecord> StreamLedger::Get(const std::string& id) {
  auto tx     = repository_->BeginRead();
  auto record = repository_->GetStream(*tx, id);
  tx->Commit();
  return record;
}

std::vector<db::model::StreamListRow> StreamLedger::List(const db::model::StreamFilter& filter) {
  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListStreams(*tx, filter);
  tx->Commit();
  return rows;
}

void StreamLedger::Delete(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteStream(*tx, id), "delete stream " + id);
  tx->Commit();

  WORKSTREAM_LOG_INFO("stream deleted", {observability::StringField("stream_id", id)});
}

db::Result StreamLedger::AddCommit(CommitRecord commit) {
  commit.timestamp = commit.timestamp.empty() ? util::ToIso8601(util::Now()) : util::NormalizeIso8601(commit.timestamp);
  if (commit.files_changed < 0) commit.files_changed = 0;

  auto tx  = repository_->Begin();
  auto res = repository_->InsertCommit(*tx, commit);
  if (!res) {
    return res;
  }

  res = repository_->TouchStream(*tx, commit.stream_id, util::ToIso8601(util::Now()));
  if (!res) {
    return res;
  }

  tx->Commit();
  return db::Result::Ok();
}

void StreamLedger::AddHistoryEvent(HistoryRecord event) {
  if (event.timestamp.empty()) event.timestamp = util::ToIso8601(util::Now());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertHistory(*tx, event), "record history for " + event.stream_id);
  tx->Commit();
}

std::vector<HistoryRecord> StreamLedger::History(const std::string& id) {
  auto tx     = repository_->BeginRead();
  auto events = repository_->ListHistory(*tx, id);
  tx->Commit();
  return events;
}

std::vector<CommitRecord> StreamLedger::ListCommits(const std::optional<std::string>& stream_id, int limit) {
  if (limit <= 0) limit = 20;

  auto tx      = repository_->BeginRead();
  auto commits = repository_->ListCommits(*tx, stream_id, limit);
  tx->Commit();
  return commits;
}

db::model::QuickStats StreamLedger::Stats() {
  const auto day_start = util::ToIso8601(util::StartOfLocalDay(util::Now()));

  auto tx    = repository_->BeginRead();
  auto stats = repository_->GetStats(*tx, day_start);
  tx->Commit();
  return stats;
}

void StreamLedger::EnsureMainStream(const std::string& project_root, const std::string& base_branch) {
  auto tx = repository_->Begin();
  if (repository_->GetStream(*tx, kMainStreamId)) {
    tx->Commit();
    return;
  }

  const auto now = util::ToIso8601(util::Now());

  StreamRecord main;
  main.id            = kMainStreamId;
  main.stream_number = "main";
  main.title         = "Main Branch";
  main.category      = workstream::model::StreamCategory::kInfrastructure;
  main.priority      = workstream::model::StreamPriority::kHigh;
  main.status        = StreamStatus::kActive;
  main.progress      = 100;
  main.worktree_path = project_root;
  main.branch        = base_branch;
  main.created_at    = now;
  main.updated_at    = now;

  db::ThrowIfDbError(repository_->InsertStream(*tx, main), "insert main stream");
  tx->Commit();
}

} // namespace workstream::core
