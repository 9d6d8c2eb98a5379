#include "stream_service.hpp"

#include <filesystem>

#include "internal/core/stream_ledger.hpp"
#include "internal/core/stream_mapping.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace workstream::service {

using namespace workstream::v1;
using db::model::StreamRecord;
using workstream::model::StreamStatus;

namespace {

constexpr const char* kDefaultArchiveSummary = "Stream completed and retired";
constexpr const char* kDefaultBulkSummary    = "Bulk retirement";
constexpr int         kDefaultCommitLimit    = 20;

StreamStatus ParseStatusOrThrow(const std::string& text) {
  auto status = workstream::model::ParseStreamStatus(text);
  if (!status) {
    throw util::InvalidArgument("status", "Invalid status. Must be one of: " + workstream::model::AllowedStatuses());
  }
  return *status;
}

workstream::model::StreamCategory ParseCategoryOrThrow(const std::string& text) {
  auto category = workstream::model::ParseStreamCategory(text);
  if (!category) {
    throw util::InvalidArgument("category", "Invalid category. Must be one of: " + workstream::model::AllowedCategories());
  }
  return *category;
}

workstream::model::StreamPriority ParsePriorityOrThrow(const std::string& text) {
  auto priority = workstream::model::ParseStreamPriority(text);
  if (!priority) {
    throw util::InvalidArgument("priority", "Invalid priority. Must be one of: " + workstream::model::AllowedPriorities());
  }
  return *priority;
}

StreamRecord GetOrThrow(core::StreamLedger& ledger, const std::string& id) {
  auto stream = ledger.Get(id);
  if (!stream) throw util::NotFound("Stream not found: " + id);
  return *stream;
}

void SetChange(ValueChange* change, const std::string& from, const std::string& to) {
  change->set_from(from);
  change->set_to(to);
}

std::string StatusText(StreamStatus status) {
  return std::string(workstream::model::ToString(status));
}

} // namespace

StreamService::StreamService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListStreamsResponse StreamService::ListStreams(const ListStreamsRequest& req) {
  return ObserveCall("StreamService.ListStreams", [&] {
    db::model::StreamFilter filter;
    if (!req.status().empty()) filter.status = ParseStatusOrThrow(req.status());
    if (!req.category().empty()) filter.category = ParseCategoryOrThrow(req.category());
    if (!req.priority().empty()) filter.priority = ParsePriorityOrThrow(req.priority());

    const auto now  = util::Now();
    const auto rows = ctx_.ledger->List(filter);

    ListStreamsResponse resp;
    for (const auto& row : rows) {
      *resp.add_streams() = core::ToProto(row, now);
    }
    resp.set_count(resp.streams_size());
    return resp;
  });
}

Stream StreamService::GetStream(const std::string& id) {
  return ObserveCall("StreamService.GetStream", [&] { return core::ToProto(GetOrThrow(*ctx_.ledger, id)); });
}

AddStreamResponse StreamService::AddStream(const AddStreamRequest& req) {
  return ObserveCall("StreamService.AddStream", [&] {
    if (req.id() == core::kMainStreamId) {
      throw util::InvalidArgument("id", "stream id 'main' is reserved");
    }

    StreamRecord stream;
    stream.id            = req.id();
    stream.stream_number = req.stream_number().empty() ? req.id() : req.stream_number();
    stream.title         = req.title();
    if (!req.category().empty()) stream.category = ParseCategoryOrThrow(req.category());
    if (!req.priority().empty()) stream.priority = ParsePriorityOrThrow(req.priority());
    stream.branch        = req.branch();
    stream.worktree_path = req.worktree_path().empty()
                               ? (std::filesystem::path(ctx_.config.project().worktree_root()) / req.id()).string()
                               : req.worktree_path();
    if (!req.blocked_by().empty()) stream.blocked_by = req.blocked_by();
    stream.phases.assign(req.phases().begin(), req.phases().end());

    AddStreamResponse resp;
    resp.set_success(true);
    *resp.mutable_stream() = core::ToProto(ctx_.ledger->Insert(std::move(stream)));
    return resp;
  });
}

UpdateStreamResponse StreamService::UpdateStream(const std::string& id, const UpdateStreamRequest& req) {
  return ObserveCall("StreamService.UpdateStream", [&] {
    db::model::StreamUpdate update;
    if (req.has_status()) update.status = ParseStatusOrThrow(req.status());
    if (req.has_progress()) {
      if (req.progress() < 0 || req.progress() > 100) {
        throw util::InvalidArgument("progress", "Progress must be a number between 0 and 100");
      }
      update.progress = req.progress();
    }
    if (req.has_current_phase()) update.current_phase = req.current_phase();
    if (req.has_blocked_by()) update.blocked_by = req.blocked_by();

    const auto previous = GetOrThrow(*ctx_.ledger, id);
    const auto updated  = ctx_.ledger->Update(id, update);

    UpdateStreamResponse resp;
    resp.set_success(true);
    *resp.mutable_stream() = core::ToProto(updated);

    auto* changes = resp.mutable_changes();
    if (update.status && *update.status != previous.status) {
      SetChange(changes->mutable_status(), StatusText(previous.status), StatusText(*update.status));
    }
    if (update.progress) {
      SetChange(changes->mutable_progress(), std::to_string(previous.progress), std::to_string(*update.progress));
    }
    if (update.blocked_by && *update.blocked_by != previous.blocked_by.value_or("")) {
      SetChange(changes->mutable_blocked_by(), previous.blocked_by.value_or(""), *update.blocked_by);
    }
    if (update.current_phase && update.current_phase != previous.current_phase) {
      SetChange(changes->mutable_current_phase(), previous.current_phase ? std::to_string(*previous.current_phase) : "",
                std::to_string(*update.current_phase));
    }
    return resp;
  });
}

ArchiveStreamResponse StreamService::ArchiveStream(const std::string& id, const ArchiveStreamRequest& req) {
  return ObserveCall("StreamService.ArchiveStream", [&] {
    const auto stream = GetOrThrow(*ctx_.ledger, id);
    if (stream.status != StreamStatus::kCompleted) {
      throw util::InvalidState("Cannot retire stream: Stream must be in 'completed' status before retirement. Current status: " +
                               StatusText(stream.status));
    }

    retirement::RetireFlags flags;
    flags.delete_worktree    = req.has_delete_worktree() ? req.delete_worktree() : true;
    flags.cleanup_plan_files = req.has_cleanup_plan_files() ? req.cleanup_plan_files() : true;

    const auto result = Retire(stream, req.has_summary() ? req.summary() : kDefaultArchiveSummary, flags);

    ArchiveStreamResponse resp;
    resp.set_success(result.success);
    resp.set_message(result.success ? "Stream " + id + " retired and removed from database"
                                    : "Stream " + id + " retired with warnings and removed from database");
    *resp.mutable_retirement() = result.ToProto();
    return resp;
  });
}

ArchiveBulkResponse StreamService::ArchiveBulk(const ArchiveBulkRequest& req) {
  return ObserveCall("StreamService.ArchiveBulk", [&] {
    if (req.stream_ids().empty()) {
      throw util::InvalidArgument("streamIds", "streamIds must be a non-empty array");
    }

    retirement::RetireFlags flags;
    flags.delete_worktree    = req.has_delete_worktree() ? req.delete_worktree() : true;
    flags.cleanup_plan_files = req.has_cleanup_plan_files() ? req.cleanup_plan_files() : true;
    const std::string summary = req.has_summary() ? req.summary() : kDefaultBulkSummary;

    ArchiveBulkResponse resp;
    int                 retired = 0;
    int                 failed  = 0;

    for (const auto& stream_id : req.stream_ids()) {
      auto* item = resp.add_results();
      item->set_stream_id(stream_id);

      try {
        auto stream = ctx_.ledger->Get(stream_id);
        if (!stream) {
          item->set_success(false);
          item->set_message("Not found");
        } else if (stream->status == StreamStatus::kArchived) {
          item->set_success(true);
          item->set_message("Already retired");
        } else if (stream->status != StreamStatus::kCompleted) {
          item->set_success(false);
          item->set_message("Cannot retire: status is '" + StatusText(stream->status) + "', must be 'completed'");
        } else {
          const auto result = Retire(*stream, summary, flags);
          item->set_success(result.success);

          std::string joined;
          for (const auto& error : result.errors) {
            if (!joined.empty()) joined += "; ";
            joined += error;
          }
          item->set_message(joined);
          *item->mutable_retirement() = result.ToProto();
        }
      } catch (const std::exception& ex) {
        WORKSTREAM_LOG_ERROR("bulk retirement failed for stream", {observability::StringField("stream_id", stream_id),
                                                                   observability::StringField("error", ex.what())});
        item->set_success(false);
        item->set_message(ex.what());
      }

      item->success() ? ++retired : ++failed;
    }

    resp.set_retired(retired);
    resp.set_failed(failed);
    resp.set_success(failed == 0);
    resp.set_message("Retired " + std::to_string(retired) + " streams, " + std::to_string(failed) + " failed");
    return resp;
  });
}

HistoryResponse StreamService::History(const std::string& id) {
  return ObserveCall("StreamService.History", [&] {
    GetOrThrow(*ctx_.ledger, id);

    HistoryResponse resp;
    for (const auto& event : ctx_.ledger->History(id)) {
      *resp.add_events() = core::ToProto(event);
    }
    return resp;
  });
}

AddCommitResponse StreamService::AddCommit(const AddCommitRequest& req) {
  return ObserveCall("StreamService.AddCommit", [&] {
    if (req.stream_id().empty()) throw util::InvalidArgument("streamId", "streamId is required");
    if (req.commit_hash().empty()) throw util::InvalidArgument("commitHash", "commitHash is required");
    if (!req.timestamp().empty() && !util::ParseIso8601(req.timestamp())) {
      throw util::InvalidArgument("timestamp", "timestamp must be ISO-8601");
    }
    GetOrThrow(*ctx_.ledger, req.stream_id());

    db::model::CommitRecord commit;
    commit.stream_id     = req.stream_id();
    commit.commit_hash   = req.commit_hash();
    commit.message       = req.message();
    commit.author        = req.author();
    commit.files_changed = req.files_changed();
    commit.timestamp     = req.timestamp();

    AddCommitResponse resp;
    auto              result = ctx_.ledger->AddCommit(std::move(commit));
    if (result.Duplicate()) {
      resp.set_success(true);
      resp.set_already_present(true);
      return resp;
    }
    db::ThrowIfDbError(result, "add commit " + req.commit_hash());
    resp.set_success(true);
    return resp;
  });
}

ListCommitsResponse StreamService::ListCommits(const ListCommitsRequest& req) {
  return ObserveCall("StreamService.ListCommits", [&] {
    std::optional<std::string> stream_id;
    if (!req.stream_id().empty()) stream_id = req.stream_id();
    if (req.limit() < 0) throw util::InvalidArgument("limit", "limit must be positive");

    ListCommitsResponse resp;
    for (const auto& commit : ctx_.ledger->ListCommits(stream_id, req.limit() > 0 ? req.limit() : kDefaultCommitLimit)) {
      *resp.add_commits() = core::ToProto(commit);
    }
    return resp;
  });
}

retirement::RetirementResult StreamService::Retire(const StreamRecord& stream, const std::string& summary, const retirement::RetireFlags& flags) {
  std::lock_guard<std::mutex> lock(retire_mu_);

  auto result = ctx_.retirement->Retire(stream, summary, flags);

  db::model::HistoryRecord event;
  event.stream_id  = stream.id;
  event.event_type = workstream::model::HistoryEventType::kArchived;
  event.old_value  = StatusText(stream.status);
  event.new_value  = "retired and deleted from database";
  ctx_.ledger->AddHistoryEvent(std::move(event));

  ctx_.ledger->Delete(stream.id);
  return result;
}

} // namespace workstream::service
