#include "stream_mapping.hpp"

namespace workstream::core {

namespace wm = workstream::model;

workstream::v1::Stream ToProto(const db::model::StreamRecord& record) {
  workstream::v1::Stream out;
  out.set_id(record.id);
  out.set_stream_number(record.stream_number);
  out.set_title(record.title);
  out.set_category(std::string(wm::ToString(record.category)));
  out.set_priority(std::string(wm::ToString(record.priority)));
  out.set_status(std::string(wm::ToString(record.status)));
  out.set_progress(record.progress);
  if (record.current_phase) out.set_current_phase(*record.current_phase);
  out.set_worktree_path(record.worktree_path);
  out.set_branch(record.branch);
  out.set_blocked_by(record.blocked_by.value_or(""));
  for (const auto& phase : record.phases) {
    out.add_phases(phase);
  }
  out.set_created_at(record.created_at);
  out.set_updated_at(record.updated_at);
  out.set_completed_at(record.completed_at.value_or(""));
  return out;
}

workstream::v1::Stream ToProto(const db::model::StreamListRow& row, util::TimePoint now) {
  auto out = ToProto(row.stream);
  if (row.recent_activity) {
    auto* activity = out.mutable_recent_activity();
    activity->set_message(row.recent_activity->message);
    activity->set_files_changed(row.recent_activity->files_changed);
    activity->set_author(row.recent_activity->author);
    if (auto when = util::ParseIso8601(row.recent_activity->timestamp)) {
      activity->set_relative_time(util::RelativeTime(*when, now));
    }
  }
  return out;
}

workstream::v1::Commit ToProto(const db::model::CommitRecord& record) {
  workstream::v1::Commit out;
  out.set_id(record.id);
  out.set_stream_id(record.stream_id);
  out.set_commit_hash(record.commit_hash);
  out.set_message(record.message);
  out.set_author(record.author);
  out.set_files_changed(record.files_changed);
  out.set_timestamp(record.timestamp);
  return out;
}

workstream::v1::HistoryEvent ToProto(const db::model::HistoryRecord& record) {
  workstream::v1::HistoryEvent out;
  out.set_id(record.id);
  out.set_stream_id(record.stream_id);
  out.set_event_type(std::string(wm::ToString(record.event_type)));
  out.set_old_value(record.old_value.value_or(""));
  out.set_new_value(record.new_value.value_or(""));
  out.set_timestamp(record.timestamp);
  return out;
}

workstream::v1::SummaryJob ToProto(const db::model::SummaryJobRecord& record) {
  workstream::v1::SummaryJob out;
  out.set_id(record.id);
  out.set_stream_id(record.stream_id);
  out.set_stream_title(record.stream_title);
  out.set_stream_branch(record.stream_branch);
  out.set_stream_category(record.stream_category);
  out.set_worktree_path(record.worktree_path);
  out.set_stream_created_at(record.stream_created_at);
  out.set_stream_completed_at(record.stream_completed_at);
  out.set_user_summary(record.user_summary);
  out.set_archive_path(record.archive_path);
  out.set_status(std::string(wm::ToString(record.status)));
  out.set_attempts(record.attempts);
  out.set_max_attempts(record.max_attempts);
  out.set_error_message(record.error_message.value_or(""));
  out.set_created_at(record.created_at);
  out.set_started_at(record.started_at.value_or(""));
  out.set_completed_at(record.completed_at.value_or(""));
  return out;
}

workstream::v1::StatsResponse ToProto(const db::model::QuickStats& stats) {
  workstream::v1::StatsResponse out;
  out.set_active_streams(stats.active_streams);
  out.set_in_progress(stats.in_progress);
  out.set_blocked(stats.blocked);
  out.set_paused(stats.paused);
  out.set_completed_today(stats.completed_today);
  out.set_total_commits(stats.total_commits);
  out.set_commits_today(stats.commits_today);
  return out;
}

} // namespace workstream::core
