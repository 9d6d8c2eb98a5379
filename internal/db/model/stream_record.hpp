#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/stream_enums.hpp"

namespace workstream::db::model {

/*
  Persistent stream row.

  Timestamps are canonical ISO-8601 UTC text (util::ToIso8601).
  completed_at is present while status is completed and is kept when the
  stream moves on to archived.
*/
struct StreamRecord {
  std::string id;
  std::string stream_number;
  std::string title;

  workstream::model::StreamCategory category = workstream::model::StreamCategory::kBackend;
  workstream::model::StreamPriority priority = workstream::model::StreamPriority::kMedium;
  workstream::model::StreamStatus   status   = workstream::model::StreamStatus::kInitializing;

  int                        progress = 0;
  std::optional<int>         current_phase;
  std::string                worktree_path;
  std::string                branch;
  std::optional<std::string> blocked_by;
  std::vector<std::string>   phases;

  std::string                created_at;
  std::string                updated_at;
  std::optional<std::string> completed_at;
};

// Newest commit of a stream, joined into list results.
struct RecentActivityRecord {
  std::string message;
  int         files_changed = 0;
  std::string timestamp;
  std::string author;
};

struct StreamListRow {
  StreamRecord                        stream;
  std::optional<RecentActivityRecord> recent_activity;
};

struct StreamFilter {
  std::optional<workstream::model::StreamStatus>   status;
  std::optional<workstream::model::StreamCategory> category;
  std::optional<workstream::model::StreamPriority> priority;
};

// Partial update; only engaged fields are written.
struct StreamUpdate {
  std::optional<workstream::model::StreamStatus> status;
  std::optional<int>                             progress;
  std::optional<int>                             current_phase;
  // empty string clears the reference
  std::optional<std::string> blocked_by;

  bool Empty() const {
    return !status && !progress && !current_phase && !blocked_by;
  }
};

} // namespace workstream::db::model
