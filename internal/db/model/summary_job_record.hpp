#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/stream_enums.hpp"

namespace workstream::db::model {

/*
  Background summary job for a retired stream.

  Carries a static copy of the stream metadata: the stream row is gone by
  the time a worker picks the job up.
*/
struct SummaryJobRecord {
  int64_t     id = 0;
  std::string stream_id;
  std::string stream_title;
  std::string stream_branch;
  std::string stream_category;
  std::string worktree_path;
  std::string stream_created_at;
  std::string stream_completed_at;
  std::string user_summary;
  std::string archive_path;

  workstream::model::SummaryJobStatus status = workstream::model::SummaryJobStatus::kPending;

  int                        attempts     = 0;
  int                        max_attempts = 3;
  std::optional<std::string> error_message;

  std::string                created_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
};

} // namespace workstream::db::model
