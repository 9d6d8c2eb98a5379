#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/stream_record.hpp"
#include "internal/git/git_parsers.hpp"
#include "internal/util/time.hpp"

namespace workstream::retirement {

// <YYYYMMDD>_<stream_id>-RETIRED.md, UTC date.
std::string ArchiveFileName(const std::string& stream_id, util::TimePoint archived_at);

// First recent commit whose subject or decorations mention the stream id.
std::optional<std::string> FindMergeCommit(const std::vector<git::LogEntry>& log, const std::string& stream_id);

// Markdown retirement record committed to the history directory.
std::string RenderArchiveReport(const db::model::StreamRecord& stream,
                                const std::string& summary,
                                const std::optional<std::string>& merge_commit,
                                util::TimePoint archived_at);

} // namespace workstream::retirement
