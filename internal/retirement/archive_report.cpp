#include "archive_report.hpp"

#include <algorithm>
#include <sstream>

namespace workstream::retirement {

namespace {

// "2026-01-02" from the canonical timestamp.
std::string UtcDate(util::TimePoint tp) {
  return util::ToIso8601(tp).substr(0, 10);
}

} // namespace

std::string ArchiveFileName(const std::string& stream_id, util::TimePoint archived_at) {
  auto date = UtcDate(archived_at);
  date.erase(std::remove(date.begin(), date.end(), '-'), date.end());
  return date + "_" + stream_id + "-RETIRED.md";
}

std::optional<std::string> FindMergeCommit(const std::vector<git::LogEntry>& log, const std::string& stream_id) {
  if (stream_id.empty()) return std::nullopt;
  for (const auto& entry : log) {
    if (entry.subject.find(stream_id) != std::string::npos || entry.refs.find(stream_id) != std::string::npos) {
      return entry.hash;
    }
  }
  return std::nullopt;
}

std::string RenderArchiveReport(const db::model::StreamRecord& stream,
                                const std::string& summary,
                                const std::optional<std::string>& merge_commit,
                                util::TimePoint archived_at) {
  std::ostringstream out;
  out << "# Stream Retired: " << stream.id << "\n\n"
      << "**Date**: " << UtcDate(archived_at) << "\n"
      << "**Stream**: " << stream.stream_number << " - " << stream.title << "\n"
      << "**Branch**: " << stream.branch << "\n"
      << "**Category**: " << workstream::model::ToString(stream.category) << "\n"
      << "**Priority**: " << workstream::model::ToString(stream.priority) << "\n"
      << "**Status**: Retired\n\n"
      << "---\n\n"
      << "## Summary\n\n"
      << summary << "\n\n"
      << "## Stream Details\n\n"
      << "- **Created**: " << stream.created_at << "\n"
      << "- **Completed**: " << stream.completed_at.value_or("N/A") << "\n"
      << "- **Worktree Path**: " << stream.worktree_path << "\n\n"
      << "## Merge Details\n\n"
      << "- **Merge Commit**: " << merge_commit.value_or("N/A") << "\n"
      << "- **Merge Type**: Fast-forward\n"
      << "- **Conflicts**: Resolved in worktree (if any)\n\n"
      << "---\n\n"
      << "**Retired by**: workstream\n"
      << "**Archived**: " << util::ToIso8601(archived_at) << "\n";
  return out.str();
}

} // namespace workstream::retirement
