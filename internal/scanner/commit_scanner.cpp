#include "commit_scanner.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace workstream::scanner {

namespace fs = std::filesystem;
using workstream::observability::IntField;
using workstream::observability::StringField;

CommitScanner::CommitScanner(std::shared_ptr<core::StreamLedger> ledger, std::shared_ptr<git::GitIntrospection> git, ScanOptions options)
    : ledger_(std::move(ledger)), git_(std::move(git)), options_(std::move(options)) {
}

std::vector<git::GitCommit> CommitScanner::CollectCommits(const db::model::StreamRecord& stream) {
  if (stream.id == core::kMainStreamId) {
    return git_->LogMainCommits(options_.base_branch, options_.main_since, options_.main_commit_limit);
  }

  std::error_code ec;
  if (stream.worktree_path.empty() || !fs::exists(stream.worktree_path, ec)) {
    return {};
  }
  return git_->LogBranchCommits(stream.worktree_path, options_.base_branch, options_.branch_commit_limit);
}

void CommitScanner::Ingest(const std::string& stream_id, const std::vector<git::GitCommit>& commits, ScanSummary& summary) {
  for (const auto& commit : commits) {
    db::model::CommitRecord record;
    record.stream_id     = stream_id;
    record.commit_hash   = commit.hash;
    record.message       = commit.subject;
    record.author        = commit.author;
    record.files_changed = commit.files_changed;
    record.timestamp     = commit.timestamp;

    auto res = ledger_->AddCommit(record);
    if (res) {
      ++summary.commits_added;
    } else if (res.Duplicate()) {
      ++summary.already_present;
    } else {
      ++summary.errors;
      WORKSTREAM_LOG_WARN("commit insert failed", {StringField("stream_id", stream_id), StringField("commit", commit.hash),
                                                   StringField("code", db::ErrorCodeName(res.code)), StringField("error", res.message)});
    }
  }
}

ScanSummary CommitScanner::ScanAll() {
  ScanSummary summary;

  ledger_->EnsureMainStream(options_.project_root, options_.base_branch);

  for (const auto& row : ledger_->List()) {
    const auto& stream = row.stream;
    try {
      std::error_code ec;
      if (stream.worktree_path.empty() || !fs::exists(stream.worktree_path, ec)) {
        continue;
      }
      ++summary.scanned;
      Ingest(stream.id, CollectCommits(stream), summary);
    } catch (const std::exception& e) {
      ++summary.errors;
      WORKSTREAM_LOG_WARN("stream scan failed", {StringField("stream_id", stream.id), StringField("error", e.what())});
    }
  }

  try {
    auto main = ledger_->Get(core::kMainStreamId);
    if (main) {
      ++summary.scanned;
      Ingest(main->id, CollectCommits(*main), summary);
    }
  } catch (const std::exception& e) {
    ++summary.errors;
    WORKSTREAM_LOG_WARN("main branch scan failed", {StringField("error", e.what())});
  }

  WORKSTREAM_LOG_INFO("commit scan finished", {IntField("scanned", summary.scanned), IntField("commits_added", summary.commits_added),
                                               IntField("already_present", summary.already_present), IntField("errors", summary.errors)});
  return summary;
}

int CommitScanner::ScanStream(const std::string& id) {
  if (id == core::kMainStreamId) {
    ledger_->EnsureMainStream(options_.project_root, options_.base_branch);
  }

  auto stream = ledger_->Get(id);
  if (!stream) throw util::NotFound("stream not found: " + id);

  ScanSummary summary;
  Ingest(stream->id, CollectCommits(*stream), summary);
  if (summary.errors > 0) {
    throw std::runtime_error("failed to record " + std::to_string(summary.errors) + " commit(s) for stream " + id);
  }
  return summary.commits_added;
}

} // namespace workstream::scanner
