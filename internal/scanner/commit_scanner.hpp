#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/stream_ledger.hpp"
#include "internal/git/git_introspection.hpp"

namespace workstream::scanner {

struct ScanOptions {
  std::string project_root;
  std::string base_branch         = "main";
  int         branch_commit_limit = 50;
  int         main_commit_limit   = 20;
  std::string main_since          = "7 days ago";
};

struct ScanSummary {
  int scanned         = 0;
  int commits_added   = 0;
  int already_present = 0;
  // hard failures only; duplicates never count here
  int errors = 0;
};

/*
  Populates the ledger's commit history from git.

  Streams are scanned before the synthetic main stream so that branch
  commits are attributed to their stream even after a fast-forward merge.
  Re-running a scan is idempotent.
*/
class CommitScanner {
 public:
  CommitScanner(std::shared_ptr<core::StreamLedger> ledger, std::shared_ptr<git::GitIntrospection> git, ScanOptions options);

  ScanSummary ScanAll();

  // Commits newly added for one stream. Unknown id -> util::NotFound.
  int ScanStream(const std::string& id);

 private:
  std::vector<git::GitCommit> CollectCommits(const db::model::StreamRecord& stream);
  void Ingest(const std::string& stream_id, const std::vector<git::GitCommit>& commits, ScanSummary& summary);

  std::shared_ptr<core::StreamLedger>     ledger_;
  std::shared_ptr<git::GitIntrospection> git_;
  ScanOptions                             options_;
};

} // namespace workstream::scanner
