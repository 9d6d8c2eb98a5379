#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/model/stream_record.hpp"
#include "internal/git/git_introspection.hpp"
#include "internal/jobs/summary_job_queue.hpp"
#include "internal/util/process.hpp"
#include "workstream/v1.hpp"

namespace workstream::retirement {

struct RetirementOptions {
  std::string project_root;
  std::string worktree_root;
  std::string history_dir = ".project/history";
  std::string plan_dir    = ".project/plan/streams";
  std::string remote      = "origin";
  std::string base_branch = "main";

  static RetirementOptions FromConfig(const workstream::runtime::config::RuntimeConfig& config);
};

struct RetireFlags {
  bool delete_worktree    = true;
  bool cleanup_plan_files = true;
  bool write_archive      = true;
  bool queue_summary      = true;
};

struct RetirementResult {
  bool                     success = false;
  std::string              stream_id;
  bool                     worktree_deleted      = false;
  bool                     archive_written       = false;
  bool                     plan_files_cleaned_up = false;
  bool                     summary_job_queued    = false;
  std::string              archive_path;
  std::vector<std::string> errors;

  workstream::v1::RetirementReport ToProto() const;
};

/*
  Filesystem and git side of retiring a completed stream.

  Steps run in order (archive, summary job, worktree, planning files) and
  each one records its own failure in errors without stopping the rest.
  The ledger row is not touched here.
*/
class RetirementService {
 public:
  // queue may be null; summary jobs are then skipped.
  RetirementService(std::shared_ptr<util::CommandRunner> runner,
                    RetirementOptions                    options,
                    std::shared_ptr<jobs::SummaryJobQueue> queue);

  RetirementResult Retire(const db::model::StreamRecord& stream, const std::string& summary, const RetireFlags& flags = {});

 private:
  std::string WriteArchive(const db::model::StreamRecord& stream, const std::string& summary, std::string& written_path);
  void        RemoveWorktree(const db::model::StreamRecord& stream, const std::string& worktree_path);
  void        CleanupPlanFiles(const db::model::StreamRecord& stream);
  void        QueueSummary(const db::model::StreamRecord& stream, const std::string& summary, const std::string& archive_path);

  // Throws std::runtime_error carrying git's stderr.
  void GitOrThrow(const std::vector<std::string>& args);

  std::shared_ptr<util::CommandRunner>   runner_;
  RetirementOptions                      options_;
  std::shared_ptr<jobs::SummaryJobQueue> queue_;
  git::GitIntrospection                  git_;
};

} // namespace workstream::retirement
