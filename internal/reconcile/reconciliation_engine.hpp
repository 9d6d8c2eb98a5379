#pragma once

#include <memory>
#include <string>

#include "internal/core/stream_ledger.hpp"
#include "internal/git/git_introspection.hpp"
#include "workstream/v1.hpp"

namespace workstream::reconcile {

struct ReconcileOptions {
  bool        dry_run            = true;
  bool        auto_archive_stale = false;
  std::string base_branch        = "main";
};

inline constexpr const char* kReasonMerged      = "Branch merged to main";
inline constexpr const char* kReasonNoWorktree  = "Worktree does not exist";
inline constexpr const char* kReasonActive      = "Worktree exists and branch not merged";

/*
  Compares ledger intent with what git actually holds.

  Every ledger stream lands in exactly one bucket, checked in order:
    completed  branch merged into base (worktree presence ignored)
    stale      no worktree found by id/path and nothing on disk
    active     everything else; non-working statuses normalize to active

  Worktrees nobody claimed are reported as orphaned. The ledger is only
  touched when dry_run is false, and each write goes through the ledger
  so it carries a status_changed event. One stream failing is recorded
  in errors and the pass continues.
*/
class ReconciliationEngine {
 public:
  ReconciliationEngine(std::shared_ptr<core::StreamLedger> ledger, std::shared_ptr<git::GitIntrospection> git);

  workstream::v1::ReconciliationReport Reconcile(const ReconcileOptions& options);

 private:
  std::shared_ptr<core::StreamLedger>     ledger_;
  std::shared_ptr<git::GitIntrospection> git_;
};

// Human-readable rendering; at most ten entries per bucket.
std::string FormatReconciliationReport(const workstream::v1::ReconciliationReport& report);

} // namespace workstream::reconcile
