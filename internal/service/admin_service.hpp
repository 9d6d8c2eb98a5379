#pragma once

#include "service_context.hpp"
#include "workstream/v1.hpp"

namespace workstream::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  workstream::v1::StatsResponse Stats();

  workstream::v1::HealthResponse Health();

  workstream::v1::VersionResponse Version();

  // Whole-project scan, or a single stream when stream_id is set.
  workstream::v1::ScanResponse ScanCommits(const workstream::v1::ScanRequest& req);

  // dry_run defaults to true.
  workstream::v1::ReconciliationReport Reconcile(const workstream::v1::ReconcileRequest& req);

  workstream::v1::ListWorktreesResponse ListWorktrees();

  workstream::v1::MergedBranchesResponse ListMergedBranches();

 private:
  ServiceContext ctx_;
};

} // namespace workstream::service
