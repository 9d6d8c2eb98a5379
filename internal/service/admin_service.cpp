#include "admin_service.hpp"

#include "internal/core/stream_ledger.hpp"
#include "internal/core/stream_mapping.hpp"
#include "internal/git/git_introspection.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/scanner/commit_scanner.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace workstream::service {

using namespace workstream::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats() {
  return ObserveCall("AdminService.Stats", [&] { return core::ToProto(ctx_.ledger->Stats()); });
}

HealthResponse AdminService::Health() {
  HealthResponse resp;
  resp.set_status("ok");
  resp.set_project_name(ctx_.config.project().name());
  resp.set_project_root(ctx_.config.project().root());
  resp.set_version(WORKSTREAM_VERSION);
  resp.set_timestamp(util::ToIso8601(util::Now()));
  return resp;
}

VersionResponse AdminService::Version() {
  VersionResponse resp;
  resp.set_version(WORKSTREAM_VERSION);
  return resp;
}

ScanResponse AdminService::ScanCommits(const ScanRequest& req) {
  return ObserveCall("AdminService.ScanCommits", [&] {
    ScanResponse resp;
    if (!req.stream_id().empty()) {
      resp.set_scanned(1);
      resp.set_commits_added(ctx_.scanner->ScanStream(req.stream_id()));
      return resp;
    }

    const auto summary = ctx_.scanner->ScanAll();
    resp.set_scanned(summary.scanned);
    resp.set_commits_added(summary.commits_added);
    resp.set_already_present(summary.already_present);
    resp.set_errors(summary.errors);
    return resp;
  });
}

ReconciliationReport AdminService::Reconcile(const ReconcileRequest& req) {
  return ObserveCall("AdminService.Reconcile", [&] {
    reconcile::ReconcileOptions options;
    options.dry_run            = req.has_dry_run() ? req.dry_run() : true;
    options.auto_archive_stale = req.has_auto_archive_stale() && req.auto_archive_stale();
    options.base_branch        = ctx_.config.project().base_branch();
    return ctx_.reconciler->Reconcile(options);
  });
}

ListWorktreesResponse AdminService::ListWorktrees() {
  return ObserveCall("AdminService.ListWorktrees", [&] {
    ListWorktreesResponse resp;
    for (const auto& [id, info] : ctx_.git->ListWorktrees(ctx_.config.project().base_branch())) {
      auto* wt = resp.add_worktrees();
      wt->set_id(info.id);
      wt->set_path(info.path);
      wt->set_branch(info.branch);
      wt->set_commit_hash(info.commit_hash);
      wt->set_is_main(info.is_main);
    }
    return resp;
  });
}

MergedBranchesResponse AdminService::ListMergedBranches() {
  return ObserveCall("AdminService.ListMergedBranches", [&] {
    const auto& base = ctx_.config.project().base_branch();

    MergedBranchesResponse resp;
    resp.set_base(base);
    for (const auto& branch : ctx_.git->ListMergedBranches(base)) {
      resp.add_branches(branch);
    }
    return resp;
  });
}

} // namespace workstream::service
