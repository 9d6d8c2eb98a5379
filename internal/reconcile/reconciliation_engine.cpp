#include "reconciliation_engine.hpp"

#include <filesystem>
#include <set>
#include <sstream>

#include "internal/observability/logging.hpp"

namespace workstream::reconcile {

namespace fs = std::filesystem;
namespace wm = workstream::model;
using workstream::observability::IntField;
using workstream::observability::StringField;

namespace {

constexpr int kFormatLimit = 10;

const git::WorktreeInfo* FindWorktree(const std::map<std::string, git::WorktreeInfo>& worktrees, const db::model::StreamRecord& stream) {
  auto it = worktrees.find(stream.id);
  if (it != worktrees.end() && !it->second.is_main) return &it->second;

  if (stream.worktree_path.empty()) return nullptr;
  for (const auto& [id, info] : worktrees) {
    if (!info.is_main && info.path == stream.worktree_path) return &info;
  }
  return nullptr;
}

void AppendBucket(std::ostringstream& out, const char* title, const google::protobuf::RepeatedPtrField<workstream::v1::ReconciliationEntry>& entries) {
  out << title << " (" << entries.size() << ")\n";
  int shown = 0;
  for (const auto& entry : entries) {
    if (shown++ == kFormatLimit) {
      out << "  ... and " << (entries.size() - kFormatLimit) << " more\n";
      break;
    }
    out << "  - " << entry.stream_id() << " [" << entry.branch() << "] " << entry.reason();
    if (!entry.applied_status().empty()) out << " -> " << entry.applied_status();
    out << "\n";
  }
}

} // namespace

ReconciliationEngine::ReconciliationEngine(std::shared_ptr<core::StreamLedger> ledger, std::shared_ptr<git::GitIntrospection> git)
    : ledger_(std::move(ledger)), git_(std::move(git)) {
}

workstream::v1::ReconciliationReport ReconciliationEngine::Reconcile(const ReconcileOptions& options) {
  workstream::v1::ReconciliationReport report;
  report.set_dry_run(options.dry_run);

  const auto worktrees = git_->ListWorktrees(options.base_branch);
  const auto merged    = git_->ListMergedBranches(options.base_branch);
  const auto streams   = ledger_->List();

  std::set<std::string> claimed;

  for (const auto& row : streams) {
    const auto& stream = row.stream;
    try {
      const auto* worktree = FindWorktree(worktrees, stream);
      if (worktree) claimed.insert(worktree->id);

      std::error_code ec;
      const bool path_exists     = !stream.worktree_path.empty() && fs::exists(stream.worktree_path, ec);
      const bool worktree_exists = worktree != nullptr || path_exists;
      const bool branch_merged   = merged.count(stream.branch) > 0;

      workstream::v1::ReconciliationEntry entry;
      entry.set_stream_id(stream.id);
      entry.set_title(stream.title);
      entry.set_branch(stream.branch);
      entry.set_status(std::string(wm::ToString(stream.status)));
      entry.set_worktree_path(worktree ? worktree->path : stream.worktree_path);
      entry.set_worktree_exists(worktree_exists);
      entry.set_branch_merged(branch_merged);

      if (branch_merged) {
        entry.set_reason(kReasonMerged);
        if (!options.dry_run && !wm::IsTerminal(stream.status)) {
          ledger_->Complete(stream.id);
          entry.set_applied_status("completed");
        }
        *report.add_completed() = std::move(entry);
      } else if (!worktree_exists) {
        entry.set_reason(kReasonNoWorktree);
        if (!options.dry_run && options.auto_archive_stale && stream.status != wm::StreamStatus::kArchived) {
          db::model::StreamUpdate update;
          update.status = wm::StreamStatus::kArchived;
          ledger_->Update(stream.id, update);
          entry.set_applied_status("archived");
        }
        *report.add_stale() = std::move(entry);
      } else {
        entry.set_reason(kReasonActive);
        if (!options.dry_run && !wm::IsWorking(stream.status)) {
          db::model::StreamUpdate update;
          update.status = wm::StreamStatus::kActive;
          ledger_->Update(stream.id, update);
          entry.set_applied_status("active");
        }
        *report.add_active() = std::move(entry);
      }
    } catch (const std::exception& e) {
      auto* error = report.add_errors();
      error->set_stream_id(stream.id);
      error->set_error(e.what());
      WORKSTREAM_LOG_WARN("reconciliation failed for stream", {StringField("stream_id", stream.id), StringField("error", e.what())});
    }
  }

  int total_worktrees = 0;
  for (const auto& [id, info] : worktrees) {
    if (info.is_main) continue;
    ++total_worktrees;
    if (claimed.count(id) == 0) {
      auto* orphan = report.add_orphaned();
      orphan->set_id(info.id);
      orphan->set_path(info.path);
      orphan->set_branch(info.branch);
      orphan->set_commit_hash(info.commit_hash);
    }
  }

  auto* summary = report.mutable_summary();
  summary->set_total_streams(static_cast<int>(streams.size()));
  summary->set_total_worktrees(total_worktrees);
  summary->set_active(report.active_size());
  summary->set_completed(report.completed_size());
  summary->set_stale(report.stale_size());
  summary->set_orphaned(report.orphaned_size());
  summary->set_errors(report.errors_size());

  WORKSTREAM_LOG_INFO("reconciliation finished", {observability::BoolField("dry_run", options.dry_run), IntField("active", summary->active()),
                                                  IntField("completed", summary->completed()), IntField("stale", summary->stale()),
                                                  IntField("orphaned", summary->orphaned()), IntField("errors", summary->errors())});
  return report;
}

std::string FormatReconciliationReport(const workstream::v1::ReconciliationReport& report) {
  std::ostringstream out;
  const auto&        s = report.summary();

  out << "Reconciliation report" << (report.dry_run() ? " (dry run)" : "") << "\n";
  out << "Ledger streams: " << s.total_streams() << ", worktrees: " << s.total_worktrees() << "\n\n";

  AppendBucket(out, "Active", report.active());
  AppendBucket(out, "Completed", report.completed());
  AppendBucket(out, "Stale", report.stale());

  out << "Orphaned worktrees (" << report.orphaned_size() << ")\n";
  int shown = 0;
  for (const auto& orphan : report.orphaned()) {
    if (shown++ == kFormatLimit) {
      out << "  ... and " << (report.orphaned_size() - kFormatLimit) << " more\n";
      break;
    }
    out << "  - " << orphan.id() << " [" << orphan.branch() << "] " << orphan.path() << "\n";
  }

  if (report.errors_size() > 0) {
    out << "Errors (" << report.errors_size() << ")\n";
    for (const auto& error : report.errors()) {
      out << "  - " << error.stream_id() << ": " << error.error() << "\n";
    }
  }

  if (report.dry_run()) {
    out << "\nNo changes applied. Re-run with dry run disabled to update the ledger.\n";
  }
  return out.str();
}

} // namespace workstream::reconcile
