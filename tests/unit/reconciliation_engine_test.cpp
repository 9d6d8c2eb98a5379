#include "internal/reconcile/reconciliation_engine.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "tests/support/fake_command_runner.hpp"

namespace {

namespace fs = std::filesystem;
using workstream::core::StreamLedger;
using workstream::model::HistoryEventType;
using workstream::model::StreamStatus;
using workstream::reconcile::ReconcileOptions;
using workstream::reconcile::ReconciliationEngine;
using workstream::testing::FakeCommandRunner;

struct Fixture {
  fs::path                                          root;
  std::shared_ptr<workstream::db::sqlite::SqliteDB> db;
  std::shared_ptr<FakeCommandRunner>                runner;
  std::shared_ptr<StreamLedger>                     ledger;
  std::unique_ptr<ReconciliationEngine>             engine;
};

void AddStream(StreamLedger& ledger, const std::string& id, const std::string& worktree_path, StreamStatus status) {
  workstream::db::model::StreamRecord stream;
  stream.id            = id;
  stream.title         = "Stream " + id;
  stream.branch        = "feature/" + id;
  stream.worktree_path = worktree_path;
  ledger.Insert(stream);

  if (status != StreamStatus::kInitializing) {
    workstream::db::model::StreamUpdate update;
    update.status = status;
    ledger.Update(id, update);
  }
}

// merged    branch merged, worktree gone
// stale     nothing on disk or in git
// live      registered worktree, still initializing
// paused    directory on disk but not registered with git
// orphan    worktree with no ledger entry
Fixture MakeFixture(const std::string& name) {
  const auto base = fs::temp_directory_path() / "workstream_reconciliation_tests" / name;
  fs::remove_all(base);
  const auto root = base / "repo";
  fs::create_directories(root);
  fs::create_directories(base / "worktrees" / "paused");

  Fixture f;
  f.root = root;
  f.db   = std::make_shared<workstream::db::sqlite::SqliteDB>((base / "ledger.db").string());
  workstream::db::sqlite::BootstrapSchema(f.db);
  f.ledger = std::make_shared<StreamLedger>(std::make_shared<workstream::db::sqlite::SqliteRepository>(f.db));
  f.ledger->EnsureMainStream(root.string());

  AddStream(*f.ledger, "merged", (base / "worktrees" / "merged").string(), StreamStatus::kActive);
  AddStream(*f.ledger, "stale", (base / "worktrees" / "stale").string(), StreamStatus::kBlocked);
  AddStream(*f.ledger, "live", "/elsewhere/live", StreamStatus::kInitializing);
  AddStream(*f.ledger, "paused", (base / "worktrees" / "paused").string(), StreamStatus::kPaused);

  f.runner = std::make_shared<FakeCommandRunner>();
  f.runner->ScriptOutput("git worktree list --porcelain",
                       "worktree " + root.string() + "\nHEAD 000\nbranch refs/heads/main\n\n"
                       "worktree /x/live\nHEAD 111\nbranch refs/heads/feature/live\n\n"
                       "worktree /x/orphan\nHEAD 222\nbranch refs/heads/feature/orphan\n");
  f.runner->ScriptOutput("git branch --merged main", "* main\n  feature/merged\n");

  auto git = std::make_shared<workstream::git::GitIntrospection>(f.runner, root.string());
  f.engine = std::make_unique<ReconciliationEngine>(f.ledger, git);
  return f;
}

const workstream::v1::ReconciliationEntry* Find(const google::protobuf::RepeatedPtrField<workstream::v1::ReconciliationEntry>& bucket,
                                                 const std::string& id) {
  for (const auto& entry : bucket) {
    if (entry.stream_id() == id) return &entry;
  }
  return nullptr;
}

// One line per stream covering every column reconciliation could write.
std::string Snapshot(StreamLedger& ledger) {
  std::string out;
  for (const auto& row : ledger.List()) {
    const auto& s = row.stream;
    out += s.id + "|" + std::string(workstream::model::ToString(s.status)) + "|" + std::to_string(s.progress) + "|" + s.updated_at + "|" +
           s.completed_at.value_or("-") + "|" + std::to_string(ledger.History(s.id).size()) + "\n";
  }
  return out;
}

void TestDryRunClassifiesWithoutWriting() {
  auto f = MakeFixture("dry_run");

  auto report = f.engine->Reconcile(ReconcileOptions{});
  assert(report.dry_run());

  assert(report.completed_size() == 1);
  assert(report.stale_size() == 1);
  assert(report.active_size() == 2);
  assert(report.errors_size() == 0);

  const auto* merged = Find(report.completed(), "merged");
  assert(merged);
  assert(merged->reason() == workstream::reconcile::kReasonMerged);
  assert(merged->branch_merged());
  assert(merged->applied_status().empty());

  const auto* stale = Find(report.stale(), "stale");
  assert(stale);
  assert(!stale->worktree_exists());
  assert(stale->reason() == workstream::reconcile::kReasonNoWorktree);

  const auto* live = Find(report.active(), "live");
  assert(live);
  assert(live->worktree_path() == "/x/live");
  assert(live->reason() == workstream::reconcile::kReasonActive);

  assert(Find(report.active(), "paused"));

  assert(report.orphaned_size() == 1);
  assert(report.orphaned(0).id() == "orphan");
  assert(report.orphaned(0).commit_hash() == "222");

  assert(report.summary().total_streams() == 4);
  assert(report.summary().total_worktrees() == 2);
  assert(report.summary().orphaned() == 1);

  assert(f.ledger->Get("merged")->status == StreamStatus::kActive);
  assert(f.ledger->Get("live")->status == StreamStatus::kInitializing);
}

void TestApplyWritesThroughTheLedger() {
  auto f = MakeFixture("apply");

  ReconcileOptions options;
  options.dry_run            = false;
  options.auto_archive_stale = true;

  auto report = f.engine->Reconcile(options);
  assert(!report.dry_run());

  assert(Find(report.completed(), "merged")->applied_status() == "completed");
  assert(Find(report.stale(), "stale")->applied_status() == "archived");
  assert(Find(report.active(), "live")->applied_status() == "active");
  assert(Find(report.active(), "paused")->applied_status().empty());

  auto merged = f.ledger->Get("merged");
  assert(merged->status == StreamStatus::kCompleted);
  assert(merged->completed_at);
  assert(f.ledger->Get("stale")->status == StreamStatus::kArchived);
  assert(f.ledger->Get("live")->status == StreamStatus::kActive);
  assert(f.ledger->Get("paused")->status == StreamStatus::kPaused);

  auto history = f.ledger->History("merged");
  assert(history.front().event_type == HistoryEventType::kStatusChanged);
  assert(history.front().new_value.value_or("") == "completed");
}

void TestSecondApplyLeavesTargetsAlone() {
  auto f = MakeFixture("second_apply");

  ReconcileOptions options;
  options.dry_run            = false;
  options.auto_archive_stale = true;
  f.engine->Reconcile(options);

  const auto events_before = f.ledger->History("merged").size();

  auto report = f.engine->Reconcile(options);
  assert(Find(report.completed(), "merged")->applied_status().empty());
  assert(Find(report.stale(), "stale")->applied_status().empty());
  assert(Find(report.active(), "live")->applied_status().empty());
  assert(f.ledger->History("merged").size() == events_before);
}

void TestStaleIsNotArchivedWithoutOptIn() {
  auto f = MakeFixture("no_auto_archive");

  ReconcileOptions options;
  options.dry_run = false;

  auto report = f.engine->Reconcile(options);
  assert(Find(report.stale(), "stale")->applied_status().empty());
  assert(f.ledger->Get("stale")->status == StreamStatus::kBlocked);
}

void TestDryRunLeavesEveryRowUntouched() {
  auto f = MakeFixture("dry_run_snapshot");
  f.runner->ScriptOutput("git branch --merged main", "* main\n  feature/merged\n  feature/live\n");

  const auto before = Snapshot(*f.ledger);

  ReconcileOptions options;
  options.auto_archive_stale = true;
  auto report                = f.engine->Reconcile(options);
  assert(report.completed_size() == 2);
  assert(report.stale_size() == 1);

  assert(Snapshot(*f.ledger) == before);
}

void TestMergedBranchWinsOverLiveWorktree() {
  auto f = MakeFixture("merged_with_worktree");
  f.runner->ScriptOutput("git branch --merged main", "* main\n  feature/merged\n  feature/live\n");

  auto report = f.engine->Reconcile(ReconcileOptions{});
  const auto* live = Find(report.completed(), "live");
  assert(live);
  assert(live->worktree_exists());
  assert(live->branch_merged());
  assert(live->reason() == workstream::reconcile::kReasonMerged);
  assert(!Find(report.active(), "live"));
  assert(report.active_size() == 1);

  // the worktree is still claimed, so it is not reported as orphaned
  assert(report.orphaned_size() == 1);
  assert(report.orphaned(0).id() == "orphan");

  ReconcileOptions apply;
  apply.dry_run = false;
  f.engine->Reconcile(apply);
  assert(f.ledger->Get("live")->status == StreamStatus::kCompleted);
}

void TestFailingStreamDoesNotAbortThePass() {
  auto f = MakeFixture("isolated_failure");
  f.db->Exec(
      "CREATE TRIGGER refuse_merged BEFORE UPDATE ON streams WHEN OLD.id='merged' "
      "BEGIN SELECT RAISE(ABORT, 'ledger refused update'); END;");

  ReconcileOptions options;
  options.dry_run            = false;
  options.auto_archive_stale = true;

  auto report = f.engine->Reconcile(options);
  assert(report.errors_size() == 1);
  assert(report.errors(0).stream_id() == "merged");
  assert(report.errors(0).error().find("ledger refused update") != std::string::npos);
  assert(report.summary().errors() == 1);
  assert(!Find(report.completed(), "merged"));

  assert(Find(report.stale(), "stale")->applied_status() == "archived");
  assert(Find(report.active(), "live")->applied_status() == "active");
  assert(f.ledger->Get("merged")->status == StreamStatus::kActive);
  assert(f.ledger->Get("stale")->status == StreamStatus::kArchived);
  assert(f.ledger->Get("live")->status == StreamStatus::kActive);
}

void TestNonMainBaseBranch() {
  auto f = MakeFixture("develop_base");
  f.runner->ScriptOutput("git worktree list --porcelain",
                         "worktree " + f.root.string() + "\nHEAD 000\nbranch refs/heads/develop\n\n"
                         "worktree /x/live\nHEAD 111\nbranch refs/heads/feature/live\n\n"
                         "worktree /x/hotfix\nHEAD 333\nbranch refs/heads/main\n");
  f.runner->ScriptOutput("git branch --merged develop", "* develop\n  main\n  feature/merged\n");

  ReconcileOptions options;
  options.base_branch = "develop";

  auto report = f.engine->Reconcile(options);
  assert(report.summary().total_worktrees() == 2);
  assert(report.summary().orphaned() == 1);
  assert(report.orphaned(0).id() == "hotfix");
  assert(report.orphaned(0).branch() == "main");

  assert(Find(report.completed(), "merged"));
  assert(Find(report.active(), "live")->worktree_path() == "/x/live");
  assert(f.runner->Ran("git branch --merged develop"));
  assert(!f.runner->Ran("git branch --merged main"));
}

void TestFormattedReport() {
  auto f    = MakeFixture("format");
  auto text = workstream::reconcile::FormatReconciliationReport(f.engine->Reconcile(ReconcileOptions{}));

  assert(text.find("(dry run)") != std::string::npos);
  assert(text.find("Completed (1)") != std::string::npos);
  assert(text.find("Stale (1)") != std::string::npos);
  assert(text.find("Orphaned worktrees (1)") != std::string::npos);
  assert(text.find("No changes applied") != std::string::npos);
}

} // namespace

int main() {
  TestDryRunClassifiesWithoutWriting();
  TestApplyWritesThroughTheLedger();
  TestSecondApplyLeavesTargetsAlone();
  TestStaleIsNotArchivedWithoutOptIn();
  TestDryRunLeavesEveryRowUntouched();
  TestMergedBranchWinsOverLiveWorktree();
  TestFailingStreamDoesNotAbortThePass();
  TestNonMainBaseBranch();
  TestFormattedReport();

  std::cout << "workstream_unit_reconciliation_engine: pass\n";
  return 0;
}
