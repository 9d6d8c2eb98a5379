#include "internal/core/stream_ledger.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using workstream::core::StreamLedger;
using workstream::db::model::CommitRecord;
using workstream::db::model::StreamRecord;
using workstream::db::model::StreamUpdate;
using workstream::model::HistoryEventType;
using workstream::model::StreamStatus;

std::shared_ptr<StreamLedger> MakeLedger(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "workstream_stream_ledger_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<workstream::db::sqlite::SqliteDB>(path.string());
  workstream::db::sqlite::BootstrapSchema(db);
  return std::make_shared<StreamLedger>(std::make_shared<workstream::db::sqlite::SqliteRepository>(db));
}

StreamRecord MakeStream(const std::string& id) {
  StreamRecord stream;
  stream.id            = id;
  stream.stream_number = id;
  stream.title         = "Stream " + id;
  stream.branch        = "feature/" + id;
  stream.worktree_path = "/tmp/worktrees/" + id;
  stream.phases        = {"plan", "build", "ship"};
  return stream;
}

CommitRecord MakeCommit(const std::string& stream_id, const std::string& hash, const std::string& timestamp) {
  CommitRecord commit;
  commit.stream_id     = stream_id;
  commit.commit_hash   = hash;
  commit.message       = "commit " + hash;
  commit.author        = "dev";
  commit.files_changed = 2;
  commit.timestamp     = timestamp;
  return commit;
}

void TestInsertForcesInitialState() {
  auto ledger = MakeLedger("insert");

  auto input     = MakeStream("alpha");
  input.status   = StreamStatus::kCompleted;
  input.progress = 80;

  auto stored = ledger->Insert(input);
  assert(stored.status == StreamStatus::kInitializing);
  assert(stored.progress == 0);
  assert(!stored.completed_at);
  assert(stored.created_at == stored.updated_at);

  auto loaded = ledger->Get("alpha");
  assert(loaded);
  assert(loaded->phases.size() == 3);
  assert(loaded->phases[1] == "build");

  auto history = ledger->History("alpha");
  assert(history.size() == 1);
  assert(history[0].event_type == HistoryEventType::kCreated);
  assert(history[0].new_value.value_or("") == "initializing");
}

void TestDuplicateInsertIsAlreadyExists() {
  auto ledger = MakeLedger("duplicate");
  ledger->Insert(MakeStream("alpha"));

  bool threw = false;
  try {
    ledger->Insert(MakeStream("alpha"));
  } catch (const workstream::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyUpdateIsNoOp() {
  auto ledger = MakeLedger("empty_update");
  auto before = ledger->Insert(MakeStream("alpha"));

  auto after = ledger->Update("alpha", StreamUpdate{});
  assert(after.updated_at == before.updated_at);
  assert(ledger->History("alpha").size() == 1);
}

void TestUpdateValidation() {
  auto ledger = MakeLedger("update_validation");
  ledger->Insert(MakeStream("alpha"));

  StreamUpdate bad;
  bad.progress = 101;

  bool threw = false;
  try {
    ledger->Update("alpha", bad);
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "progress";
  }
  assert(threw);

  StreamUpdate ok;
  ok.progress = 40;

  threw = false;
  try {
    ledger->Update("missing", ok);
  } catch (const workstream::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUpdateRecordsHistory() {
  auto ledger = MakeLedger("update_history");
  ledger->Insert(MakeStream("alpha"));

  StreamUpdate update;
  update.status     = StreamStatus::kActive;
  update.progress   = 25;
  update.blocked_by = std::string("beta");

  auto updated = ledger->Update("alpha", update);
  assert(updated.status == StreamStatus::kActive);
  assert(updated.progress == 25);
  assert(updated.blocked_by.value_or("") == "beta");

  auto history = ledger->History("alpha");
  assert(history.size() == 3);

  int status_changes   = 0;
  int progress_changes = 0;
  for (const auto& event : history) {
    if (event.event_type == HistoryEventType::kStatusChanged) {
      ++status_changes;
      assert(event.old_value.value_or("") == "initializing");
      assert(event.new_value.value_or("") == "active");
    }
    if (event.event_type == HistoryEventType::kProgressUpdated) {
      ++progress_changes;
      assert(event.old_value.value_or("") == "0");
      assert(event.new_value.value_or("") == "25");
    }
  }
  assert(status_changes == 1);
  assert(progress_changes == 1);

  StreamUpdate clear;
  clear.blocked_by = std::string();
  assert(!ledger->Update("alpha", clear).blocked_by);
}

void TestCompleteKeepsFirstCompletionTime() {
  auto ledger = MakeLedger("complete");
  ledger->Insert(MakeStream("alpha"));

  StreamUpdate to_completed;
  to_completed.status = StreamStatus::kCompleted;

  auto first = ledger->Update("alpha", to_completed);
  assert(first.status == StreamStatus::kCompleted);
  assert(first.completed_at);

  auto second = ledger->Complete("alpha");
  assert(second.completed_at == first.completed_at);

  int status_changes = 0;
  for (const auto& event : ledger->History("alpha")) {
    if (event.event_type == HistoryEventType::kStatusChanged) ++status_changes;
  }
  assert(status_changes == 1);

  StreamUpdate reopen;
  reopen.status = StreamStatus::kActive;
  auto reopened = ledger->Update("alpha", reopen);
  assert(reopened.status == StreamStatus::kActive);
  assert(!reopened.completed_at);
}

void TestListFiltersAndRecentActivity() {
  auto ledger = MakeLedger("list");
  ledger->EnsureMainStream("/srv/repo");
  ledger->Insert(MakeStream("alpha"));
  ledger->Insert(MakeStream("beta"));

  StreamUpdate active;
  active.status = StreamStatus::kActive;
  ledger->Update("beta", active);

  assert(ledger->AddCommit(MakeCommit("alpha", "aaa1", "2026-01-01T10:00:00Z")));
  assert(ledger->AddCommit(MakeCommit("alpha", "aaa2", "2026-01-02T10:00:00+02:00")));

  auto all = ledger->List();
  assert(all.size() == 2);
  for (const auto& row : all) {
    assert(row.stream.id != "main");
    if (row.stream.id == "alpha") {
      assert(row.recent_activity);
      assert(row.recent_activity->message == "commit aaa2");
    } else {
      assert(!row.recent_activity);
    }
  }

  workstream::db::model::StreamFilter filter;
  filter.status = StreamStatus::kActive;
  auto active_only = ledger->List(filter);
  assert(active_only.size() == 1);
  assert(active_only[0].stream.id == "beta");
}

void TestAddCommitDuplicatesAreTyped() {
  auto ledger = MakeLedger("commits");
  ledger->Insert(MakeStream("alpha"));

  auto first = ledger->AddCommit(MakeCommit("alpha", "abc", "2026-01-01T10:00:00.5Z"));
  assert(first);

  auto again = ledger->AddCommit(MakeCommit("alpha", "abc", "2026-01-01T10:00:00.5Z"));
  assert(!again);
  assert(again.Duplicate());

  auto orphan = ledger->AddCommit(MakeCommit("nobody", "def", "2026-01-01T10:00:00Z"));
  assert(!orphan);
  assert(!orphan.Duplicate());

  auto commits = ledger->ListCommits(std::string("alpha"));
  assert(commits.size() == 1);
  assert(commits[0].timestamp == "2026-01-01T10:00:00.500Z");
}

void TestDeleteRemovesCommitsAndHistory() {
  auto ledger = MakeLedger("delete");
  ledger->Insert(MakeStream("alpha"));
  assert(ledger->AddCommit(MakeCommit("alpha", "abc", "2026-01-01T10:00:00Z")));

  ledger->Delete("alpha");
  assert(!ledger->Get("alpha"));
  assert(ledger->History("alpha").empty());
  assert(ledger->ListCommits(std::string("alpha")).empty());

  bool threw = false;
  try {
    ledger->Delete("alpha");
  } catch (const workstream::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStatsCountsWorkingStreams() {
  auto ledger = MakeLedger("stats");
  ledger->EnsureMainStream("/srv/repo");
  ledger->Insert(MakeStream("a"));
  ledger->Insert(MakeStream("b"));
  ledger->Insert(MakeStream("c"));
  ledger->Insert(MakeStream("d"));

  StreamUpdate update;
  update.status = StreamStatus::kActive;
  ledger->Update("a", update);
  update.status = StreamStatus::kBlocked;
  ledger->Update("b", update);
  ledger->Complete("c");

  assert(ledger->AddCommit(MakeCommit("a", "old", "2020-01-01T00:00:00Z")));
  assert(ledger->AddCommit(MakeCommit("a", "new", "")));

  auto stats = ledger->Stats();
  assert(stats.active_streams == 3);
  assert(stats.in_progress == 1);
  assert(stats.blocked == 1);
  assert(stats.paused == 0);
  assert(stats.completed_today == 1);
  assert(stats.total_commits == 2);
  assert(stats.commits_today == 1);
}

void TestEnsureMainStreamIsIdempotent() {
  auto ledger = MakeLedger("main_stream");
  ledger->EnsureMainStream("/srv/repo", "trunk");
  ledger->EnsureMainStream("/srv/other", "main");

  auto main = ledger->Get(workstream::core::kMainStreamId);
  assert(main);
  assert(main->title == "Main Branch");
  assert(main->branch == "trunk");
  assert(main->worktree_path == "/srv/repo");
  assert(main->status == StreamStatus::kActive);
  assert(main->progress == 100);
  assert(ledger->History(workstream::core::kMainStreamId).empty());
}

} // namespace

int main() {
  TestInsertForcesInitialState();
  TestDuplicateInsertIsAlreadyExists();
  TestEmptyUpdateIsNoOp();
  TestUpdateValidation();
  TestUpdateRecordsHistory();
  TestCompleteKeepsFirstCompletionTime();
  TestListFiltersAndRecentActivity();
  TestAddCommitDuplicatesAreTyped();
  TestDeleteRemovesCommitsAndHistory();
  TestStatsCountsWorkingStreams();
  TestEnsureMainStreamIsIdempotent();

  std::cout << "workstream_unit_stream_ledger: pass\n";
  return 0;
}
