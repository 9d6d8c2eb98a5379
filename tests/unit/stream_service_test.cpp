#include "internal/service/stream_service.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/service/admin_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_context.hpp"

namespace {

namespace fs = std::filesystem;
using namespace workstream::v1;
using workstream::service::AdminService;
using workstream::service::StreamService;
using workstream::testing::BuildTestContext;

AddStreamRequest MakeAdd(const std::string& id) {
  AddStreamRequest req;
  req.set_id(id);
  req.set_title("Stream " + id);
  req.set_branch("feature/" + id);
  return req;
}

void Complete(StreamService& service, const std::string& id) {
  UpdateStreamRequest req;
  req.set_status("completed");
  service.UpdateStream(id, req);
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestAddStreamDefaults() {
  auto          t = BuildTestContext("add_defaults");
  StreamService service(t.ctx);

  auto resp = service.AddStream(MakeAdd("alpha"));
  assert(resp.success());
  const auto& stream = resp.stream();
  assert(stream.status() == "initializing");
  assert(stream.progress() == 0);
  assert(stream.category() == "backend");
  assert(stream.priority() == "medium");
  assert(stream.stream_number() == "alpha");
  assert(stream.worktree_path() == (fs::path(t.ctx.config.project().worktree_root()) / "alpha").string());

  assert(Throws<workstream::util::AlreadyExists>([&] { service.AddStream(MakeAdd("alpha")); }));
  assert(Throws<workstream::util::InvalidArgument>([&] { service.AddStream(MakeAdd("main")); }));

  auto bad = MakeAdd("beta");
  bad.set_category("marketing");
  assert(Throws<workstream::util::InvalidArgument>([&] { service.AddStream(bad); }));
}

void TestListAndFilters() {
  auto          t = BuildTestContext("list");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));
  auto beta = MakeAdd("beta");
  beta.set_category("frontend");
  service.AddStream(beta);

  auto all = service.ListStreams(ListStreamsRequest{});
  assert(all.count() == 2);

  ListStreamsRequest by_category;
  by_category.set_category("frontend");
  auto frontend = service.ListStreams(by_category);
  assert(frontend.count() == 1);
  assert(frontend.streams(0).id() == "beta");

  ListStreamsRequest bad;
  bad.set_status("done");
  bool threw = false;
  try {
    service.ListStreams(bad);
  } catch (const workstream::util::InvalidArgument& e) {
    threw = e.field() == "status" && std::string(e.what()).rfind("Invalid status. Must be one of:", 0) == 0;
  }
  assert(threw);
}

void TestUpdateReportsChanges() {
  auto          t = BuildTestContext("update");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));

  UpdateStreamRequest req;
  req.set_status("active");
  req.set_progress(30);
  req.set_blocked_by("beta");

  auto resp = service.UpdateStream("alpha", req);
  assert(resp.stream().status() == "active");
  assert(resp.changes().status().from() == "initializing");
  assert(resp.changes().status().to() == "active");
  assert(resp.changes().progress().from() == "0");
  assert(resp.changes().progress().to() == "30");
  assert(resp.changes().blocked_by().to() == "beta");
  assert(!resp.changes().has_current_phase());

  UpdateStreamRequest out_of_range;
  out_of_range.set_progress(101);
  bool threw = false;
  try {
    service.UpdateStream("alpha", out_of_range);
  } catch (const workstream::util::InvalidArgument& e) {
    threw = std::string(e.what()) == "Progress must be a number between 0 and 100";
  }
  assert(threw);

  assert(Throws<workstream::util::NotFound>([&] { service.UpdateStream("ghost", req); }));

  auto history = service.History("alpha");
  assert(history.events_size() == 3);
  assert(Throws<workstream::util::NotFound>([&] { service.History("ghost"); }));
}

void TestArchiveRequiresCompleted() {
  auto          t = BuildTestContext("archive_requires_completed");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));

  bool threw = false;
  try {
    service.ArchiveStream("alpha", ArchiveStreamRequest{});
  } catch (const workstream::util::InvalidState& e) {
    threw = std::string(e.what()).find("Current status: initializing") != std::string::npos;
  }
  assert(threw);
  assert(t.ctx.ledger->Get("alpha"));
  assert(t.runner->Calls().empty());

  assert(Throws<workstream::util::NotFound>([&] { service.ArchiveStream("ghost", ArchiveStreamRequest{}); }));
}

void TestArchiveRetiresAndDeletes() {
  auto t = BuildTestContext("archive");
  t.runner->SucceedByDefault();
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));
  Complete(service, "alpha");

  ArchiveStreamRequest req;
  req.set_summary("Shipped");
  auto resp = service.ArchiveStream("alpha", req);

  assert(resp.success());
  assert(resp.message() == "Stream alpha retired and removed from database");
  assert(resp.retirement().archive_written());
  assert(resp.retirement().summary_job_queued());
  assert(fs::exists(resp.retirement().archive_path()));

  assert(!t.ctx.ledger->Get("alpha"));
  assert(t.ctx.ledger->History("alpha").empty());

  auto jobs = t.ctx.jobs->ListByStatus(std::nullopt);
  assert(jobs.size() == 1);
  assert(jobs[0].user_summary == "Shipped");
}

void TestArchiveWithWarningsStillDeletes() {
  auto t = BuildTestContext("archive_warnings");
  t.runner->SucceedByDefault();
  t.runner->ScriptFailure("git push origin main", "rejected");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));
  Complete(service, "alpha");

  auto resp = service.ArchiveStream("alpha", ArchiveStreamRequest{});
  assert(!resp.success());
  assert(resp.message() == "Stream alpha retired with warnings and removed from database");
  assert(resp.retirement().errors_size() == 1);
  assert(!resp.retirement().archive_path().empty());
  assert(!t.ctx.ledger->Get("alpha"));
}

void TestArchiveBulkIsolatesFailures() {
  auto t = BuildTestContext("bulk");
  t.runner->SucceedByDefault();
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("done"));
  service.AddStream(MakeAdd("busy"));
  service.AddStream(MakeAdd("shelved"));
  Complete(service, "done");

  UpdateStreamRequest archive;
  archive.set_status("archived");
  service.UpdateStream("shelved", archive);

  ArchiveBulkRequest req;
  req.add_stream_ids("done");
  req.add_stream_ids("busy");
  req.add_stream_ids("ghost");
  req.add_stream_ids("shelved");

  auto resp = service.ArchiveBulk(req);
  assert(resp.results_size() == 4);
  assert(resp.results(0).success());
  assert(resp.results(1).message() == "Cannot retire: status is 'initializing', must be 'completed'");
  assert(resp.results(2).message() == "Not found");
  assert(resp.results(3).success());
  assert(resp.results(3).message() == "Already retired");

  assert(resp.retired() == 2);
  assert(resp.failed() == 2);
  assert(!resp.success());
  assert(resp.message() == "Retired 2 streams, 2 failed");

  assert(!t.ctx.ledger->Get("done"));
  assert(t.ctx.ledger->Get("busy"));

  assert(Throws<workstream::util::InvalidArgument>([&] { service.ArchiveBulk(ArchiveBulkRequest{}); }));
}

void TestCommits() {
  auto          t = BuildTestContext("commits");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));

  AddCommitRequest req;
  req.set_stream_id("alpha");
  req.set_commit_hash("abc123");
  req.set_message("feat: thing");
  req.set_files_changed(4);
  req.set_timestamp("2026-01-01T12:00:00Z");

  auto first = service.AddCommit(req);
  assert(first.success());
  assert(!first.already_present());

  auto again = service.AddCommit(req);
  assert(again.success());
  assert(again.already_present());

  auto orphan = req;
  orphan.set_stream_id("ghost");
  assert(Throws<workstream::util::NotFound>([&] { service.AddCommit(orphan); }));

  auto bad_time = req;
  bad_time.set_commit_hash("def");
  bad_time.set_timestamp("yesterday");
  assert(Throws<workstream::util::InvalidArgument>([&] { service.AddCommit(bad_time); }));

  ListCommitsRequest list;
  list.set_stream_id("alpha");
  auto commits = service.ListCommits(list);
  assert(commits.commits_size() == 1);
  assert(commits.commits(0).files_changed() == 4);
  assert(commits.commits(0).timestamp() == "2026-01-01T12:00:00.000Z");

  auto listed = service.ListStreams(ListStreamsRequest{});
  assert(listed.streams(0).recent_activity().message() == "feat: thing");
  assert(!listed.streams(0).recent_activity().relative_time().empty());
}

void TestConcurrentUpdatesKeepHistoryConsistent() {
  auto          t = BuildTestContext("concurrent");
  StreamService service(t.ctx);
  service.AddStream(MakeAdd("alpha"));

  std::vector<std::thread> workers;
  for (int i = 1; i <= 8; ++i) {
    workers.emplace_back([&service, i] {
      UpdateStreamRequest req;
      req.set_progress(i * 10);
      service.UpdateStream("alpha", req);
    });
  }
  for (auto& worker : workers) worker.join();

  auto history = service.History("alpha");
  assert(history.events_size() == 9);
  assert(history.events(0).new_value() == std::to_string(service.GetStream("alpha").progress()));
}

void TestAdminStatsAndScan() {
  auto          t = BuildTestContext("admin");
  StreamService streams(t.ctx);
  AdminService  admin(t.ctx);
  streams.AddStream(MakeAdd("alpha"));

  UpdateStreamRequest active;
  active.set_status("active");
  streams.UpdateStream("alpha", active);

  auto stats = admin.Stats();
  assert(stats.active_streams() == 1);
  assert(stats.in_progress() == 1);

  auto health = admin.Health();
  assert(health.status() == "ok");
  assert(health.project_name() == "demo");
  assert(admin.Version().version() == WORKSTREAM_VERSION);

  auto scan = admin.ScanCommits(ScanRequest{});
  assert(scan.errors() == 0);
  assert(scan.commits_added() == 0);

  ScanRequest one;
  one.set_stream_id("ghost");
  assert(Throws<workstream::util::NotFound>([&] { admin.ScanCommits(one); }));

  auto report = admin.Reconcile(ReconcileRequest{});
  assert(report.dry_run());
  assert(report.summary().total_streams() == 1);
  assert(report.stale_size() == 1);
  assert(streams.GetStream("alpha").status() == "active");
}

} // namespace

int main() {
  TestAddStreamDefaults();
  TestListAndFilters();
  TestUpdateReportsChanges();
  TestArchiveRequiresCompleted();
  TestArchiveRetiresAndDeletes();
  TestArchiveWithWarningsStillDeletes();
  TestArchiveBulkIsolatesFailures();
  TestCommits();
  TestConcurrentUpdatesKeepHistoryConsistent();
  TestAdminStatsAndScan();

  std::cout << "workstream_unit_stream_service: pass\n";
  return 0;
}
