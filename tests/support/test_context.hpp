#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/stream_ledger.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/git/git_introspection.hpp"
#include "internal/jobs/summary_job_queue.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/retirement/retirement_service.hpp"
#include "internal/scanner/commit_scanner.hpp"
#include "internal/service/service_context.hpp"
#include "tests/support/fake_command_runner.hpp"

namespace workstream::testing {

/*
  ServiceContext wired like factory::Build, but on a scratch project under
  the temp directory and with a scripted command runner.
*/
struct TestContext {
  std::filesystem::path              base;
  std::shared_ptr<FakeCommandRunner> runner;
  service::ServiceContext            ctx;
};

inline TestContext BuildTestContext(const std::string& name) {
  namespace fs = std::filesystem;

  TestContext t;
  t.base = fs::temp_directory_path() / "workstream_service_tests" / name;
  fs::remove_all(t.base);
  fs::create_directories(t.base / "demo");

  auto config = config::ConfigLoader::ForProjectRoot((t.base / "demo").string());
  config.mutable_lock()->set_cache_root((t.base / "cache").string());
  config.mutable_database()->mutable_sqlite()->set_path((t.base / "ledger.db").string());
  fs::create_directories(config.project().worktree_root());

  auto sqlite = std::make_shared<db::sqlite::SqliteDB>(config.database().sqlite().path());
  db::sqlite::BootstrapSchema(sqlite);
  auto repository = std::make_shared<db::sqlite::SqliteRepository>(sqlite);

  t.runner = std::make_shared<FakeCommandRunner>();

  auto ledger = std::make_shared<core::StreamLedger>(repository);
  ledger->EnsureMainStream(config.project().root(), config.project().base_branch());

  auto git = std::make_shared<git::GitIntrospection>(t.runner, config.project().root());

  scanner::ScanOptions scan_options;
  scan_options.project_root = config.project().root();
  scan_options.base_branch  = config.project().base_branch();

  auto jobs = std::make_shared<jobs::LedgerSummaryJobQueue>(repository);

  t.ctx.config     = config;
  t.ctx.ledger     = ledger;
  t.ctx.git        = git;
  t.ctx.scanner    = std::make_shared<scanner::CommitScanner>(ledger, git, scan_options);
  t.ctx.reconciler = std::make_shared<reconcile::ReconciliationEngine>(ledger, git);
  t.ctx.jobs       = jobs;
  t.ctx.retirement = std::make_shared<retirement::RetirementService>(t.runner, retirement::RetirementOptions::FromConfig(config), jobs);
  return t;
}

} // namespace workstream::testing
