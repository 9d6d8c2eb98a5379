#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/stream_ledger.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/git/git_introspection.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/retirement/retirement_service.hpp"
#include "internal/scanner/commit_scanner.hpp"
#include "internal/util/process.hpp"

namespace workstream::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const workstream::runtime::config::RuntimeConfig& config) {
  const auto& sqlite = config.database().sqlite();
  if (sqlite.path().empty()) {
    throw std::runtime_error("database.sqlite.path is not set; resolve the config before building");
  }

  db::sqlite::SqliteOptions options;
  options.wal_mode = !sqlite.has_wal_mode() || sqlite.wal_mode();
  if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
  db::sqlite::BootstrapSchema(sqlite_db);

  WORKSTREAM_LOG_INFO("ledger opened", {observability::StringField("path", sqlite.path())});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const workstream::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto ledger = std::make_shared<core::StreamLedger>(app.repository);
  ledger->EnsureMainStream(config.project().root(), config.project().base_branch());

  // ------------------------------------------------------------------
  // Git-facing components
  // ------------------------------------------------------------------
  auto runner = std::make_shared<util::SubprocessRunner>();
  auto git    = std::make_shared<git::GitIntrospection>(runner, config.project().root());

  scanner::ScanOptions scan_options;
  scan_options.project_root        = config.project().root();
  scan_options.base_branch         = config.project().base_branch();
  scan_options.branch_commit_limit = config.scan().branch_commit_limit();
  scan_options.main_commit_limit   = config.scan().main_commit_limit();
  scan_options.main_since          = config.scan().main_since();
  auto scanner = std::make_shared<scanner::CommitScanner>(ledger, git, scan_options);

  auto reconciler = std::make_shared<reconcile::ReconciliationEngine>(ledger, git);

  auto jobs       = std::make_shared<jobs::LedgerSummaryJobQueue>(app.repository, config.retirement().summary_max_attempts());
  auto retirement = std::make_shared<retirement::RetirementService>(runner, retirement::RetirementOptions::FromConfig(config), jobs);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext& ctx = app.context;
  ctx.config     = config;
  ctx.ledger     = ledger;
  ctx.git        = git;
  ctx.scanner    = scanner;
  ctx.reconciler = reconciler;
  ctx.retirement = retirement;
  ctx.jobs       = jobs;

  app.stream_service = std::make_shared<service::StreamService>(ctx);
  app.admin_service  = std::make_shared<service::AdminService>(ctx);

  app.routes = std::make_shared<http::StreamRoutes>(app.stream_service, app.admin_service);
  app.routes->SetHealthPath(config.server().health_path());

  // ------------------------------------------------------------------
  // Background workers (started by the server once it owns the port)
  // ------------------------------------------------------------------
  if (config.scan().interval_sec() > 0) {
    app.scan_worker = std::make_shared<scanner::ScanWorker>(scanner, std::chrono::seconds(config.scan().interval_sec()));
  }

  return app;
}

} // namespace workstream::factory
