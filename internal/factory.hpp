#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/http/stream_routes.hpp"
#include "internal/jobs/summary_job_queue.hpp"
#include "internal/scanner/scan_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/stream_service.hpp"

namespace workstream::factory {

/*
  Application

  Owns all long-lived singletons used by the server and workstreamctl.
  Background workers are built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  service::ServiceContext         context;

  std::shared_ptr<service::StreamService> stream_service;
  std::shared_ptr<service::AdminService>  admin_service;
  std::shared_ptr<http::StreamRoutes>     routes;

  // null when scan.interval_sec is 0
  std::shared_ptr<scanner::ScanWorker> scan_worker;
};

/*
  Build

  Constructs the entire backend from a resolved runtime config: opens the
  ledger database (creating its directory and schema), makes sure the
  main stream exists and wires git, scanner, reconciliation, retirement
  and the services.

  This is the composition root of the application and the only place that
  knows concrete DB and process types.
*/
Application Build(const workstream::runtime::config::RuntimeConfig& config);

} // namespace workstream::factory
