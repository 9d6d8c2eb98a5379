#pragma once

#include <memory>

#include "config/config.pb.h"

namespace workstream::core { class StreamLedger; }
namespace workstream::git { class GitIntrospection; }
namespace workstream::scanner { class CommitScanner; }
namespace workstream::reconcile { class ReconciliationEngine; }
namespace workstream::retirement { class RetirementService; }
namespace workstream::jobs { class LedgerSummaryJobQueue; }

namespace workstream::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  workstream::runtime::config::RuntimeConfig config;

  std::shared_ptr<workstream::core::StreamLedger>              ledger;
  std::shared_ptr<workstream::git::GitIntrospection>           git;
  std::shared_ptr<workstream::scanner::CommitScanner>          scanner;
  std::shared_ptr<workstream::reconcile::ReconciliationEngine> reconciler;
  std::shared_ptr<workstream::retirement::RetirementService>   retirement;
  std::shared_ptr<workstream::jobs::LedgerSummaryJobQueue>     jobs;
};

} // namespace workstream::service
