#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/commit_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/stats_record.hpp"
#include "internal/db/model/stream_record.hpp"
#include "internal/db/model/summary_job_record.hpp"

namespace workstream::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - A read that fails in storage raises; it never reports "no rows"
  - Single-row mutations report NotFound when no row matched
  - Duplicate keys report AlreadyExists, never a generic error

  The DB is the source of truth for:
    intended stream state
    commit attribution
    lifecycle history
    pending summary jobs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Takes the write lock up front.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only unit of work; takes no write lock.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  virtual Result InsertStream(Transaction&, const model::StreamRecord&) = 0;

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& id) = 0;

  // Excludes the synthetic "main" stream; newest updated_at first.
  virtual std::vector<model::StreamListRow> ListStreams(Transaction&, const model::StreamFilter& filter) = 0;

  virtual Result UpdateStream(Transaction&, const std::string& id, const model::StreamUpdate& update, const std::string& updated_at) = 0;

  // Single statement: status, completed_at (kept if already completed), updated_at.
  virtual Result CompleteStream(Transaction&, const std::string& id, const std::string& now) = 0;

  virtual Result TouchStream(Transaction&, const std::string& id, const std::string& now) = 0;

  // Removes the stream's commits and history, then the stream row.
  virtual Result DeleteStream(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Commits
  // ---------------------------------------------------------------------

  virtual Result InsertCommit(Transaction&, const model::CommitRecord&) = 0;

  virtual std::vector<model::CommitRecord> ListCommits(Transaction&, const std::optional<std::string>& stream_id, int limit) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  virtual Result InsertHistory(Transaction&, const model::HistoryRecord&) = 0;

  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& stream_id) = 0;

  // ---------------------------------------------------------------------
  // Stats
  // ---------------------------------------------------------------------

  virtual model::QuickStats GetStats(Transaction&, const std::string& day_start) = 0;

  // ---------------------------------------------------------------------
  // Summary jobs
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertSummaryJob(Transaction&, model::SummaryJobRecord& record) = 0;

  virtual std::optional<model::SummaryJobRecord> GetSummaryJob(Transaction&, int64_t id) = 0;

  // Oldest pending job with attempts left.
  virtual std::optional<model::SummaryJobRecord> NextPendingSummaryJob(Transaction&) = 0;

  virtual Result UpdateSummaryJob(Transaction&, const model::SummaryJobRecord&) = 0;

  virtual std::vector<model::SummaryJobRecord> ListSummaryJobs(Transaction&, const std::optional<workstream::model::SummaryJobStatus>& status) = 0;
};

} // namespace workstream::db
