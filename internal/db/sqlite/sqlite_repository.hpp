#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace workstream::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& id) override;
  std::vector<model::StreamListRow> ListStreams(Transaction&, const model::StreamFilter& filter) override;
  Result UpdateStream(Transaction&, const std::string& id, const model::StreamUpdate& update,
                      const std::string& updated_at) override;
  Result CompleteStream(Transaction&, const std::string& id, const std::string& now) override;
  Result TouchStream(Transaction&, const std::string& id, const std::string& now) override;
  Result DeleteStream(Transaction&, const std::string& id) override;

  Result InsertCommit(Transaction&, const model::CommitRecord&) override;
  std::vector<model::CommitRecord> ListCommits(Transaction&, const std::optional<std::string>& stream_id, int limit) override;

  Result InsertHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& stream_id) override;

  model::QuickStats GetStats(Transaction&, const std::string& day_start) override;

  Result InsertSummaryJob(Transaction&, model::SummaryJobRecord& record) override;
  std::optional<model::SummaryJobRecord> GetSummaryJob(Transaction&, int64_t id) override;
  std::optional<model::SummaryJobRecord> NextPendingSummaryJob(Transaction&) override;
  Result UpdateSummaryJob(Transaction&, const model::SummaryJobRecord&) override;
  std::vector<model::SummaryJobRecord> ListSummaryJobs(
      Transaction&, const std::optional<workstream::model::SummaryJobStatus>& status) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static void CheckRead(sqlite3* db, int rc, const std::string& context);
};

} // namespace workstream::db::sqlite
