#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace workstream::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), guard_(db_->TxMutex()) {
  db_->Exec(mode == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    WORKSTREAM_LOG_WARN("ledger rollback failed", {observability::StringField("db", db_->Path()),
                                                   observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!open_) return;
  db_->Exec("COMMIT;");
  open_ = false;
}

} // namespace workstream::db::sqlite
