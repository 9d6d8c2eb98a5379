#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace workstream::db::sqlite {

enum class TxMode { kRead, kWrite };

/*
  Transaction on the shared ledger connection.

  Takes the connection's TxMutex. kWrite opens BEGIN IMMEDIATE so a second
  process (workstreamctl next to the server) waits on the busy timeout
  rather than failing mid-update; kRead opens BEGIN DEFERRED and takes no
  write lock. A lock still held when the busy timeout expires raises
  util::ResourceExhausted. Not reentrant on one thread.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode = TxMode::kWrite);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
  bool                         open_ = true;
};

} // namespace workstream::db::sqlite
