#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace workstream::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

/*
  Owns the single sqlite3 connection behind the stream ledger.

  The parent directory of the database file is created on open. Every
  request thread shares this connection; TxMutex() serializes transactions
  on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = SqliteOptions());
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements that return no rows (schema, pragmas).
  // Throws util::ResourceExhausted when the database stays locked past the
  // busy timeout, std::runtime_error on any other failure.
  void Exec(const std::string& sql);

  // First column of the first row of "PRAGMA <name>;", empty when none.
  std::string PragmaValue(const std::string& name);

 private:
  void ApplyOptions(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace workstream::db::sqlite
