#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"

namespace workstream::db::sqlite {

namespace {

void CreateParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("cannot create database directory " + parent.string() + ": " + ec.message());
  }
}

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  CreateParentDirectory(path_);

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open ledger " + path_ + ": " + reason);
  }

  try {
    ApplyOptions(options);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string reason = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);

  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw util::ResourceExhausted(path_ + ": " + reason);
  }
  throw std::runtime_error(path_ + ": " + reason);
}

std::string SqliteDB::PragmaValue(const std::string& name) {
  sqlite3_stmt* stmt = nullptr;
  Check(sqlite3_prepare_v2(db_, ("PRAGMA " + name + ";").c_str(), -1, &stmt, nullptr), db_, "pragma " + name);

  std::string value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    if (const auto* text = sqlite3_column_text(stmt, 0)) value = reinterpret_cast<const char*>(text);
  }
  sqlite3_finalize(stmt);
  return value;
}

void SqliteDB::ApplyOptions(const SqliteOptions& options) {
  Check(sqlite3_extended_result_codes(db_, 1), db_, "extended result codes");
  // a CLI write waits for the server instead of returning SQLITE_BUSY
  Check(sqlite3_busy_timeout(db_, options.busy_timeout_ms), db_, "busy timeout");

  if (options.wal_mode) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  // history and commits cascade on stream delete
  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace workstream::db::sqlite
