#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace workstream::db::sqlite {

void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS streams ("
      " id TEXT PRIMARY KEY,"
      " stream_number TEXT NOT NULL DEFAULT '',"
      " title TEXT NOT NULL,"
      " category TEXT NOT NULL CHECK (category IN ('frontend','backend','infrastructure','testing','documentation','refactoring')),"
      " priority TEXT NOT NULL CHECK (priority IN ('critical','high','medium','low')),"
      " status TEXT NOT NULL DEFAULT 'initializing' CHECK (status IN ('initializing','active','blocked','paused','completed','archived')),"
      " progress INTEGER NOT NULL DEFAULT 0 CHECK (progress BETWEEN 0 AND 100),"
      " current_phase INTEGER,"
      " worktree_path TEXT NOT NULL DEFAULT '',"
      " branch TEXT NOT NULL,"
      " blocked_by TEXT,"
      " phases TEXT,"
      " created_at TEXT NOT NULL,"
      " updated_at TEXT NOT NULL,"
      " completed_at TEXT);",
      "CREATE TABLE IF NOT EXISTS commits ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " stream_id TEXT NOT NULL REFERENCES streams(id) ON DELETE CASCADE,"
      " commit_hash TEXT NOT NULL UNIQUE,"
      " message TEXT NOT NULL,"
      " author TEXT NOT NULL DEFAULT '',"
      " files_changed INTEGER NOT NULL DEFAULT 0 CHECK (files_changed >= 0),"
      " timestamp TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_history ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " stream_id TEXT NOT NULL REFERENCES streams(id) ON DELETE CASCADE,"
      " event_type TEXT NOT NULL CHECK (event_type IN ('created','status_changed','progress_updated','completed','archived')),"
      " old_value TEXT,"
      " new_value TEXT,"
      " timestamp TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS summary_jobs ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " stream_id TEXT NOT NULL,"
      " stream_title TEXT NOT NULL,"
      " stream_branch TEXT NOT NULL,"
      " stream_category TEXT NOT NULL,"
      " worktree_path TEXT NOT NULL DEFAULT '',"
      " stream_created_at TEXT NOT NULL DEFAULT '',"
      " stream_completed_at TEXT NOT NULL DEFAULT '',"
      " user_summary TEXT NOT NULL DEFAULT '',"
      " archive_path TEXT NOT NULL,"
      " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','running','done','failed')),"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 3,"
      " error_message TEXT,"
      " created_at TEXT NOT NULL,"
      " started_at TEXT,"
      " completed_at TEXT);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_streams_status ON streams(status);",
      "CREATE INDEX IF NOT EXISTS idx_streams_category ON streams(category);",
      "CREATE INDEX IF NOT EXISTS idx_streams_priority ON streams(priority);",
      "CREATE INDEX IF NOT EXISTS idx_streams_updated_at ON streams(updated_at);",
      "CREATE INDEX IF NOT EXISTS idx_commits_stream_timestamp ON commits(stream_id, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_commits_timestamp ON commits(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_history_stream ON stream_history(stream_id, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_summary_jobs_status ON summary_jobs(status, created_at);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at) VALUES (" + std::to_string(kSchemaVersion) +
          ", strftime('%Y-%m-%dT%H:%M:%fZ','now'));"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,status,progress,phases,completed_at FROM streams LIMIT 1;");
  sqlite_db->Exec("SELECT stream_id,commit_hash,files_changed FROM commits LIMIT 1;");
  sqlite_db->Exec("SELECT stream_id,event_type,old_value,new_value FROM stream_history LIMIT 1;");
  sqlite_db->Exec("SELECT status,attempts,max_attempts FROM summary_jobs LIMIT 1;");
}

} // namespace workstream::db::sqlite
