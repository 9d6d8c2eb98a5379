#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/db/api/db_error.hpp"

namespace workstream::db::sqlite {

using workstream::db::ErrorCode;
using workstream::db::Result;
namespace wm = workstream::model;

namespace {

// Finalizes on scope exit.
struct Stmt {
    sqlite3_stmt* st = nullptr;

    Stmt() = default;
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
    ~Stmt() {
        if (st) sqlite3_finalize(st);
    }
};

bool PrepareStmt(sqlite3* db, const std::string& sql, Stmt& stmt) {
    return sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) == SQLITE_OK;
}

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindOptI32(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
    if (v) {
        BindI32(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static std::optional<int> ColOptI32(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI32(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static std::string ToText(std::string_view v) {
    return std::string(v);
}

// ------------------------------------------------------------------
// Phases are kept as a JSON array of strings
// ------------------------------------------------------------------

static std::optional<std::string> EncodePhases(const std::vector<std::string>& phases) {
    if (phases.empty()) return std::nullopt;

    google::protobuf::ListValue list;
    for (const auto& phase : phases) {
        list.add_values()->set_string_value(phase);
    }

    std::string json;
    if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) return std::nullopt;
    return json;
}

static std::vector<std::string> DecodePhases(const std::optional<std::string>& json) {
    std::vector<std::string> phases;
    if (!json || json->empty()) return phases;

    google::protobuf::ListValue list;
    if (!google::protobuf::util::JsonStringToMessage(*json, &list).ok()) return phases;

    for (const auto& value : list.values()) {
        if (value.kind_case() == google::protobuf::Value::kStringValue) {
            phases.push_back(value.string_value());
        }
    }
    return phases;
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

static const char* kStreamColumns =
    "s.id,s.stream_number,s.title,s.category,s.priority,s.status,s.progress,s.current_phase,"
    "s.worktree_path,s.branch,s.blocked_by,s.phases,s.created_at,s.updated_at,s.completed_at";
static constexpr int kStreamColumnCount = 15;

static model::StreamRecord ReadStreamRow(sqlite3_stmt* st) {
    model::StreamRecord r;
    r.id            = ColText(st, 0);
    r.stream_number = ColText(st, 1);
    r.title         = ColText(st, 2);
    r.category      = wm::ParseStreamCategory(ColText(st, 3)).value_or(wm::StreamCategory::kBackend);
    r.priority      = wm::ParseStreamPriority(ColText(st, 4)).value_or(wm::StreamPriority::kMedium);
    r.status        = wm::ParseStreamStatus(ColText(st, 5)).value_or(wm::StreamStatus::kInitializing);
    r.progress      = ColI32(st, 6);
    r.current_phase = ColOptI32(st, 7);
    r.worktree_path = ColText(st, 8);
    r.branch        = ColText(st, 9);
    r.blocked_by    = ColOptText(st, 10);
    r.phases        = DecodePhases(ColOptText(st, 11));
    r.created_at    = ColText(st, 12);
    r.updated_at    = ColText(st, 13);
    r.completed_at  = ColOptText(st, 14);
    return r;
}

static const char* kCommitColumns = "id,stream_id,commit_hash,message,author,files_changed,timestamp";

static model::CommitRecord ReadCommitRow(sqlite3_stmt* st) {
    model::CommitRecord r;
    r.id            = ColI64(st, 0);
    r.stream_id     = ColText(st, 1);
    r.commit_hash   = ColText(st, 2);
    r.message       = ColText(st, 3);
    r.author        = ColText(st, 4);
    r.files_changed = ColI32(st, 5);
    r.timestamp     = ColText(st, 6);
    return r;
}

static model::HistoryRecord ReadHistoryRow(sqlite3_stmt* st) {
    model::HistoryRecord r;
    r.id         = ColI64(st, 0);
    r.stream_id  = ColText(st, 1);
    r.event_type = wm::ParseHistoryEventType(ColText(st, 2)).value_or(wm::HistoryEventType::kStatusChanged);
    r.old_value  = ColOptText(st, 3);
    r.new_value  = ColOptText(st, 4);
    r.timestamp  = ColText(st, 5);
    return r;
}

static const char* kSummaryJobColumns =
    "id,stream_id,stream_title,stream_branch,stream_category,worktree_path,stream_created_at,stream_completed_at,"
    "user_summary,archive_path,status,attempts,max_attempts,error_message,created_at,started_at,completed_at";

static model::SummaryJobRecord ReadSummaryJobRow(sqlite3_stmt* st) {
    model::SummaryJobRecord r;
    r.id                  = ColI64(st, 0);
    r.stream_id           = ColText(st, 1);
    r.stream_title        = ColText(st, 2);
    r.stream_branch       = ColText(st, 3);
    r.stream_category     = ColText(st, 4);
    r.worktree_path       = ColText(st, 5);
    r.stream_created_at   = ColText(st, 6);
    r.stream_completed_at = ColText(st, 7);
    r.user_summary        = ColText(st, 8);
    r.archive_path        = ColText(st, 9);
    r.status              = wm::ParseSummaryJobStatus(ColText(st, 10)).value_or(wm::SummaryJobStatus::kPending);
    r.attempts            = ColI32(st, 11);
    r.max_attempts        = ColI32(st, 12);
    r.error_message       = ColOptText(st, 13);
    r.created_at          = ColText(st, 14);
    r.started_at          = ColOptText(st, 15);
    r.completed_at        = ColOptText(st, 16);
    return r;
}

// ------------------------------------------------------------------

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    // extended result codes are enabled on the connection
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::kBusy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::kDuplicate, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::kConstraint, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::kStorage, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    }
}

// Raises for any prepare or step code other than OK/ROW/DONE.
void SqliteRepository::CheckRead(sqlite3* db, int rc, const std::string& context) {
    db::ThrowIfDbError(Translate(db, rc), context);
}

// Runs a single-row mutation and reports NotFound when nothing matched.
static Result StepExpectingRow(sqlite3* db, sqlite3_stmt* st, const std::string& id, Result (*translate)(sqlite3*, int)) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) return translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::kNotFound, "stream not found: " + id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result SqliteRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO streams(id,stream_number,title,category,priority,status,progress,current_phase,"
        "worktree_path,branch,blocked_by,phases,created_at,updated_at,completed_at) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    BindText(st, 1, r.id);
    BindText(st, 2, r.stream_number);
    BindText(st, 3, r.title);
    BindText(st, 4, ToText(wm::ToString(r.category)));
    BindText(st, 5, ToText(wm::ToString(r.priority)));
    BindText(st, 6, ToText(wm::ToString(r.status)));
    BindI32(st, 7, r.progress);
    BindOptI32(st, 8, r.current_phase);
    BindText(st, 9, r.worktree_path);
    BindText(st, 10, r.branch);
    BindOptText(st, 11, r.blocked_by);
    BindOptText(st, 12, EncodePhases(r.phases));
    BindText(st, 13, r.created_at);
    BindText(st, 14, r.updated_at);
    BindOptText(st, 15, r.completed_at);

    return Translate(db, sqlite3_step(st));
}

std::optional<model::StreamRecord>
SqliteRepository::GetStream(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kStreamColumns + " FROM streams s WHERE s.id=?;";

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "read stream " + id);

    BindText(stmt.st, 1, id);
    const int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_ROW) return ReadStreamRow(stmt.st);

    CheckRead(db, rc, "read stream " + id);
    return std::nullopt;
}

std::vector<model::StreamListRow>
SqliteRepository::ListStreams(Transaction& t, const model::StreamFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kStreamColumns +
        ",c.message,c.files_changed,c.timestamp,c.author FROM streams s "
        "LEFT JOIN (SELECT stream_id,message,files_changed,timestamp,author,"
        "ROW_NUMBER() OVER (PARTITION BY stream_id ORDER BY timestamp DESC, id DESC) AS rn FROM commits) c "
        "ON c.stream_id = s.id AND c.rn = 1 "
        "WHERE s.id != 'main'";

    std::vector<std::string> binds;
    if (filter.status) {
        sql += " AND s.status=?";
        binds.push_back(ToText(wm::ToString(*filter.status)));
    }
    if (filter.category) {
        sql += " AND s.category=?";
        binds.push_back(ToText(wm::ToString(*filter.category)));
    }
    if (filter.priority) {
        sql += " AND s.priority=?";
        binds.push_back(ToText(wm::ToString(*filter.priority)));
    }
    sql += " ORDER BY s.updated_at DESC, s.id ASC;";

    std::vector<model::StreamListRow> out;

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "list streams");
    for (std::size_t i = 0; i < binds.size(); ++i) {
        BindText(stmt.st, static_cast<int>(i + 1), binds[i]);
    }

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        model::StreamListRow row;
        row.stream = ReadStreamRow(stmt.st);
        if (sqlite3_column_type(stmt.st, kStreamColumnCount) != SQLITE_NULL) {
            model::RecentActivityRecord activity;
            activity.message       = ColText(stmt.st, kStreamColumnCount);
            activity.files_changed = ColI32(stmt.st, kStreamColumnCount + 1);
            activity.timestamp     = ColText(stmt.st, kStreamColumnCount + 2);
            activity.author        = ColText(stmt.st, kStreamColumnCount + 3);
            row.recent_activity    = std::move(activity);
        }
        out.push_back(std::move(row));
    }
    CheckRead(db, rc, "list streams");
    return out;
}

Result SqliteRepository::UpdateStream(Transaction& t, const std::string& id, const model::StreamUpdate& update,
                                      const std::string& updated_at) {
    if (update.Empty()) return Result::Ok();

    auto* db = TX(t).Handle();

    std::string sql = "UPDATE streams SET ";
    if (update.status) {
        sql += "status=?4,";
        if (*update.status == wm::StreamStatus::kCompleted) {
            sql += "completed_at=CASE WHEN status='completed' AND completed_at IS NOT NULL THEN completed_at ELSE ?5 END,";
        } else if (!wm::IsTerminal(*update.status)) {
            // reopening a stream drops its completion stamp
            sql += "completed_at=NULL,";
        }
    }
    if (update.progress) sql += "progress=?1,";
    if (update.current_phase) sql += "current_phase=?2,";
    if (update.blocked_by) sql += "blocked_by=?3,";
    sql += "updated_at=?5 WHERE id=?6;";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    if (update.progress) BindI32(st, 1, *update.progress);
    if (update.current_phase) BindI32(st, 2, *update.current_phase);
    if (update.blocked_by) {
        BindOptText(st, 3, update.blocked_by->empty() ? std::nullopt : update.blocked_by);
    }
    if (update.status) BindText(st, 4, ToText(wm::ToString(*update.status)));
    BindText(st, 5, updated_at);
    BindText(st, 6, id);

    return StepExpectingRow(db, st, id, &SqliteRepository::Translate);
}

Result SqliteRepository::CompleteStream(Transaction& t, const std::string& id, const std::string& now) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE streams SET status='completed',"
        "completed_at=CASE WHEN status='completed' AND completed_at IS NOT NULL THEN completed_at ELSE ?1 END,"
        "updated_at=?1 WHERE id=?2;";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    BindText(stmt.st, 1, now);
    BindText(stmt.st, 2, id);

    return StepExpectingRow(db, stmt.st, id, &SqliteRepository::Translate);
}

Result SqliteRepository::TouchStream(Transaction& t, const std::string& id, const std::string& now) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!PrepareStmt(db, "UPDATE streams SET updated_at=? WHERE id=?;", stmt))
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    BindText(stmt.st, 1, now);
    BindText(stmt.st, 2, id);

    return StepExpectingRow(db, stmt.st, id, &SqliteRepository::Translate);
}

Result SqliteRepository::DeleteStream(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    static const char* kChildTables[] = {
        "DELETE FROM commits WHERE stream_id=?;",
        "DELETE FROM stream_history WHERE stream_id=?;",
    };

    for (const char* sql : kChildTables) {
        Stmt stmt;
        if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
        BindText(stmt.st, 1, id);
        auto res = Translate(db, sqlite3_step(stmt.st));
        if (!res) return res;
    }

    Stmt stmt;
    if (!PrepareStmt(db, "DELETE FROM streams WHERE id=?;", stmt))
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    BindText(stmt.st, 1, id);

    return StepExpectingRow(db, stmt.st, id, &SqliteRepository::Translate);
}

// ------------------------------------------------------------------
// Commits
// ------------------------------------------------------------------

Result SqliteRepository::InsertCommit(Transaction& t, const model::CommitRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO commits(stream_id,commit_hash,message,author,files_changed,timestamp) VALUES(?,?,?,?,?,?);";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    BindText(st, 1, r.stream_id);
    BindText(st, 2, r.commit_hash);
    BindText(st, 3, r.message);
    BindText(st, 4, r.author);
    BindI32(st, 5, r.files_changed);
    BindText(st, 6, r.timestamp);

    return Translate(db, sqlite3_step(st));
}

std::vector<model::CommitRecord>
SqliteRepository::ListCommits(Transaction& t, const std::optional<std::string>& stream_id, int limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kCommitColumns + " FROM commits";
    if (stream_id) sql += " WHERE stream_id=?2";
    sql += " ORDER BY timestamp DESC, id DESC LIMIT ?1;";

    std::vector<model::CommitRecord> out;

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "list commits");
    BindI32(stmt.st, 1, limit);
    if (stream_id) BindText(stmt.st, 2, *stream_id);

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadCommitRow(stmt.st));
    }
    CheckRead(db, rc, "list commits");
    return out;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::InsertHistory(Transaction& t, const model::HistoryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO stream_history(stream_id,event_type,old_value,new_value,timestamp) VALUES(?,?,?,?,?);";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    BindText(st, 1, r.stream_id);
    BindText(st, 2, ToText(wm::ToString(r.event_type)));
    BindOptText(st, 3, r.old_value);
    BindOptText(st, 4, r.new_value);
    BindText(st, 5, r.timestamp);

    return Translate(db, sqlite3_step(st));
}

std::vector<model::HistoryRecord>
SqliteRepository::ListHistory(Transaction& t, const std::string& stream_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,stream_id,event_type,old_value,new_value,timestamp FROM stream_history "
        "WHERE stream_id=? ORDER BY timestamp DESC, id DESC;";

    std::vector<model::HistoryRecord> out;

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr), "list history for " + stream_id);
    BindText(stmt.st, 1, stream_id);

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadHistoryRow(stmt.st));
    }
    CheckRead(db, rc, "list history for " + stream_id);
    return out;
}

// ------------------------------------------------------------------
// Stats
// ------------------------------------------------------------------

model::QuickStats SqliteRepository::GetStats(Transaction& t, const std::string& day_start) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT "
        "(SELECT COUNT(*) FROM streams WHERE id!='main' AND status NOT IN ('completed','archived')),"
        "(SELECT COUNT(*) FROM streams WHERE id!='main' AND status='active'),"
        "(SELECT COUNT(*) FROM streams WHERE id!='main' AND status='blocked'),"
        "(SELECT COUNT(*) FROM streams WHERE id!='main' AND status='paused'),"
        "(SELECT COUNT(*) FROM streams WHERE id!='main' AND status='completed' AND completed_at >= ?1),"
        "(SELECT COUNT(*) FROM commits),"
        "(SELECT COUNT(*) FROM commits WHERE timestamp >= ?1);";

    model::QuickStats stats;

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr), "read stats");
    BindText(stmt.st, 1, day_start);

    const int rc = sqlite3_step(stmt.st);
    CheckRead(db, rc, "read stats");
    if (rc == SQLITE_ROW) {
        stats.active_streams  = ColI32(stmt.st, 0);
        stats.in_progress     = ColI32(stmt.st, 1);
        stats.blocked         = ColI32(stmt.st, 2);
        stats.paused          = ColI32(stmt.st, 3);
        stats.completed_today = ColI32(stmt.st, 4);
        stats.total_commits   = ColI32(stmt.st, 5);
        stats.commits_today   = ColI32(stmt.st, 6);
    }
    return stats;
}

// ------------------------------------------------------------------
// Summary jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertSummaryJob(Transaction& t, model::SummaryJobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO summary_jobs(stream_id,stream_title,stream_branch,stream_category,worktree_path,"
        "stream_created_at,stream_completed_at,user_summary,archive_path,status,attempts,max_attempts,"
        "error_message,created_at,started_at,completed_at) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    BindText(st, 1, r.stream_id);
    BindText(st, 2, r.stream_title);
    BindText(st, 3, r.stream_branch);
    BindText(st, 4, r.stream_category);
    BindText(st, 5, r.worktree_path);
    BindText(st, 6, r.stream_created_at);
    BindText(st, 7, r.stream_completed_at);
    BindText(st, 8, r.user_summary);
    BindText(st, 9, r.archive_path);
    BindText(st, 10, ToText(wm::ToString(r.status)));
    BindI32(st, 11, r.attempts);
    BindI32(st, 12, r.max_attempts);
    BindOptText(st, 13, r.error_message);
    BindText(st, 14, r.created_at);
    BindOptText(st, 15, r.started_at);
    BindOptText(st, 16, r.completed_at);

    auto res = Translate(db, sqlite3_step(st));
    if (res) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return res;
}

std::optional<model::SummaryJobRecord>
SqliteRepository::GetSummaryJob(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSummaryJobColumns + " FROM summary_jobs WHERE id=?;";

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "read summary job");
    BindI64(stmt.st, 1, id);

    const int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_ROW) return ReadSummaryJobRow(stmt.st);

    CheckRead(db, rc, "read summary job " + std::to_string(id));
    return std::nullopt;
}

std::optional<model::SummaryJobRecord>
SqliteRepository::NextPendingSummaryJob(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSummaryJobColumns +
        " FROM summary_jobs WHERE status='pending' AND attempts < max_attempts "
        "ORDER BY created_at ASC, id ASC LIMIT 1;";

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "read pending summary job");

    const int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_ROW) return ReadSummaryJobRow(stmt.st);

    CheckRead(db, rc, "read pending summary job");
    return std::nullopt;
}

Result SqliteRepository::UpdateSummaryJob(Transaction& t, const model::SummaryJobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE summary_jobs SET status=?,attempts=?,error_message=?,started_at=?,completed_at=? WHERE id=?;";

    Stmt stmt;
    if (!PrepareStmt(db, sql, stmt)) return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    auto* st = stmt.st;

    BindText(st, 1, ToText(wm::ToString(r.status)));
    BindI32(st, 2, r.attempts);
    BindOptText(st, 3, r.error_message);
    BindOptText(st, 4, r.started_at);
    BindOptText(st, 5, r.completed_at);
    BindI64(st, 6, r.id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::kNotFound, "summary job not found: " + std::to_string(r.id));
    return Result::Ok();
}

std::vector<model::SummaryJobRecord>
SqliteRepository::ListSummaryJobs(Transaction& t, const std::optional<wm::SummaryJobStatus>& status) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kSummaryJobColumns + " FROM summary_jobs";
    if (status) sql += " WHERE status=?";
    sql += " ORDER BY created_at ASC, id ASC;";

    std::vector<model::SummaryJobRecord> out;

    Stmt stmt;
    CheckRead(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr), "list summary jobs");
    if (status) BindText(stmt.st, 1, ToText(wm::ToString(*status)));

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadSummaryJobRow(stmt.st));
    }
    CheckRead(db, rc, "list summary jobs");
    return out;
}

} // namespace workstream::db::sqlite
