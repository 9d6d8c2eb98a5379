#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace workstream::db::sqlite {

inline constexpr int kSchemaVersion = 1;

// Creates tables and indexes if missing and records the schema version.
void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db);

} // namespace workstream::db::sqlite
