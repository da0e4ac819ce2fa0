#pragma once

#include "sqlite_db.hpp"

namespace trailmap::db::sqlite {

// Creates tables and indexes if missing. Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace trailmap::db::sqlite
