#pragma once

#include "sqlite_db.hpp"

namespace vaultsync::db::sqlite {

// Creates the sync tables if missing and records the schema version.
void BootstrapSchema(SqliteDB& db);

} // namespace vaultsync::db::sqlite
