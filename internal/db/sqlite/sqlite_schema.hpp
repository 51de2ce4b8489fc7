#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace forecast::db::sqlite {

// Creates or upgrades the forecast-sync schema.
void BootstrapSchema(SqliteDB& db);

} // namespace forecast::db::sqlite
