#pragma once

#include "pg_pool.hpp"

namespace forecast::db::postgres {

// Creates or upgrades the forecast-sync schema.
void BootstrapSchema(PgPool& pool);

} // namespace forecast::db::postgres
