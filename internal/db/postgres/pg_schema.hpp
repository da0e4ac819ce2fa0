#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace trailmap::db::postgres {

// Creates tables and indexes if missing. Safe to run on every start.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace trailmap::db::postgres
