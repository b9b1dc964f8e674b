#pragma once

#include "pg_pool.hpp"

namespace linecheck::db::postgres {

// Creates the jobs/scans/hour_buckets/shift_stats tables when absent.
void BootstrapSchema(PgPool& pool);

} // namespace linecheck::db::postgres
