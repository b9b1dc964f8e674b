#pragma once

#include "sqlite_db.hpp"

namespace linecheck::db::sqlite {

// Creates the jobs/scans/hour_buckets/shift_stats tables when absent.
void BootstrapSchema(SqliteDB& db);

} // namespace linecheck::db::sqlite
