#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace linecheck::db::postgres {

PgTransaction::PgTransaction(PgPool& pool) : lease_(pool.Acquire()), work_(std::make_unique<pqxx::work>(lease_.Connection())) {
}

PgTransaction::~PgTransaction() {
  if (IsOpen()) {
    try {
      work_->abort();
    } catch (const std::exception& ex) {
      LINECHECK_LOG_ERROR("postgres rollback failed", {observability::StringField("error", ex.what())});
    }
  }
  // the work must close before the lease hands the connection back
  work_.reset();
}

} // namespace linecheck::db::postgres
