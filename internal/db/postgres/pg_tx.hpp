#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace linecheck::db::postgres {

/*
  pqxx::work on a connection leased from the pool for the transaction's
  lifetime. After any failed statement Postgres refuses further
  statements until the work is aborted.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(PgPool& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

 protected:
  void CommitWrites() override {
    work_->commit();
  }
  void DiscardWrites() override {
    work_->abort();
  }

 private:
  PgPool::Lease               lease_;
  std::unique_ptr<pqxx::work> work_;
};

} // namespace linecheck::db::postgres
