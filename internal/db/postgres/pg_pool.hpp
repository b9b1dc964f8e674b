#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace linecheck::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A connection serves one transaction at a time. Acquire() blocks while
  every connection is leased; connections found closed are replaced on
  the next Acquire(). The pool must outlive its leases.
*/
class PgPool {
 public:
  // Move-only handle; returns the connection to the pool when destroyed.
  class Lease {
   public:
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&)       = delete;
    ~Lease();

    pqxx::connection& Connection() {
      return *conn_;
    }

   private:
    friend class PgPool;
    Lease(PgPool* pool, std::unique_ptr<pqxx::connection> conn);

    PgPool*                           pool_;
    std::unique_ptr<pqxx::connection> conn_;
  };

  PgPool(std::string conninfo, std::size_t max_connections);

  PgPool(const PgPool&)            = delete;
  PgPool& operator=(const PgPool&) = delete;

  Lease Acquire();

 private:
  void Return(std::unique_ptr<pqxx::connection> conn);

  const std::string conninfo_;
  const std::size_t capacity_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    leased_ = 0;
};

} // namespace linecheck::db::postgres
