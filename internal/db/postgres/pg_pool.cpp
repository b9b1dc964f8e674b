#include "pg_pool.hpp"

#include <exception>
#include <utility>

namespace linecheck::db::postgres {

PgPool::Lease::Lease(PgPool* pool, std::unique_ptr<pqxx::connection> conn) : pool_(pool), conn_(std::move(conn)) {
}

PgPool::Lease::Lease(Lease&& other) noexcept : pool_(std::exchange(other.pool_, nullptr)), conn_(std::move(other.conn_)) {
}

PgPool::Lease::~Lease() {
  if (pool_) {
    pool_->Return(std::move(conn_));
  }
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), capacity_(max_connections == 0 ? 1 : max_connections) {
}

PgPool::Lease PgPool::Acquire() {
  std::unique_ptr<pqxx::connection> conn;
  {
    std::unique_lock lock(mutex_);
    returned_.wait(lock, [this] { return leased_ < capacity_; });
    ++leased_;
    while (!idle_.empty() && !conn) {
      conn = std::move(idle_.back());
      idle_.pop_back();
      if (!conn->is_open()) {
        conn.reset();
      }
    }
  }

  if (!conn) {
    try {
      conn = std::make_unique<pqxx::connection>(conninfo_);
    } catch (const std::exception&) {
      Return(nullptr);
      throw;
    }
  }
  return Lease(this, std::move(conn));
}

void PgPool::Return(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    --leased_;
    if (conn && conn->is_open()) {
      idle_.push_back(std::move(conn));
    }
  }
  returned_.notify_one();
}

} // namespace linecheck::db::postgres
