#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace linecheck::db::memory {

/*
  Works on the committed state in place, holding the repository mutex
  until Commit() or Rollback(); do not open a second transaction on the
  same thread while this one is open.

  Each write first records how to undo itself. Commit drops the journal;
  rollback, or destruction while open, replays it newest first.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  // Callers record the undo before mutating.
  MemoryRepository::State& Mutable(Undo undo) {
    journal_.push_back(std::move(undo));
    return repo_.committed_;
  }
  const MemoryRepository::State& View() const {
    return repo_.committed_;
  }

 protected:
  void CommitWrites() override;
  void DiscardWrites() override;

 private:
  void Unwind() noexcept;

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> hold_;
  std::vector<Undo>            journal_;
};

} // namespace linecheck::db::memory
