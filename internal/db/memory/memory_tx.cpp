#include "memory_tx.hpp"

namespace linecheck::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), hold_(repo_.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (IsOpen()) {
    Unwind();
  }
}

void MemoryTransaction::CommitWrites() {
  journal_.clear();
  hold_.unlock();
}

void MemoryTransaction::DiscardWrites() {
  Unwind();
  hold_.unlock();
}

void MemoryTransaction::Unwind() noexcept {
  for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
    (*it)(repo_.committed_);
  }
  journal_.clear();
}

} // namespace linecheck::db::memory
