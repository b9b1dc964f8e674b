#pragma once

#include <stdexcept>
#include <string>

namespace linecheck::db {

/*
  One unit of work against the line's store.

  A scan touches the job counters, the scan ledger, an hour bucket and
  the shift row; all of them become visible together on Commit() or not
  at all. A transaction finishes exactly once: Commit() or Rollback(),
  and a failed Commit() also finishes it. Backends roll back in their
  destructor when the transaction is still open.

    memory    in place under the repository mutex, with an undo journal
    sqlite    BEGIN IMMEDIATE on the shared connection
    postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit() {
    Finish("commit");
    CommitWrites();
  }

  void Rollback() {
    Finish("rollback");
    DiscardWrites();
  }

  bool IsOpen() const {
    return open_;
  }

 protected:
  Transaction() = default;

  virtual void CommitWrites()  = 0;
  virtual void DiscardWrites() = 0;

 private:
  void Finish(const char* op) {
    if (!open_) {
      throw std::logic_error(std::string("cannot ") + op + ": transaction already finished");
    }
    open_ = false;
  }

  bool open_ = true;
};

} // namespace linecheck::db
