#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace codelens_core {

// Immediate takes the write lock up front, so concurrent writers queue on the busy
// timeout instead of failing at COMMIT.
enum class TransactionMode { Deferred, Immediate };

// Scoped transaction; rolls back on destruction unless committed.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Immediate)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_)
      return;
    db_ << "COMMIT;";
    open_ = false;
  }

  void rollback() {
    if (!open_)
      return;
    open_ = false;
    db_ << "ROLLBACK;";
  }

  ~Transaction() noexcept {
    if (!open_)
      return;
    try {
      rollback();
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: [Transaction] rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace codelens_core
