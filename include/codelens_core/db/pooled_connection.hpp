#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <iostream>
#include <memory>
#include <stdexcept>

#include "codelens_core/db/database_manager.hpp"

namespace codelens_core {

// Scoped borrow of a chunk database connection. A connection is never handed back
// with a transaction still open, so the next borrower starts in autocommit mode.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("Failed to acquire chunk database connection: pool is shut down");
    }
  }

  ~PooledConnection() { release(); }

  // Returns the connection early; the guard is unusable afterwards
  void release() noexcept {
    if (!conn_) {
      return;
    }
    if (in_transaction()) {
      std::cerr << "Warning: [ChunkStore] connection returned inside a transaction; rolling back"
                << std::endl;
      try {
        *conn_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception& e) {
        std::cerr << "Warning: [ChunkStore] rollback on release failed: " << e.what()
                  << std::endl;
      }
    }
    manager_.return_connection(std::move(conn_));
  }

  bool in_transaction() const {
    return conn_ && sqlite3_get_autocommit(conn_->connection().get()) == 0;
  }

  sqlite::database* operator->() const { return require(); }
  sqlite::database& operator*() const { return *require(); }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

 private:
  sqlite::database* require() const {
    if (!conn_) {
      throw std::logic_error("PooledConnection used after release");
    }
    return conn_.get();
  }

  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace codelens_core
