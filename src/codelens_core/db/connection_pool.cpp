#include "codelens_core/db/connection_pool.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace codelens_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size, int busy_timeout_ms)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    sqlite3* handle = db->connection().get();
    if (!handle) {
      throw std::runtime_error("Failed to get native handle for connection in pool.");
    }

    // Writers serialize through BEGIN IMMEDIATE; readers wait instead of failing with SQLITE_BUSY
    if (sqlite3_busy_timeout(handle, busy_timeout_ms) != SQLITE_OK) {
      throw std::runtime_error("Failed to set busy timeout for connection in pool: " +
                               std::string(sqlite3_errmsg(handle)));
    }

    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA synchronous = NORMAL;";

    pool_.push(std::move(db));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace codelens_core
