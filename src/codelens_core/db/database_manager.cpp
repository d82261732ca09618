#include "codelens_core/db/database_manager.hpp"

#include <stdexcept>

namespace codelens_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a single non-pooled connection
  setup_schema(db_path);

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);
  db_path_ = db_path;
  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  // seq doubles as the vector index label, so it must survive upserts of the same id
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          seq INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          file_path TEXT NOT NULL,
          name TEXT NOT NULL,
          kind TEXT NOT NULL,
          content BLOB,
          loc INTEGER NOT NULL,
          complexity INTEGER NOT NULL,
          dependencies TEXT,
          vector_blob BLOB NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_file_path
      ON chunks(file_path)
    )";
}

}  // namespace codelens_core
