#pragma once

#include "codelens_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace codelens_core {

// Owns the chunk database schema and the connection pool for one storage location.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the parent directory and schema, then opens the pool
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace codelens_core
