#pragma once

#include "rag_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace rag_core {

/**
 * @class DatabaseManager
 * @brief Owns the corpus database: schema setup and the connection pool.
 *
 * One instance per database file. Repositories hold a shared_ptr to the
 * manager they were built with; there is no process-wide instance.
 */
class DatabaseManager {
public:
    // Creates the parent directory and schema, then opens the pool
    DatabaseManager(const std::filesystem::path& db_path, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_open() const { return is_open_; }

    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_open_ = false;
};

} // namespace rag_core
