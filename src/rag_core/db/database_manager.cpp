#include "rag_core/db/database_manager.hpp"

#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  try {
    // One-time schema setup before creating the pool
    setup_schema();
    pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("open " + db_path_.string(), e);
  }
  is_open_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_open_) {
    return;
  }
  pool_->shutdown();
  is_open_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_open_) {
    throw RepositoryError("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_open_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Single-use connection; table creation is not a pooled operation
  sqlite::database db(db_path_.string());
  ConnectionPool::configure_connection(db);

  db << R"(
      CREATE TABLE IF NOT EXISTS artifacts (
          key TEXT PRIMARY KEY,
          content TEXT NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

  // Exactly one row may carry is_active = 1
  db << R"(
      CREATE TABLE IF NOT EXISTS corpus_versions (
          version TEXT PRIMARY KEY,
          manifest TEXT NOT NULL,
          created_at TEXT NOT NULL,
          is_active INTEGER NOT NULL DEFAULT 0
      )
    )";
  db << R"(
      CREATE UNIQUE INDEX IF NOT EXISTS idx_corpus_versions_active
      ON corpus_versions(is_active) WHERE is_active = 1
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS publish_lock (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          owner TEXT NOT NULL,
          acquired_at INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS index_runs (
          run_id TEXT PRIMARY KEY,
          started_at TEXT NOT NULL,
          finished_at TEXT NOT NULL,
          version TEXT,
          status TEXT NOT NULL,
          summary TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_index_runs_finished
      ON index_runs(finished_at)
    )";
}

}  // namespace rag_core
