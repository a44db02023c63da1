#include "rag_core/db/connection_pool.hpp"

#include "rag_core/errors.hpp"

namespace rag_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw ConfigurationError("storage.pool_size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    configure_connection(*db);
    pool_.push(std::move(db));
  }
}

void ConnectionPool::configure_connection(sqlite::database& db) {
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA busy_timeout = 5000;";
  // journal_mode returns the resulting mode as a row
  db << "PRAGMA journal_mode = WAL;" >> [](std::string) {};
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw RepositoryError("Connection pool is shut down");
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
  // Notify one waiting thread that a connection is available
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

}  // namespace rag_core
