#include "rag_core/storage/repository_factory.hpp"

#include <iostream>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/storage/in_memory_corpus_repository.hpp"
#include "rag_core/storage/sqlite_corpus_repository.hpp"

namespace rag_core {

std::string to_string(StorageBackend backend) {
  switch (backend) {
    case StorageBackend::Memory:
      return "memory";
    default:
      return "sqlite";
  }
}

StorageBackend storage_backend_from_string(const std::string& str) {
  if (str == "sqlite")
    return StorageBackend::Sqlite;
  if (str == "memory")
    return StorageBackend::Memory;
  throw ConfigurationError("Unknown storage backend '" + str + "'. Expected 'sqlite' or 'memory'.");
}

std::shared_ptr<CorpusRepository> make_corpus_repository(const StorageOptions& options) {
  switch (options.backend) {
    case StorageBackend::Memory:
      std::cout << "Using in-memory corpus repository; nothing will be persisted." << std::endl;
      return std::make_shared<InMemoryCorpusRepository>();
    case StorageBackend::Sqlite:
    default: {
      if (options.db_path.empty()) {
        throw ConfigurationError("storage.db_path cannot be empty for the sqlite backend");
      }
      auto db_manager = std::make_shared<DatabaseManager>(options.db_path, options.pool_size);
      return std::make_shared<SqliteCorpusRepository>(db_manager);
    }
  }
}

}  // namespace rag_core
