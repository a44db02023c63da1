#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

enum class StorageBackend { Sqlite, Memory };

std::string to_string(StorageBackend backend);
// Accepts "sqlite" and "memory"; throws ConfigurationError otherwise
StorageBackend storage_backend_from_string(const std::string& str);

struct StorageOptions {
  StorageBackend backend = StorageBackend::Sqlite;
  std::string db_path = "./data/corpus.db";
  int pool_size = 4;
  std::chrono::minutes stale_lock_after{60};
};

// Builds the repository the options select. The SQLite backend owns its
// DatabaseManager through the returned repository.
std::shared_ptr<CorpusRepository> make_corpus_repository(const StorageOptions& options);

}  // namespace rag_core
