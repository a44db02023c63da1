#pragma once

#include <memory>

#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

class DatabaseManager;

/**
 * @class SqliteCorpusRepository
 * @brief CorpusRepository backed by the corpus SQLite database.
 *
 * Activation, lock acquisition and lock takeover each run inside a
 * BEGIN IMMEDIATE transaction, so concurrent processes sharing the database
 * file serialize on them.
 */
class SqliteCorpusRepository : public CorpusRepository {
 public:
  explicit SqliteCorpusRepository(std::shared_ptr<DatabaseManager> db_manager);

  void put_artifact(const std::string& key, const std::string& content) override;
  std::optional<std::string> get_artifact(const std::string& key) const override;
  std::vector<std::string> list_artifacts(const std::string& prefix) const override;
  size_t delete_artifacts(const std::string& prefix) override;

  void activate(const CorpusManifest& manifest) override;
  std::optional<CorpusManifest> active_manifest() const override;

  std::unique_ptr<PublishLock> acquire_publish_lock(const std::string& owner,
                                                    std::chrono::minutes stale_after) override;

  void record_run(const RunRecord& run) override;
  std::vector<RunRecord> recent_runs(size_t limit) const override;

 private:
  std::shared_ptr<DatabaseManager> db_manager_;
};

}  // namespace rag_core
