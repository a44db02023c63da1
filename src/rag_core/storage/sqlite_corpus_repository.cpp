#include "rag_core/storage/sqlite_corpus_repository.hpp"

#include <cstdint>
#include <iostream>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/util/time_format.hpp"

namespace rag_core {

namespace {

int64_t epoch_seconds_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class SqlitePublishLock : public PublishLock {
 public:
  SqlitePublishLock(std::shared_ptr<DatabaseManager> db_manager, std::string owner)
      : db_manager_(std::move(db_manager)), owner_(std::move(owner)) {}

  ~SqlitePublishLock() override {
    try {
      PooledConnection conn(*db_manager_);
      *conn << "DELETE FROM publish_lock WHERE id = 1 AND owner = ?" << owner_;
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[SqliteCorpusRepository] "
                << describe_db_failure("release publish lock for " + owner_, e) << std::endl;
    } catch (const std::exception& e) {
      std::cerr << "[SqliteCorpusRepository] Could not release publish lock for " << owner_
                << ": " << e.what() << std::endl;
    } catch (...) {
      std::cerr << "[SqliteCorpusRepository] Could not release publish lock for " << owner_
                << ": unknown error" << std::endl;
    }
  }

  const std::string& owner() const override {
    return owner_;
  }

 private:
  std::shared_ptr<DatabaseManager> db_manager_;
  std::string owner_;
};

}  // namespace

SqliteCorpusRepository::SqliteCorpusRepository(std::shared_ptr<DatabaseManager> db_manager)
    : db_manager_(std::move(db_manager)) {
  if (!db_manager_) {
    throw ConfigurationError("SqliteCorpusRepository requires a DatabaseManager");
  }
}

void SqliteCorpusRepository::put_artifact(const std::string& key, const std::string& content) {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO artifacts (key, content, created_at) VALUES (?, ?, ?)" << key << content
          << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception& e) {
    if (classify_db_failure(e) == DbFailure::Duplicate) {
      throw IndexPublishError("Artifact already exists: " + key);
    }
    throw publish_failure("put_artifact " + key, e);
  }
}

std::optional<std::string> SqliteCorpusRepository::get_artifact(const std::string& key) const {
  try {
    PooledConnection conn(*db_manager_);
    std::optional<std::string> content;
    *conn << "SELECT content FROM artifacts WHERE key = ?" << key >>
        [&](std::string value) { content = std::move(value); };
    return content;
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("get_artifact " + key, e);
  }
}

std::vector<std::string> SqliteCorpusRepository::list_artifacts(const std::string& prefix) const {
  try {
    PooledConnection conn(*db_manager_);
    std::vector<std::string> keys;
    *conn << "SELECT key FROM artifacts WHERE substr(key, 1, length(?)) = ? ORDER BY key"
          << prefix << prefix >>
        [&](std::string key) { keys.push_back(std::move(key)); };
    return keys;
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("list_artifacts", e);
  }
}

size_t SqliteCorpusRepository::delete_artifacts(const std::string& prefix) {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "DELETE FROM artifacts WHERE substr(key, 1, length(?)) = ?" << prefix << prefix;
    return static_cast<size_t>(conn->rows_modified());
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("delete_artifacts " + prefix, e);
  }
}

void SqliteCorpusRepository::activate(const CorpusManifest& manifest) {
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    auto artifact_exists = [&](const std::string& key) {
      int count = 0;
      *conn << "SELECT COUNT(*) FROM artifacts WHERE key = ?" << key >> count;
      return count > 0;
    };
    if (!artifact_exists(manifest.chunk_map)) {
      throw IndexPublishError("Chunk-detail map missing for version " + manifest.version + ": " +
                              manifest.chunk_map);
    }
    for (const auto& shard : manifest.payload_shards) {
      if (!artifact_exists(shard)) {
        throw IndexPublishError("Payload shard missing for version " + manifest.version + ": " +
                                shard);
      }
    }

    int existing = 0;
    *conn << "SELECT COUNT(*) FROM corpus_versions WHERE version = ?" << manifest.version >>
        existing;
    if (existing > 0) {
      throw IndexPublishError("Corpus version already exists: " + manifest.version);
    }

    *conn << "UPDATE corpus_versions SET is_active = 0 WHERE is_active = 1";
    *conn << "INSERT INTO corpus_versions (version, manifest, created_at, is_active) "
             "VALUES (?, ?, ?, 1)"
          << manifest.version << manifest.to_json().dump() << manifest.created_at;
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw publish_failure("activate version " + manifest.version, e);
  }
}

std::optional<CorpusManifest> SqliteCorpusRepository::active_manifest() const {
  std::optional<std::string> manifest_json;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT manifest FROM corpus_versions WHERE is_active = 1" >>
        [&](std::string value) { manifest_json = std::move(value); };
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("active_manifest", e);
  }

  if (!manifest_json) {
    return std::nullopt;
  }
  try {
    return CorpusManifest::from_json(nlohmann::json::parse(*manifest_json));
  } catch (const nlohmann::json::exception& e) {
    throw CorpusDataError("Stored manifest is not valid JSON: " + std::string(e.what()));
  }
}

std::unique_ptr<PublishLock> SqliteCorpusRepository::acquire_publish_lock(
    const std::string& owner, std::chrono::minutes stale_after) {
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    const int64_t now = epoch_seconds_now();
    std::optional<std::pair<std::string, int64_t>> holder;
    *conn << "SELECT owner, acquired_at FROM publish_lock WHERE id = 1" >>
        [&](std::string current_owner, int64_t acquired_at) {
          holder = std::make_pair(std::move(current_owner), acquired_at);
        };

    if (holder) {
      const std::chrono::seconds age(now - holder->second);
      if (age < stale_after) {
        throw IndexPublishError("Publish lock is held by " + holder->first + " (acquired " +
                                std::to_string(age.count()) + "s ago)");
      }
      std::cerr << "[SqliteCorpusRepository] Taking over stale publish lock from "
                << holder->first << " (acquired " << age.count() << "s ago)" << std::endl;
      *conn << "DELETE FROM publish_lock WHERE id = 1";
    }

    *conn << "INSERT INTO publish_lock (id, owner, acquired_at) VALUES (1, ?, ?)" << owner << now;
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw publish_failure("acquire publish lock", e);
  }
  return std::make_unique<SqlitePublishLock>(db_manager_, owner);
}

void SqliteCorpusRepository::record_run(const RunRecord& run) {
  try {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT OR REPLACE INTO index_runs "
             "(run_id, started_at, finished_at, version, status, summary) "
             "VALUES (?, ?, ?, ?, ?, ?)"
          << run.run_id << run.started_at << run.finished_at << run.version << run.status
          << run.summary_json;
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("record_run " + run.run_id, e);
  }
}

std::vector<RunRecord> SqliteCorpusRepository::recent_runs(size_t limit) const {
  try {
    PooledConnection conn(*db_manager_);
    std::vector<RunRecord> runs;
    *conn << "SELECT run_id, started_at, finished_at, version, status, summary "
             "FROM index_runs ORDER BY finished_at DESC, rowid DESC LIMIT ?"
          << static_cast<int64_t>(limit) >>
        [&](std::string run_id, std::string started_at, std::string finished_at,
            std::string version, std::string status, std::string summary) {
          runs.push_back(RunRecord{std::move(run_id), std::move(started_at),
                                   std::move(finished_at), std::move(version), std::move(status),
                                   std::move(summary)});
        };
    return runs;
  } catch (const sqlite::sqlite_exception& e) {
    throw repository_failure("recent_runs", e);
  }
}

}  // namespace rag_core
