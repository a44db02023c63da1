#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"

namespace rag_tests {

using namespace rag_core;

class DatabaseManagerTest : public RepositoryTestBase {
 protected:
  void SetUp() override {
    create_repository(RepositoryKind::Sqlite);
  }
};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  // Verify required tables exist
  std::vector<std::string> required_tables = {"artifacts", "corpus_versions", "publish_lock",
                                              "index_runs"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_corpus_versions_active'" >> idx_count;
  EXPECT_EQ(idx_count, 1);

  // Verify foreign_keys pragma is ON
  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, OnlyOneVersionCanBeActive) {
  PooledConnection conn(*db_manager_);
  *conn << "INSERT INTO corpus_versions (version, manifest, created_at, is_active) VALUES ('a', '{}', 't', 1)";

  try {
    *conn << "INSERT INTO corpus_versions (version, manifest, created_at, is_active) VALUES ('b', '{}', 't', 1)";
    FAIL() << "Expected a constraint violation";
  } catch (const sqlite::sqlite_exception& e) {
    EXPECT_EQ(classify_db_failure(e), DbFailure::Duplicate);
    EXPECT_NE(describe_db_failure("insert", e).find("(duplicate key)"), std::string::npos);
    IndexPublishError publish = publish_failure("activate version b", e);
    EXPECT_NE(std::string(publish.what()).find("activate version b failed"), std::string::npos);
  }
}

TEST_F(DatabaseManagerTest, TransactionRollsBackUnlessCommitted) {
  PooledConnection conn(*db_manager_);
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO artifacts (key, content, created_at) VALUES ('rolled', '', 't')";
  }
  {
    Transaction tx(*conn, /*immediate*/ true);
    *conn << "INSERT INTO artifacts (key, content, created_at) VALUES ('kept', '', 't')";
    tx.commit();
  }

  int rolled = -1;
  int kept = -1;
  *conn << "SELECT COUNT(*) FROM artifacts WHERE key = 'rolled'" >> rolled;
  *conn << "SELECT COUNT(*) FROM artifacts WHERE key = 'kept'" >> kept;
  EXPECT_EQ(rolled, 0);
  EXPECT_EQ(kept, 1);
}

TEST_F(DatabaseManagerTest, FailedRollbackDoesNotEscapeDestructor) {
  PooledConnection conn(*db_manager_);
  EXPECT_NO_THROW({
    Transaction tx(*conn);
    // Ends the transaction behind the guard's back, so its ROLLBACK fails
    *conn << "COMMIT;";
  });

  int count = -1;
  *conn << "SELECT COUNT(*) FROM artifacts" >> count;
  EXPECT_EQ(count, 0);
}

TEST_F(DatabaseManagerTest, PublishLockReleaseAfterShutdownIsLogged) {
  std::unique_ptr<PublishLock> lock =
      repository_->acquire_publish_lock("run-1", std::chrono::minutes(60));
  db_manager_->shutdown();

  // The release cannot reach the database; the destructor reports and returns
  EXPECT_NO_THROW(lock.reset());
}

TEST_F(DatabaseManagerTest, ReopeningKeepsData) {
  repository_->put_artifact("versions/v1/x", "payload");
  const std::filesystem::path path = temp_db_path_;

  repository_.reset();
  db_manager_->shutdown();
  db_manager_ = std::make_shared<DatabaseManager>(path, 1);

  PooledConnection conn(*db_manager_);
  std::string content;
  *conn << "SELECT content FROM artifacts WHERE key = 'versions/v1/x'" >> content;
  EXPECT_EQ(content, "payload");
}

}  // namespace rag_tests
