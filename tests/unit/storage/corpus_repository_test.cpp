#include <gtest/gtest.h>

#include <thread>

#include "common/utilities_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/storage/repository_factory.hpp"

namespace rag_tests {

using namespace rag_core;

class CorpusRepositoryTest : public RepositoryTestBase,
                             public ::testing::WithParamInterface<RepositoryKind> {
 protected:
  void SetUp() override {
    create_repository(GetParam());
  }

  CorpusManifest stage_version(const std::string& version, size_t records = 2) {
    CorpusManifest manifest;
    manifest.version = version;
    manifest.created_at = "2026-01-01T00:00:00Z";
    manifest.payload_shards = {"versions/" + version + "/embeddings/part-00000.json"};
    manifest.chunk_map = "versions/" + version + "/metadata/chunk_map.json";
    manifest.record_count = records;
    manifest.dimension = 8;
    manifest.index_signature = "sig";
    manifest.documents.push_back(DocumentFingerprint{"a.txt", "hash-a", records});
    repository_->put_artifact(manifest.payload_shards[0], "{}\n");
    repository_->put_artifact(manifest.chunk_map, "{}");
    return manifest;
  }
};

TEST_P(CorpusRepositoryTest, NothingActiveInitially) {
  EXPECT_FALSE(repository_->active_manifest().has_value());
  EXPECT_TRUE(repository_->recent_runs(10).empty());
}

TEST_P(CorpusRepositoryTest, ArtifactsAreWriteOnce) {
  repository_->put_artifact("versions/v1/x", "first");

  EXPECT_THROW(repository_->put_artifact("versions/v1/x", "second"), IndexPublishError);
  EXPECT_EQ(repository_->get_artifact("versions/v1/x").value(), "first");
  EXPECT_FALSE(repository_->get_artifact("versions/v1/y").has_value());
}

TEST_P(CorpusRepositoryTest, ListsArtifactsByPrefixInOrder) {
  repository_->put_artifact("versions/v2/b", "");
  repository_->put_artifact("versions/v1/b", "");
  repository_->put_artifact("versions/v1/a", "");

  std::vector<std::string> keys = repository_->list_artifacts("versions/v1/");

  EXPECT_EQ(keys, (std::vector<std::string>{"versions/v1/a", "versions/v1/b"}));
}

TEST_P(CorpusRepositoryTest, DeletesArtifactsByPrefixOnly) {
  repository_->put_artifact("versions/v1/a", "");
  repository_->put_artifact("versions/v1/b", "");
  repository_->put_artifact("versions/v10/a", "");
  repository_->put_artifact("versions/v2/a", "");

  EXPECT_EQ(repository_->delete_artifacts("versions/v1/"), 2u);
  EXPECT_EQ(repository_->delete_artifacts("versions/v1/"), 0u);

  EXPECT_EQ(repository_->list_artifacts("versions/"),
            (std::vector<std::string>{"versions/v10/a", "versions/v2/a"}));
}

TEST_P(CorpusRepositoryTest, ActivateSwitchesActiveVersion) {
  // Arrange
  CorpusManifest first = stage_version("v1");
  CorpusManifest second = stage_version("v2", 5);

  // Act
  repository_->activate(first);
  repository_->activate(second);

  // Assert
  auto active = repository_->active_manifest();
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->version, "v2");
  EXPECT_EQ(active->record_count, 5u);
  EXPECT_EQ(active->dimension, 8u);
  EXPECT_EQ(active->index_signature, "sig");
  ASSERT_EQ(active->documents.size(), 1u);
  EXPECT_EQ(active->documents[0].content_hash, "hash-a");
}

TEST_P(CorpusRepositoryTest, ActivateWithMissingArtifactKeepsPreviousVersion) {
  CorpusManifest first = stage_version("v1");
  repository_->activate(first);

  CorpusManifest broken;
  broken.version = "v2";
  broken.payload_shards = {"versions/v2/embeddings/part-00000.json"};
  broken.chunk_map = "versions/v2/metadata/chunk_map.json";
  repository_->put_artifact(broken.chunk_map, "{}");

  EXPECT_THROW(repository_->activate(broken), IndexPublishError);
  EXPECT_EQ(repository_->active_manifest()->version, "v1");
}

TEST_P(CorpusRepositoryTest, ActivateRejectsDuplicateVersion) {
  CorpusManifest first = stage_version("v1");
  repository_->activate(first);
  EXPECT_THROW(repository_->activate(first), IndexPublishError);
}

TEST_P(CorpusRepositoryTest, PublishLockIsExclusiveUntilReleased) {
  auto lock = repository_->acquire_publish_lock("run-a", std::chrono::minutes(60));
  EXPECT_EQ(lock->owner(), "run-a");

  EXPECT_THROW(repository_->acquire_publish_lock("run-b", std::chrono::minutes(60)),
               IndexPublishError);

  lock.reset();
  auto next = repository_->acquire_publish_lock("run-b", std::chrono::minutes(60));
  EXPECT_EQ(next->owner(), "run-b");
}

TEST_P(CorpusRepositoryTest, StaleLockIsTakenOver) {
  auto abandoned = repository_->acquire_publish_lock("run-a", std::chrono::minutes(60));

  auto taken = repository_->acquire_publish_lock("run-b", std::chrono::minutes(0));
  EXPECT_EQ(taken->owner(), "run-b");

  // Releasing the abandoned handle must not free the new owner's lock
  abandoned.reset();
  EXPECT_THROW(repository_->acquire_publish_lock("run-c", std::chrono::minutes(60)),
               IndexPublishError);
}

TEST_P(CorpusRepositoryTest, RecentRunsNewestFirst) {
  repository_->record_run(RunRecord{"r1", "2026-01-01T00:00:00Z", "2026-01-01T00:01:00Z", "v1",
                                    "published", "{}"});
  repository_->record_run(
      RunRecord{"r2", "2026-01-02T00:00:00Z", "2026-01-02T00:01:00Z", "", "failed", "{}"});
  repository_->record_run(RunRecord{"r3", "2026-01-03T00:00:00Z", "2026-01-03T00:01:00Z", "v3",
                                    "published", "{}"});

  std::vector<RunRecord> runs = repository_->recent_runs(2);

  ASSERT_EQ(runs.size(), 2u);
  EXPECT_EQ(runs[0].run_id, "r3");
  EXPECT_EQ(runs[1].run_id, "r2");
  EXPECT_EQ(runs[1].status, "failed");
  EXPECT_TRUE(runs[1].version.empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, CorpusRepositoryTest,
                         ::testing::Values(RepositoryKind::Sqlite, RepositoryKind::Memory),
                         [](const ::testing::TestParamInfo<RepositoryKind>& info) {
                           return info.param == RepositoryKind::Sqlite ? std::string("Sqlite")
                                                                       : std::string("Memory");
                         });

TEST(CorpusManifestTest, JsonRoundTripKeepsFingerprints) {
  CorpusManifest manifest;
  manifest.version = "v9";
  manifest.payload_shards = {"s0", "s1"};
  manifest.chunk_map = "m";
  manifest.documents.push_back(DocumentFingerprint{"doc.md", "abc", 4});

  CorpusManifest parsed = CorpusManifest::from_json(manifest.to_json());

  EXPECT_EQ(parsed.payload_shards, manifest.payload_shards);
  ASSERT_TRUE(parsed.find_document("doc.md").has_value());
  EXPECT_EQ(parsed.find_document("doc.md")->chunk_count, 4u);
  EXPECT_FALSE(parsed.find_document("other.md").has_value());
}

TEST(CorpusManifestTest, MalformedManifestIsCorpusDataError) {
  EXPECT_THROW(CorpusManifest::from_json(nlohmann::json{{"version", "v1"}}), CorpusDataError);
}

TEST(RepositoryFactoryTest, BackendNames) {
  EXPECT_EQ(storage_backend_from_string("memory"), StorageBackend::Memory);
  EXPECT_EQ(storage_backend_from_string("sqlite"), StorageBackend::Sqlite);
  EXPECT_THROW(storage_backend_from_string("postgres"), ConfigurationError);

  StorageOptions options;
  options.backend = StorageBackend::Sqlite;
  options.db_path = "";
  EXPECT_THROW(make_corpus_repository(options), ConfigurationError);
}

}  // namespace rag_tests
