#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "rag_core/config.hpp"
#include "rag_core/services/service_provider.hpp"
#include "rag_core/storage/in_memory_corpus_repository.hpp"

namespace rag_tests {

using namespace rag_core;

class ServiceProviderTest : public RepositoryTestBase {
 protected:
  void SetUp() override {
    RepositoryTestBase::SetUp();
    config_ = Config::from_json({{"storage", {{"backend", "memory"}}},
                                 {"embedding", {{"dimension", 8}, {"batch_size", 2}}},
                                 {"retrieval", {{"top_k", 2}, {"score_threshold", -1.0}}}});
    fake_client_ = std::make_shared<FakeEmbeddingClient>(8);
  }

  Config config_;
  std::shared_ptr<FakeEmbeddingClient> fake_client_;
};

TEST_F(ServiceProviderTest, FromParts_WiresSuppliedDependencies) {
  // Act
  auto provider = ServiceProvider::from_parts(config_, repository_, fake_client_);

  // Assert
  EXPECT_EQ(&provider->get_repository(), repository_.get());
  EXPECT_EQ(&provider->get_embedding_client(), fake_client_.get());
  EXPECT_EQ(provider->get_embedder().options().batch_size, 2u);
  EXPECT_EQ(provider->get_retriever().defaults().top_k, 2u);
}

TEST_F(ServiceProviderTest, IndexThenRetrieveThroughTheProvider) {
  // Arrange
  std::filesystem::path source_dir = TestUtilities::create_temp_dir();
  TestUtilities::write_file(source_dir / "alpha.txt", "Alpha explains the first topic.");
  TestUtilities::write_file(source_dir / "beta.md", "# Beta\nBeta explains the second topic.");
  TestUtilities::write_file(source_dir / "gamma.txt", "Gamma explains the third topic.");
  auto provider = ServiceProvider::from_parts(config_, repository_, fake_client_);

  // Act
  RunSummary summary = provider->get_indexing_pipeline().run(source_dir);
  EXPECT_TRUE(provider->get_corpus_loader().refresh());
  std::vector<HydratedChunk> results =
      provider->get_retriever().retrieve("Alpha explains the first topic.", 2, -1.0f);
  TestUtilities::cleanup_temp_dir(source_dir);

  // Assert
  ASSERT_TRUE(summary.published);
  EXPECT_EQ(summary.documents_succeeded, 3u);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].document_name, "alpha.txt");
  EXPECT_GE(results[0].score, results[1].score);
}

TEST_F(ServiceProviderTest, FromConfig_BuildsMemoryBackedGraph) {
  auto provider = ServiceProvider::from_config(config_);

  EXPECT_FALSE(provider->get_repository().active_manifest().has_value());
  EXPECT_EQ(provider->get_corpus_loader().current(), nullptr);
}

TEST_F(ServiceProviderTest, FromConfig_SqliteBackendCreatesDatabase) {
  std::filesystem::path db_path = TestUtilities::create_temp_test_db();
  config_.storage.backend = StorageBackend::Sqlite;
  config_.storage.db_path = db_path.string();

  {
    auto provider = ServiceProvider::from_config(config_);
    EXPECT_TRUE(provider->get_repository().recent_runs(1).empty());
  }

  EXPECT_TRUE(std::filesystem::exists(db_path));
  TestUtilities::cleanup_temp_db(db_path);
}

}  // namespace rag_tests
