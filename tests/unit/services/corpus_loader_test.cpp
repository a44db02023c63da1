#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/corpus_loader.hpp"
#include "rag_core/services/index_materializer.hpp"
#include "rag_core/services/ingestion_payload.hpp"

namespace rag_tests {

using namespace rag_core;

// Forwards to another repository and counts artifact reads
class CountingRepository : public CorpusRepository {
 public:
  explicit CountingRepository(std::shared_ptr<CorpusRepository> inner) : inner_(std::move(inner)) {}

  void put_artifact(const std::string& key, const std::string& content) override {
    inner_->put_artifact(key, content);
  }
  std::optional<std::string> get_artifact(const std::string& key) const override {
    ++artifact_reads;
    return inner_->get_artifact(key);
  }
  std::vector<std::string> list_artifacts(const std::string& prefix) const override {
    return inner_->list_artifacts(prefix);
  }
  size_t delete_artifacts(const std::string& prefix) override {
    return inner_->delete_artifacts(prefix);
  }
  void activate(const CorpusManifest& manifest) override {
    inner_->activate(manifest);
  }
  std::optional<CorpusManifest> active_manifest() const override {
    return inner_->active_manifest();
  }
  std::unique_ptr<PublishLock> acquire_publish_lock(const std::string& owner,
                                                    std::chrono::minutes stale_after) override {
    return inner_->acquire_publish_lock(owner, stale_after);
  }
  void record_run(const RunRecord& run) override {
    inner_->record_run(run);
  }
  std::vector<RunRecord> recent_runs(size_t limit) const override {
    return inner_->recent_runs(limit);
  }

  mutable size_t artifact_reads = 0;

 private:
  std::shared_ptr<CorpusRepository> inner_;
};

class CorpusLoaderTest : public RepositoryTestBase {
 protected:
  CorpusManifest publish_version(const std::string& version, size_t count) {
    std::vector<IndexEntry> entries;
    for (size_t i = 0; i < count; ++i) {
      entries.push_back(MockUtilities::create_test_entry(
          version + "-chunk-" + std::to_string(i), MockUtilities::create_axis_vector(i), "doc.md",
          static_cast<int>(i)));
    }
    IndexMaterializer materializer(repository_, MaterializerOptions{});
    CorpusManifest manifest = materializer.materialize(entries, version);
    materializer.publish(manifest);
    return manifest;
  }
};

TEST_F(CorpusLoaderTest, NoPublishedCorpusMeansNoSnapshot) {
  CorpusLoader loader(repository_);

  EXPECT_EQ(loader.current(), nullptr);
  EXPECT_FALSE(loader.refresh());
}

TEST_F(CorpusLoaderTest, LoadsActiveVersionLazily) {
  // Arrange
  publish_version("v1", 3);
  CorpusLoader loader(repository_);

  // Act
  std::shared_ptr<const CorpusSnapshot> snapshot = loader.current();

  // Assert
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->manifest.version, "v1");
  EXPECT_EQ(snapshot->details.size(), 3u);
  ASSERT_NE(snapshot->search, nullptr);
  EXPECT_EQ(snapshot->search->size(), 3u);

  std::vector<VectorHit> hits =
      snapshot->search->find_neighbors(MockUtilities::create_axis_vector(1), 1, {}, {});
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "v1-chunk-1");
}

TEST_F(CorpusLoaderTest, RefreshSwapsOnlyOnVersionChange) {
  publish_version("v1", 2);
  CorpusLoader loader(repository_);
  std::shared_ptr<const CorpusSnapshot> first = loader.current();

  EXPECT_FALSE(loader.refresh());
  EXPECT_EQ(loader.current(), first);

  publish_version("v2", 4);
  EXPECT_TRUE(loader.refresh());

  std::shared_ptr<const CorpusSnapshot> second = loader.current();
  EXPECT_EQ(second->manifest.version, "v2");
  EXPECT_EQ(second->search->size(), 4u);
  // Holders of the old snapshot keep a consistent view
  EXPECT_EQ(first->manifest.version, "v1");
  EXPECT_TRUE(first->details.contains("v1-chunk-0"));
  EXPECT_FALSE(first->details.contains("v2-chunk-0"));
}

TEST_F(CorpusLoaderTest, MissingArtifactsAreCorpusDataError) {
  CorpusManifest manifest;
  manifest.version = "ghost";
  manifest.payload_shards = {"versions/ghost/embeddings/shard-00000.jsonl"};
  manifest.chunk_map = "versions/ghost/metadata/id_to_chunk_details_map.json";

  EXPECT_THROW(CorpusLoader::read_payload(*repository_, manifest), CorpusDataError);
  EXPECT_THROW(CorpusLoader::read_chunk_map(*repository_, manifest), CorpusDataError);
}

TEST_F(CorpusLoaderTest, LoadsVersionWhosePayloadOutgrowsTheMap) {
  // Arrange: three payload records but only two chunk-detail entries
  std::string shard;
  ChunkDetailMap details;
  for (size_t i = 0; i < 3; ++i) {
    IndexEntry entry = MockUtilities::create_test_entry("c" + std::to_string(i),
                                                        MockUtilities::create_axis_vector(i));
    shard += to_ingestion_line(entry.record);
    if (i < 2) {
      details.insert(entry.record.chunk_id, entry.detail);
    }
  }
  CorpusManifest manifest;
  manifest.version = "v1";
  manifest.payload_shards = {IndexMaterializer::shard_key("v1", 0)};
  manifest.chunk_map = IndexMaterializer::chunk_map_key("v1");
  manifest.record_count = 3;
  manifest.dimension = 8;
  repository_->put_artifact(manifest.payload_shards[0], shard);
  repository_->put_artifact(manifest.chunk_map, details.to_json_string());
  repository_->activate(manifest);

  // Act
  CorpusLoader loader(repository_);
  std::shared_ptr<const CorpusSnapshot> snapshot = loader.current();

  // Assert
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->search->size(), 3u);
  EXPECT_EQ(snapshot->details.size(), 2u);
  EXPECT_FALSE(snapshot->details.contains("c2"));
}

TEST_F(CorpusLoaderTest, CorruptActiveVersionIsNotReloadedOnEveryQuery) {
  // Arrange: v1 has a payload shard that does not parse
  CorpusManifest manifest;
  manifest.version = "v1";
  manifest.payload_shards = {IndexMaterializer::shard_key("v1", 0)};
  manifest.chunk_map = IndexMaterializer::chunk_map_key("v1");
  manifest.dimension = 8;
  repository_->put_artifact(manifest.payload_shards[0], "{not json\n");
  repository_->put_artifact(manifest.chunk_map, ChunkDetailMap().to_json_string());
  repository_->activate(manifest);
  auto counting = std::make_shared<CountingRepository>(repository_);
  CorpusLoader loader(counting);

  // Act
  EXPECT_THROW(loader.current(), CorpusDataError);
  const size_t reads_after_first_failure = counting->artifact_reads;
  EXPECT_THROW(loader.current(), CorpusDataError);
  EXPECT_THROW(loader.current(), CorpusDataError);

  // Assert
  EXPECT_GT(reads_after_first_failure, 0u);
  EXPECT_EQ(counting->artifact_reads, reads_after_first_failure);

  // A newly published version is picked up
  publish_version("v2", 2);
  std::shared_ptr<const CorpusSnapshot> snapshot = loader.current();
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->manifest.version, "v2");
}

}  // namespace rag_tests
