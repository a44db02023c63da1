#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/utilities_test.hpp"
#include "rag_core/config.hpp"

namespace rag_tests {

using rag_core::Config;
using rag_core::ConfigurationError;

TEST(ConfigTest, LoadsFromJsonWithDefaults) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"source_docs_dir", "./docs"},
      {"embedding_model", "mxbai-embed-large"},
      {"storage", {{"backend", "memory"}}},
      {"chunking", {{"max_size", 500}, {"overlap", 50}, {"id_policy", "random"}}},
      {"embedding", {{"dimension", 1024}, {"batch_size", 16}}},
      {"indexing", {{"prune_superseded_versions", false}}},
      {"retrieval", {{"top_k", 5}, {"score_threshold", 0.25}, {"dedupe_by_document", true}}}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.source_docs_dir, "./docs");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.storage.backend, rag_core::StorageBackend::Memory);
  EXPECT_EQ(cfg.chunking.max_size, 500u);
  EXPECT_EQ(cfg.chunking.overlap, 50u);
  EXPECT_EQ(cfg.chunking.id_policy, rag_core::ChunkIdPolicy::Random);
  EXPECT_EQ(cfg.embedding.dimension, 1024u);
  EXPECT_EQ(cfg.embedding.batch_size, 16u);
  EXPECT_EQ(cfg.retrieval.top_k, 5u);
  EXPECT_FLOAT_EQ(cfg.retrieval.score_threshold, 0.25f);
  EXPECT_TRUE(cfg.retrieval.dedupe_by_document);
  // The model name feeds the index signature
  EXPECT_EQ(cfg.indexing.embedding_model, "mxbai-embed-large");
  EXPECT_FALSE(cfg.indexing.prune_superseded_versions);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3040");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.storage.backend, rag_core::StorageBackend::Sqlite);
  EXPECT_EQ(cfg.storage.db_path, "./data/corpus.db");
  EXPECT_EQ(cfg.chunking.max_size, 1000u);
  EXPECT_EQ(cfg.chunking.overlap, 150u);
  EXPECT_EQ(cfg.chunking.id_policy, rag_core::ChunkIdPolicy::ContentDerived);
  EXPECT_EQ(cfg.embedding.dimension, 768u);
  EXPECT_EQ(cfg.embedding.batch_size, 5u);
  EXPECT_EQ(cfg.embedding.max_retries, 3);
  EXPECT_EQ(cfg.retrieval.top_k, 3u);
  EXPECT_EQ(cfg.reload_interval_seconds, 30);
  EXPECT_EQ(cfg.indexing.stale_lock_after, std::chrono::minutes(60));
  EXPECT_TRUE(cfg.indexing.prune_superseded_versions);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "source_docs_dir": "./corpus",
    "ollama_url": "http://ollama:11434",
    "storage": {"db_path": "./db/corpus.db", "pool_size": 2},
    "api": {"reload_interval_seconds": 5}
  })JSON";

  std::filesystem::path path = TestUtilities::create_temp_path("config");
  path += ".json";
  TestUtilities::write_file(path, contents);
  Config cfg = Config::from_file(path.string());
  std::filesystem::remove(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.ollama_url, "http://ollama:11434");
  EXPECT_EQ(cfg.storage.db_path, "./db/corpus.db");
  EXPECT_EQ(cfg.storage.pool_size, 2);
  EXPECT_EQ(cfg.reload_interval_seconds, 5);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, ConfigurationError);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::filesystem::path path = TestUtilities::create_temp_path("config");
  path += ".json";
  TestUtilities::write_file(path, "{ not json");

  EXPECT_THROW({ (void)Config::from_file(path.string()); }, ConfigurationError);
  std::filesystem::remove(path);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  nlohmann::json j = {{"api_base_url", ""}};
  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError);
}

TEST(ConfigTest, OverlapMustBeSmallerThanMaxSize) {
  nlohmann::json j = {{"chunking", {{"max_size", 100}, {"overlap", 100}}}};
  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  nlohmann::json j = {{"embedding", {{"batch_size", "five"}}}};
  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError);
}

TEST(ConfigTest, UnknownEnumValuesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"storage", {{"backend", "s3"}}}}); },
               ConfigurationError);
  EXPECT_THROW({ (void)Config::from_json({{"chunking", {{"id_policy", "hash"}}}}); },
               ConfigurationError);
}

TEST(ConfigTest, ZeroTopKThrows) {
  nlohmann::json j = {{"retrieval", {{"top_k", 0}}}};
  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError);
}

TEST(ConfigTest, TopKAboveLimitThrows) {
  nlohmann::json j = {{"retrieval", {{"top_k", rag_core::MAX_TOP_K + 1}}}};
  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError);
}

}  // namespace rag_tests
