#pragma once

#include <chrono>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/embedder.hpp"
#include "rag_core/services/index_materializer.hpp"
#include "rag_core/services/indexing_pipeline.hpp"
#include "rag_core/services/retriever.hpp"
#include "rag_core/storage/repository_factory.hpp"

namespace rag_core {

class Config {
 public:
  std::string api_base_url;
  std::string source_docs_dir;
  std::string ollama_url;
  std::string embedding_model;

  StorageOptions storage;
  ChunkerOptions chunking;
  EmbedderOptions embedding;
  IndexingOptions indexing;
  MaterializerOptions materializing;
  RetrieverOptions retrieval;

  // How often rag_api checks for a newly published corpus version
  int reload_interval_seconds = 30;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigurationError("Config must be a JSON object");
    }
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
      config.source_docs_dir =
          json_config.value("source_docs_dir", std::string("./data/rag_source_docs"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));

      const nlohmann::json storage = json_config.value("storage", nlohmann::json::object());
      config.storage.backend =
          storage_backend_from_string(storage.value("backend", std::string("sqlite")));
      config.storage.db_path = storage.value("db_path", std::string("./data/corpus.db"));
      config.storage.pool_size = storage.value("pool_size", 4);
      config.storage.stale_lock_after = std::chrono::minutes(storage.value("stale_lock_minutes", 60));

      const nlohmann::json chunking = json_config.value("chunking", nlohmann::json::object());
      config.chunking.max_size = chunking.value("max_size", static_cast<size_t>(1000));
      config.chunking.overlap = chunking.value("overlap", static_cast<size_t>(150));
      config.chunking.id_policy =
          chunk_id_policy_from_string(chunking.value("id_policy", std::string("content")));

      const nlohmann::json embedding = json_config.value("embedding", nlohmann::json::object());
      config.embedding.dimension = embedding.value("dimension", static_cast<size_t>(768));
      config.embedding.batch_size = embedding.value("batch_size", static_cast<size_t>(5));
      config.embedding.max_retries = embedding.value("max_retries", 3);
      config.embedding.initial_backoff =
          std::chrono::milliseconds(embedding.value("initial_backoff_ms", 500));
      config.embedding.max_backoff = std::chrono::milliseconds(embedding.value("max_backoff_ms", 8000));
      config.embedding.request_timeout =
          std::chrono::milliseconds(embedding.value("request_timeout_ms", 30000));
      config.embedding.query_timeout =
          std::chrono::milliseconds(embedding.value("query_timeout_ms", 5000));
      config.embedding.query_retry_delay =
          std::chrono::milliseconds(embedding.value("query_retry_delay_ms", 50));
      config.embedding.max_concurrent_requests =
          embedding.value("max_concurrent_requests", static_cast<size_t>(2));

      const nlohmann::json indexing = json_config.value("indexing", nlohmann::json::object());
      config.indexing.document_concurrency =
          indexing.value("document_concurrency", static_cast<size_t>(4));
      config.indexing.reuse_unchanged_documents =
          indexing.value("reuse_unchanged_documents", true);
      config.indexing.prune_superseded_versions =
          indexing.value("prune_superseded_versions", true);
      config.materializing.shard_max_bytes =
          indexing.value("shard_max_bytes", static_cast<size_t>(8 * 1024 * 1024));

      const nlohmann::json retrieval = json_config.value("retrieval", nlohmann::json::object());
      config.retrieval.top_k = retrieval.value("top_k", static_cast<size_t>(3));
      config.retrieval.score_threshold = retrieval.value("score_threshold", 0.0f);
      config.retrieval.dedupe_by_document = retrieval.value("dedupe_by_document", false);

      const nlohmann::json api = json_config.value("api", nlohmann::json::object());
      config.reload_interval_seconds = api.value("reload_interval_seconds", 30);
    } catch (const nlohmann::json::exception& e) {
      // Wrong value type for a known key
      throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    config.indexing.embedding_model = config.embedding_model;
    config.indexing.stale_lock_after = config.storage.stale_lock_after;

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw ConfigurationError("api_base_url cannot be empty");
    }
    if (source_docs_dir.empty()) {
      throw ConfigurationError("source_docs_dir cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigurationError("embedding_model cannot be empty");
    }
    if (storage.backend == StorageBackend::Sqlite && storage.db_path.empty()) {
      throw ConfigurationError("storage.db_path cannot be empty for the sqlite backend");
    }
    if (storage.pool_size <= 0) {
      throw ConfigurationError("storage.pool_size must be greater than 0");
    }
    if (storage.stale_lock_after.count() < 1) {
      throw ConfigurationError("storage.stale_lock_minutes must be at least 1 minute");
    }
    if (chunking.max_size == 0) {
      throw ConfigurationError("chunking.max_size must be greater than 0");
    }
    if (chunking.overlap >= chunking.max_size) {
      throw ConfigurationError("chunking.overlap must be smaller than chunking.max_size");
    }
    if (embedding.dimension == 0) {
      throw ConfigurationError("embedding.dimension must be greater than 0");
    }
    if (embedding.batch_size == 0) {
      throw ConfigurationError("embedding.batch_size must be greater than 0");
    }
    if (embedding.max_retries < 0) {
      throw ConfigurationError("embedding.max_retries cannot be negative");
    }
    if (embedding.initial_backoff > embedding.max_backoff) {
      throw ConfigurationError("embedding.initial_backoff_ms cannot exceed max_backoff_ms");
    }
    if (embedding.max_concurrent_requests == 0) {
      throw ConfigurationError("embedding.max_concurrent_requests must be greater than 0");
    }
    if (indexing.document_concurrency == 0) {
      throw ConfigurationError("indexing.document_concurrency must be greater than 0");
    }
    if (materializing.shard_max_bytes == 0) {
      throw ConfigurationError("indexing.shard_max_bytes must be greater than 0");
    }
    if (retrieval.top_k == 0 || retrieval.top_k > MAX_TOP_K) {
      throw ConfigurationError("retrieval.top_k must be between 1 and " +
                               std::to_string(MAX_TOP_K));
    }
    if (reload_interval_seconds < 1) {
      throw ConfigurationError("api.reload_interval_seconds must be at least 1 second");
    }
  }
};

}  // namespace rag_core
