#pragma once

#include <memory>

namespace rag_core {
class Config;
class CorpusRepository;
class DocumentLoaderFactory;
class EmbeddingClient;
class Embedder;
class CorpusLoader;
class Retriever;
class IndexingPipeline;
}  // namespace rag_core

namespace rag_core {

/**
 * @class ServiceProvider
 * @brief Owns the object graph of one process.
 *
 * Built once from a Config by the executables, or directly from prepared
 * parts by tests.
 */
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<CorpusRepository> repository,
                  std::shared_ptr<DocumentLoaderFactory> loader_factory,
                  std::shared_ptr<EmbeddingClient> embedding_client,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<CorpusLoader> corpus_loader,
                  std::shared_ptr<Retriever> retriever,
                  std::shared_ptr<IndexingPipeline> pipeline)
      : repository_(repository),
        loader_factory_(loader_factory),
        embedding_client_(embedding_client),
        embedder_(embedder),
        corpus_loader_(corpus_loader),
        retriever_(retriever),
        pipeline_(pipeline) {}

  // Throws ConfigurationError for invalid settings
  static std::unique_ptr<ServiceProvider> from_config(const Config& config);

  // Same graph over a caller-supplied repository and embedding client
  static std::unique_ptr<ServiceProvider> from_parts(
      const Config& config,
      std::shared_ptr<CorpusRepository> repository,
      std::shared_ptr<EmbeddingClient> embedding_client);

  // Public getters for each service
  CorpusRepository& get_repository() {
    return *repository_;
  }
  EmbeddingClient& get_embedding_client() {
    return *embedding_client_;
  }
  Embedder& get_embedder() {
    return *embedder_;
  }
  CorpusLoader& get_corpus_loader() {
    return *corpus_loader_;
  }
  Retriever& get_retriever() {
    return *retriever_;
  }
  IndexingPipeline& get_indexing_pipeline() {
    return *pipeline_;
  }

 private:
  std::shared_ptr<CorpusRepository> repository_;
  std::shared_ptr<DocumentLoaderFactory> loader_factory_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<CorpusLoader> corpus_loader_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<IndexingPipeline> pipeline_;
};

}  // namespace rag_core
