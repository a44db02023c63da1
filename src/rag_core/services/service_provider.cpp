#include "rag_core/services/service_provider.hpp"

#include "rag_core/config.hpp"
#include "rag_core/extractors/document_loader_factory.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/corpus_loader.hpp"

namespace rag_core {

std::unique_ptr<ServiceProvider> ServiceProvider::from_config(const Config& config) {
  return from_parts(config, make_corpus_repository(config.storage),
                    std::make_shared<OllamaClient>(config.ollama_url, config.embedding_model));
}

std::unique_ptr<ServiceProvider> ServiceProvider::from_parts(
    const Config& config,
    std::shared_ptr<CorpusRepository> repository,
    std::shared_ptr<EmbeddingClient> embedding_client) {
  auto loader_factory = std::make_shared<DocumentLoaderFactory>();
  auto embedder = std::make_shared<Embedder>(embedding_client, config.embedding);
  auto corpus_loader = std::make_shared<CorpusLoader>(repository);
  auto retriever = std::make_shared<Retriever>(embedder, corpus_loader, config.retrieval);
  auto pipeline = std::make_shared<IndexingPipeline>(repository, loader_factory, embedder,
                                                     config.chunking, config.materializing,
                                                     config.indexing);
  return std::make_unique<ServiceProvider>(repository, loader_factory, embedding_client, embedder,
                                           corpus_loader, retriever, pipeline);
}

}  // namespace rag_core
