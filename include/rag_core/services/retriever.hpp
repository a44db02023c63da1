#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/async/cancellation.hpp"
#include "rag_core/search/vector_search_client.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

class Embedder;
class SnapshotSource;

// Largest top_k accepted from a request or from configuration
inline constexpr size_t MAX_TOP_K = 1000;

struct RetrieverOptions {
  size_t top_k = 3;
  float score_threshold = 0.0f;
  // Keep only the best chunk of each source document
  bool dedupe_by_document = false;
};

struct RetrievalRequest {
  std::string query_text;
  size_t top_k = 3;
  float score_threshold = 0.0f;
  bool dedupe_by_document = false;
  std::vector<RestrictFilter> filters;
};

struct RetrievalResult {
  // Sorted by descending score, at most top_k
  std::vector<HydratedChunk> chunks;
  std::vector<Event> events;
  std::string corpus_version;
};

/**
 * @class Retriever
 * @brief Query-time path: embed, search, hydrate.
 *
 * Every query runs against one corpus snapshot, so the vector index and the
 * chunk-detail map it hydrates from always belong to the same version.
 * A hit whose id has no chunk-detail entry is dropped and reported as a
 * warning event.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<Embedder> embedder,
            std::shared_ptr<SnapshotSource> snapshots,
            RetrieverOptions defaults = {});

  /**
   * @throw RetrievalError if the query is invalid, no corpus is published,
   *        the active corpus cannot be loaded or a service call fails.
   * @throw RetrievalCancelled if the token is cancelled.
   */
  std::vector<HydratedChunk> retrieve(const std::string& query_text,
                                      size_t top_k,
                                      float score_threshold,
                                      const async::CancellationToken& token = {});

  RetrievalResult retrieve(const RetrievalRequest& request,
                           const async::CancellationToken& token = {});

  // Request populated from the configured defaults
  RetrievalRequest make_request(const std::string& query_text) const;

  // Numbered passages with their source, ready for a prompt
  static std::string format_citable_context(const std::vector<HydratedChunk>& chunks);

  const RetrieverOptions& defaults() const {
    return defaults_;
  }

 private:
  std::vector<VectorHit> search_with_retry(VectorSearchClient& search,
                                           const std::vector<float>& query_vector,
                                           const RetrievalRequest& request,
                                           const async::CancellationToken& token) const;

  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<SnapshotSource> snapshots_;
  RetrieverOptions defaults_;
};

}  // namespace rag_core
