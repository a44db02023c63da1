#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/search/vector_search_client.hpp"
#include "rag_core/types/records.hpp"

namespace faiss {
struct IndexHNSWFlat;
}

namespace rag_core {

/**
 * @class FaissVectorIndex
 * @brief In-process vector service over a Faiss HNSW graph.
 *
 * Vectors are L2-normalized on the way in and queried with the inner-product
 * metric, so scores are cosine similarities. Labels are insertion positions
 * into ids_, which maps them back to chunk ids.
 *
 * ingest() must complete before the index is shared; find_neighbors() may
 * then be called from any number of threads.
 */
class FaissVectorIndex : public VectorSearchClient {
 public:
  explicit FaissVectorIndex(size_t dimension);
  ~FaissVectorIndex() override;

  FaissVectorIndex(const FaissVectorIndex&) = delete;
  FaissVectorIndex& operator=(const FaissVectorIndex&) = delete;

  // Bulk ingest of payload records. Throws VectorSearchError on a dimension
  // mismatch or an id that is already present.
  void ingest(const std::vector<EmbeddingRecord>& records);

  std::vector<VectorHit> find_neighbors(const std::vector<float>& query,
                                        size_t top_k,
                                        const std::vector<RestrictFilter>& filters,
                                        const async::CancellationToken& token) override;

  size_t size() const override {
    return ids_.size();
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  bool matches(size_t label, const std::vector<RestrictFilter>& filters) const;

  static constexpr int HNSW_M_PARAM = 32;
  static constexpr int HNSW_EF_CONSTRUCTION_PARAM = 200;
  static constexpr int HNSW_EF_SEARCH_PARAM = 64;

  size_t dimension_;
  std::unique_ptr<faiss::IndexHNSWFlat> index_;
  std::vector<std::string> ids_;
  std::vector<std::vector<Restrict>> restricts_;
  std::unordered_map<std::string, size_t> labels_;
};

}  // namespace rag_core
