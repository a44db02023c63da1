#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rag_core/async/cancellation.hpp"

namespace rag_core {

struct VectorHit {
  std::string id;
  float score = 0.0f;
};

// A hit must carry a restrict in this namespace allowing at least one of the values
struct RestrictFilter {
  std::string namespace_name;
  std::vector<std::string> allow;
};

/**
 * @brief Contract of the vector-similarity service.
 *
 * Returns up to top_k ids ordered by descending similarity. Ids are opaque;
 * hydration is the caller's job. Failures are VectorSearchError; a cancelled
 * token makes the call throw RetrievalCancelled.
 */
class VectorSearchClient {
 public:
  virtual ~VectorSearchClient() = default;

  virtual std::vector<VectorHit> find_neighbors(const std::vector<float>& query,
                                                size_t top_k,
                                                const std::vector<RestrictFilter>& filters,
                                                const async::CancellationToken& token) = 0;

  virtual size_t size() const = 0;
};

}  // namespace rag_core
