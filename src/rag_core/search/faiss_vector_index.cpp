#include "rag_core/search/faiss_vector_index.hpp"

#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>

#include "rag_core/errors.hpp"

namespace rag_core {

FaissVectorIndex::FaissVectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw VectorSearchError("Vector index dimension must be greater than 0", false);
  }
  index_ = std::make_unique<faiss::IndexHNSWFlat>(static_cast<int>(dimension_), HNSW_M_PARAM,
                                                  faiss::METRIC_INNER_PRODUCT);
  index_->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
  index_->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
}

FaissVectorIndex::~FaissVectorIndex() = default;

void FaissVectorIndex::ingest(const std::vector<EmbeddingRecord>& records) {
  if (records.empty()) {
    return;
  }

  std::unordered_map<std::string, size_t> batch_labels;
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(records.size() * dimension_);
  for (size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    if (record.vector.size() != dimension_) {
      throw VectorSearchError("Vector dimension mismatch for " + record.chunk_id + ". Expected " +
                                  std::to_string(dimension_) + ", got " +
                                  std::to_string(record.vector.size()),
                              false);
    }
    const size_t label = ids_.size() + i;
    if (labels_.count(record.chunk_id) > 0 || !batch_labels.emplace(record.chunk_id, label).second) {
      throw VectorSearchError("Duplicate id in vector index: " + record.chunk_id, false);
    }
    all_vectors_flat.insert(all_vectors_flat.end(), record.vector.begin(), record.vector.end());
  }

  faiss::fvec_renorm_L2(dimension_, records.size(), all_vectors_flat.data());
  try {
    index_->add(static_cast<faiss::idx_t>(records.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException& e) {
    throw VectorSearchError("Faiss ingest failed: " + std::string(e.what()), false);
  }

  for (const auto& record : records) {
    ids_.push_back(record.chunk_id);
    restricts_.push_back(record.restrict_tags);
  }
  labels_.insert(batch_labels.begin(), batch_labels.end());
}

std::vector<VectorHit> FaissVectorIndex::find_neighbors(const std::vector<float>& query,
                                                        size_t top_k,
                                                        const std::vector<RestrictFilter>& filters,
                                                        const async::CancellationToken& token) {
  if (token.is_cancelled()) {
    throw RetrievalCancelled("Retrieval cancelled before vector search");
  }
  if (query.size() != dimension_) {
    throw VectorSearchError("Query vector dimension mismatch. Expected " +
                                std::to_string(dimension_) + ", got " +
                                std::to_string(query.size()),
                            false);
  }
  if (ids_.empty() || top_k == 0) {
    return {};
  }

  std::vector<float> query_vector = query;
  faiss::fvec_renorm_L2(dimension_, 1, query_vector.data());

  faiss::SearchParametersHNSW params;

  std::vector<faiss::idx_t> allowed;
  std::unique_ptr<faiss::IDSelectorBatch> selector;
  size_t candidates = ids_.size();
  if (!filters.empty()) {
    for (size_t label = 0; label < ids_.size(); ++label) {
      if (matches(label, filters)) {
        allowed.push_back(static_cast<faiss::idx_t>(label));
      }
    }
    if (allowed.empty()) {
      return {};
    }
    selector = std::make_unique<faiss::IDSelectorBatch>(allowed.size(), allowed.data());
    params.sel = selector.get();
    candidates = allowed.size();
  }

  // efSearch from the clamped k; top_k alone may be far larger than the index
  const size_t k = std::min(top_k, candidates);
  params.efSearch = std::max(HNSW_EF_SEARCH_PARAM, static_cast<int>(k));
  std::vector<float> distances(k);
  std::vector<faiss::idx_t> labels(k);
  try {
    index_->search(1, query_vector.data(), static_cast<faiss::idx_t>(k), distances.data(),
                   labels.data(), &params);
  } catch (const faiss::FaissException& e) {
    throw VectorSearchError("Faiss search failed: " + std::string(e.what()), false);
  }

  std::vector<VectorHit> hits;
  hits.reserve(k);
  for (size_t i = 0; i < k; ++i) {
    // HNSW pads with -1 when it finds fewer than k neighbours
    if (labels[i] < 0 || static_cast<size_t>(labels[i]) >= ids_.size()) {
      continue;
    }
    hits.push_back(VectorHit{ids_[static_cast<size_t>(labels[i])], distances[i]});
  }
  return hits;
}

bool FaissVectorIndex::matches(size_t label, const std::vector<RestrictFilter>& filters) const {
  const auto& tags = restricts_[label];
  for (const auto& filter : filters) {
    bool satisfied = false;
    for (const auto& tag : tags) {
      if (tag.namespace_name != filter.namespace_name) {
        continue;
      }
      for (const auto& value : filter.allow) {
        if (std::find(tag.allow.begin(), tag.allow.end(), value) != tag.allow.end()) {
          satisfied = true;
          break;
        }
      }
      if (satisfied) {
        break;
      }
    }
    if (!satisfied) {
      return false;
    }
  }
  return true;
}

}  // namespace rag_core
