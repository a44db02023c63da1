#include "rag_core/services/retriever.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_set>

#include "rag_core/errors.hpp"
#include "rag_core/services/corpus_loader.hpp"
#include "rag_core/services/embedder.hpp"

namespace rag_core {

namespace {

const char* const kComponent = "Retriever";

void throw_if_cancelled(const async::CancellationToken& token, const char* stage) {
  if (token.is_cancelled()) {
    throw RetrievalCancelled(std::string("Retrieval cancelled ") + stage);
  }
}

}  // namespace

Retriever::Retriever(std::shared_ptr<Embedder> embedder,
                     std::shared_ptr<SnapshotSource> snapshots,
                     RetrieverOptions defaults)
    : embedder_(std::move(embedder)), snapshots_(std::move(snapshots)), defaults_(defaults) {
  if (!embedder_ || !snapshots_) {
    throw ConfigurationError("Retriever requires an embedder and a snapshot source");
  }
  if (defaults_.top_k == 0 || defaults_.top_k > MAX_TOP_K) {
    throw ConfigurationError("retrieval.top_k must be between 1 and " + std::to_string(MAX_TOP_K));
  }
}

std::vector<HydratedChunk> Retriever::retrieve(const std::string& query_text,
                                               size_t top_k,
                                               float score_threshold,
                                               const async::CancellationToken& token) {
  RetrievalRequest request = make_request(query_text);
  request.top_k = top_k;
  request.score_threshold = score_threshold;
  return retrieve(request, token).chunks;
}

RetrievalResult Retriever::retrieve(const RetrievalRequest& request,
                                    const async::CancellationToken& token) {
  if (request.query_text.empty()) {
    throw RetrievalError("Query text must not be empty");
  }
  if (request.top_k == 0 || request.top_k > MAX_TOP_K) {
    throw RetrievalError("top_k must be between 1 and " + std::to_string(MAX_TOP_K));
  }
  throw_if_cancelled(token, "before start");

  std::shared_ptr<const CorpusSnapshot> snapshot;
  try {
    snapshot = snapshots_->current();
  } catch (const RetrievalError&) {
    throw;
  } catch (const RagError& e) {
    throw RetrievalError("Active corpus could not be loaded: " + std::string(e.what()));
  }
  if (!snapshot || !snapshot->search) {
    throw RetrievalError("No corpus has been published yet");
  }

  std::vector<float> query_vector = embedder_->embed_query(request.query_text, token);
  throw_if_cancelled(token, "after query embedding");

  std::vector<VectorHit> hits = search_with_retry(*snapshot->search, query_vector, request, token);
  throw_if_cancelled(token, "after vector search");

  hits.erase(std::remove_if(hits.begin(), hits.end(),
                            [&request](const VectorHit& hit) {
                              return hit.score < request.score_threshold;
                            }),
             hits.end());
  std::stable_sort(hits.begin(), hits.end(),
                   [](const VectorHit& a, const VectorHit& b) { return a.score > b.score; });

  RetrievalResult result;
  result.corpus_version = snapshot->manifest.version;

  std::unordered_set<std::string> seen_documents;
  for (const auto& hit : hits) {
    if (result.chunks.size() >= request.top_k) {
      break;
    }
    const ChunkDetailEntry* detail = snapshot->details.find(hit.id);
    if (!detail) {
      Event event{EventLevel::Warning, kComponent,
                  "RetrievalIntegrityWarning: no chunk details for search hit in version " +
                      snapshot->manifest.version,
                  hit.id};
      log_event(event);
      result.events.push_back(std::move(event));
      continue;
    }
    if (request.dedupe_by_document &&
        !seen_documents.insert(detail->source_document_name).second) {
      continue;
    }

    HydratedChunk chunk;
    chunk.chunk_id = hit.id;
    chunk.score = hit.score;
    chunk.text = detail->chunk_text;
    chunk.document_name = detail->source_document_name;
    chunk.index_in_document = detail->index_in_document;
    chunk.start_offset = detail->start_offset;
    result.chunks.push_back(std::move(chunk));
  }
  return result;
}

RetrievalRequest Retriever::make_request(const std::string& query_text) const {
  RetrievalRequest request;
  request.query_text = query_text;
  request.top_k = defaults_.top_k;
  request.score_threshold = defaults_.score_threshold;
  request.dedupe_by_document = defaults_.dedupe_by_document;
  return request;
}

std::string Retriever::format_citable_context(const std::vector<HydratedChunk>& chunks) {
  std::ostringstream context;
  for (size_t i = 0; i < chunks.size(); ++i) {
    context << "[" << (i + 1) << "] (source: " << chunks[i].document_name << ")\n"
            << chunks[i].text << "\n\n";
  }
  return context.str();
}

std::vector<VectorHit> Retriever::search_with_retry(VectorSearchClient& search,
                                                    const std::vector<float>& query_vector,
                                                    const RetrievalRequest& request,
                                                    const async::CancellationToken& token) const {
  // Dedupe drops hits after the search, so over-fetch for it
  const size_t fetch = request.dedupe_by_document ? request.top_k * 4 : request.top_k;

  for (int attempt = 0;; ++attempt) {
    try {
      return search.find_neighbors(query_vector, fetch, request.filters, token);
    } catch (const VectorSearchError& e) {
      if (!e.is_transient() || attempt >= 1) {
        throw RetrievalError("Vector search failed: " + std::string(e.what()));
      }
      std::cerr << "[" << kComponent << "] Vector search failed, retrying once: " << e.what()
                << std::endl;
      throw_if_cancelled(token, "before search retry");
    }
  }
}

}  // namespace rag_core
