#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/services/indexing_pipeline.hpp"
#include "rag_core/services/retriever.hpp"
#include "rag_core/storage/corpus_repository.hpp"

namespace rag_api {

class BadRequestError : public std::exception {
 public:
  explicit BadRequestError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Builds a retrieval request from a POST /api/retrieve body.
 *
 * Missing fields take the retriever's defaults. "filters" is an array of
 * {"namespace": ..., "allow": [...]} objects.
 *
 * @throw BadRequestError for a missing query or a field of the wrong type.
 */
rag_core::RetrievalRequest retrieval_request_from_json(const nlohmann::json &body,
                                                       const rag_core::RetrieverOptions &defaults);

nlohmann::json hydrated_chunk_to_json(const rag_core::HydratedChunk &chunk);

// {corpus_version, results[], context, warnings[]}
nlohmann::json retrieval_result_to_json(const rag_core::RetrievalResult &result);

// Manifest without the per-document list
nlohmann::json manifest_summary_to_json(const rag_core::CorpusManifest &manifest);

nlohmann::json run_record_to_json(const rag_core::RunRecord &run);

}  // namespace rag_api
