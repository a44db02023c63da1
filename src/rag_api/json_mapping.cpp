#include "rag_api/json_mapping.hpp"

#include <cstdint>

namespace rag_api {

rag_core::RetrievalRequest retrieval_request_from_json(const nlohmann::json &body,
                                                       const rag_core::RetrieverOptions &defaults) {
  if (!body.is_object()) {
    throw BadRequestError("Request body must be a JSON object");
  }

  rag_core::RetrievalRequest request;
  try {
    request.query_text = body.value("query", std::string());
    const int64_t top_k = body.value("top_k", static_cast<int64_t>(defaults.top_k));
    if (top_k <= 0 || top_k > static_cast<int64_t>(rag_core::MAX_TOP_K)) {
      throw BadRequestError("top_k must be between 1 and " + std::to_string(rag_core::MAX_TOP_K));
    }
    request.top_k = static_cast<size_t>(top_k);
    request.score_threshold = body.value("score_threshold", defaults.score_threshold);
    request.dedupe_by_document = body.value("dedupe_by_document", defaults.dedupe_by_document);

    if (body.contains("filters")) {
      const nlohmann::json &filters = body.at("filters");
      if (!filters.is_array()) {
        throw BadRequestError("filters must be an array");
      }
      for (const auto &filter : filters) {
        rag_core::RestrictFilter restrict;
        restrict.namespace_name = filter.at("namespace").get<std::string>();
        restrict.allow = filter.at("allow").get<std::vector<std::string>>();
        request.filters.push_back(std::move(restrict));
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw BadRequestError(std::string("Invalid request field: ") + e.what());
  }

  if (request.query_text.empty()) {
    throw BadRequestError("query is required");
  }
  return request;
}

nlohmann::json hydrated_chunk_to_json(const rag_core::HydratedChunk &chunk) {
  return {{"chunk_id", chunk.chunk_id},
          {"score", chunk.score},
          {"text", chunk.text},
          {"document_name", chunk.document_name},
          {"index_in_document", chunk.index_in_document},
          {"start_offset", chunk.start_offset}};
}

nlohmann::json retrieval_result_to_json(const rag_core::RetrievalResult &result) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &chunk : result.chunks) {
    results.push_back(hydrated_chunk_to_json(chunk));
  }

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto &event : result.events) {
    if (event.level == rag_core::EventLevel::Warning || event.level == rag_core::EventLevel::Error) {
      warnings.push_back({{"message", event.message}, {"chunk_id", event.subject}});
    }
  }

  return {{"corpus_version", result.corpus_version},
          {"results", results},
          {"context", rag_core::Retriever::format_citable_context(result.chunks)},
          {"warnings", warnings}};
}

nlohmann::json manifest_summary_to_json(const rag_core::CorpusManifest &manifest) {
  return {{"version", manifest.version},
          {"created_at", manifest.created_at},
          {"record_count", manifest.record_count},
          {"dimension", manifest.dimension},
          {"document_count", manifest.documents.size()},
          {"payload_shards", manifest.payload_shards},
          {"chunk_map", manifest.chunk_map},
          {"index_signature", manifest.index_signature}};
}

nlohmann::json run_record_to_json(const rag_core::RunRecord &run) {
  nlohmann::json json = {{"run_id", run.run_id},
                         {"started_at", run.started_at},
                         {"finished_at", run.finished_at},
                         {"version", run.version},
                         {"status", run.status}};
  // summary_json was written by RunSummary::to_json
  nlohmann::json summary = nlohmann::json::parse(run.summary_json, nullptr, false);
  json["summary"] = summary.is_discarded() ? nlohmann::json() : summary;
  return json;
}

}  // namespace rag_api
