#include "rag_core/errors.hpp"
#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

nlohmann::json CorpusManifest::to_json() const {
  nlohmann::json documents_json = nlohmann::json::array();
  for (const auto& document : documents) {
    documents_json.push_back({{"document_id", document.document_id},
                              {"content_hash", document.content_hash},
                              {"chunk_count", document.chunk_count}});
  }
  return nlohmann::json{{"version", version},
                        {"created_at", created_at},
                        {"payload_shards", payload_shards},
                        {"chunk_map", chunk_map},
                        {"record_count", record_count},
                        {"dimension", dimension},
                        {"index_signature", index_signature},
                        {"documents", documents_json}};
}

CorpusManifest CorpusManifest::from_json(const nlohmann::json& json) {
  try {
    CorpusManifest manifest;
    manifest.version = json.at("version").get<std::string>();
    manifest.created_at = json.value("created_at", std::string());
    manifest.payload_shards = json.at("payload_shards").get<std::vector<std::string>>();
    manifest.chunk_map = json.at("chunk_map").get<std::string>();
    manifest.record_count = json.value("record_count", static_cast<size_t>(0));
    manifest.dimension = json.value("dimension", static_cast<size_t>(0));
    manifest.index_signature = json.value("index_signature", std::string());
    if (json.contains("documents")) {
      for (const auto& document_json : json.at("documents")) {
        DocumentFingerprint document;
        document.document_id = document_json.at("document_id").get<std::string>();
        document.content_hash = document_json.at("content_hash").get<std::string>();
        document.chunk_count = document_json.value("chunk_count", static_cast<size_t>(0));
        manifest.documents.push_back(std::move(document));
      }
    }
    return manifest;
  } catch (const nlohmann::json::exception& e) {
    throw CorpusDataError("Malformed corpus manifest: " + std::string(e.what()));
  }
}

std::optional<DocumentFingerprint> CorpusManifest::find_document(
    const std::string& document_id) const {
  for (const auto& document : documents) {
    if (document.document_id == document_id) {
      return document;
    }
  }
  return std::nullopt;
}

}  // namespace rag_core
