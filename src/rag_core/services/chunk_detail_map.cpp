#include "rag_core/services/chunk_detail_map.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"

namespace rag_core {

bool ChunkDetailMap::insert(const std::string& chunk_id, ChunkDetailEntry entry) {
  return entries_.emplace(chunk_id, std::move(entry)).second;
}

const ChunkDetailEntry* ChunkDetailMap::find(const std::string& chunk_id) const {
  auto it = entries_.find(chunk_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> ChunkDetailMap::chunk_ids() const {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::string ChunkDetailMap::to_json_string() const {
  nlohmann::json json = nlohmann::json::object();
  for (const auto& [id, entry] : entries_) {
    json[id] = {{"chunk_text", entry.chunk_text},
                {"source_document_name", entry.source_document_name},
                {"index_in_document", entry.index_in_document},
                {"start_offset", entry.start_offset}};
  }
  return json.dump(2);
}

ChunkDetailMap ChunkDetailMap::from_json_string(const std::string& content) {
  ChunkDetailMap map;
  try {
    const nlohmann::json json = nlohmann::json::parse(content);
    if (!json.is_object()) {
      throw CorpusDataError("Chunk-detail map must be a JSON object");
    }
    for (const auto& [id, value] : json.items()) {
      ChunkDetailEntry entry;
      entry.chunk_text = value.at("chunk_text").get<std::string>();
      entry.source_document_name = value.at("source_document_name").get<std::string>();
      entry.index_in_document = value.value("index_in_document", 0);
      entry.start_offset = value.value("start_offset", static_cast<size_t>(0));
      map.insert(id, std::move(entry));
    }
  } catch (const nlohmann::json::exception& e) {
    throw CorpusDataError("Malformed chunk-detail map: " + std::string(e.what()));
  }
  return map;
}

}  // namespace rag_core
