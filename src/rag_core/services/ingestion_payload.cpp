#include "rag_core/services/ingestion_payload.hpp"

#include <sstream>

#include "rag_core/errors.hpp"

namespace rag_core {

nlohmann::json to_ingestion_json(const EmbeddingRecord& record) {
  nlohmann::json restricts = nlohmann::json::array();
  for (const auto& restrict_tag : record.restrict_tags) {
    restricts.push_back({{"namespace", restrict_tag.namespace_name},
                         {"allow", restrict_tag.allow}});
  }
  return nlohmann::json{{"id", record.chunk_id},
                        {"embedding", record.vector},
                        {"restricts", restricts}};
}

EmbeddingRecord from_ingestion_json(const nlohmann::json& json) {
  EmbeddingRecord record;
  record.chunk_id = json.at("id").get<std::string>();
  record.vector = json.at("embedding").get<std::vector<float>>();
  if (json.contains("restricts")) {
    for (const auto& restrict_json : json.at("restricts")) {
      Restrict restrict_tag;
      restrict_tag.namespace_name = restrict_json.at("namespace").get<std::string>();
      restrict_tag.allow = restrict_json.at("allow").get<std::vector<std::string>>();
      record.restrict_tags.push_back(std::move(restrict_tag));
    }
  }
  return record;
}

std::string to_ingestion_line(const EmbeddingRecord& record) {
  return to_ingestion_json(record).dump() + "\n";
}

std::vector<EmbeddingRecord> parse_ingestion_shard(const std::string& content) {
  std::vector<EmbeddingRecord> records;
  std::istringstream stream(content);
  std::string line;
  size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      records.push_back(from_ingestion_json(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::exception& e) {
      throw CorpusDataError("Malformed payload line " + std::to_string(line_number) + ": " +
                            e.what());
    }
  }
  return records;
}

}  // namespace rag_core
