#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/types/records.hpp"

namespace rag_core {

// {"id": ..., "embedding": [...], "restricts": [{"namespace": ..., "allow": [...]}]}
nlohmann::json to_ingestion_json(const EmbeddingRecord& record);
EmbeddingRecord from_ingestion_json(const nlohmann::json& json);

// One newline-terminated payload line
std::string to_ingestion_line(const EmbeddingRecord& record);

// Parses a newline-delimited shard. Blank lines are ignored.
// Throws CorpusDataError on a malformed line.
std::vector<EmbeddingRecord> parse_ingestion_shard(const std::string& content);

}  // namespace rag_core
