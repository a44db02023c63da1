#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/types/records.hpp"

namespace rag_core {

/**
 * @class ChunkDetailMap
 * @brief chunk_id -> chunk text and citation details.
 *
 * Serialized as one JSON object keyed by chunk id:
 * {"<id>": {"chunk_text", "source_document_name", "index_in_document", "start_offset"}}
 */
class ChunkDetailMap {
 public:
  // false if the id is already present; the existing entry is kept
  bool insert(const std::string& chunk_id, ChunkDetailEntry entry);

  // nullptr if absent
  const ChunkDetailEntry* find(const std::string& chunk_id) const;

  bool contains(const std::string& chunk_id) const {
    return entries_.count(chunk_id) > 0;
  }
  size_t size() const {
    return entries_.size();
  }
  bool empty() const {
    return entries_.empty();
  }

  // Sorted for stable output
  std::vector<std::string> chunk_ids() const;

  std::string to_json_string() const;
  // Throws CorpusDataError on malformed input
  static ChunkDetailMap from_json_string(const std::string& content);

 private:
  std::unordered_map<std::string, ChunkDetailEntry> entries_;
};

}  // namespace rag_core
