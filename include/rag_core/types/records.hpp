#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

// Restrict namespaces attached to every embedding record
inline constexpr const char* SOURCE_DOCUMENT_NAMESPACE = "source_document";
inline constexpr const char* CHUNK_INDEX_NAMESPACE = "chunk_index";

// Coarse filter label carried by a record in the ingestion payload
struct Restrict {
  std::string namespace_name;
  std::vector<std::string> allow;
};

struct EmbeddingRecord {
  std::string chunk_id;
  std::vector<float> vector;
  std::vector<Restrict> restrict_tags;
};

struct ChunkDetailEntry {
  std::string chunk_text;
  std::string source_document_name;
  int index_in_document = 0;
  size_t start_offset = 0;
};

// One embedded chunk on its way into the index. The materializer writes the
// payload line and the map entry from the same IndexEntry, which keeps the two
// artifacts keyed by the same id set.
struct IndexEntry {
  EmbeddingRecord record;
  ChunkDetailEntry detail;
};

struct HydratedChunk {
  std::string chunk_id;
  float score = 0.0f;
  std::string text;
  std::string document_name;
  int index_in_document = 0;
  size_t start_offset = 0;
};

std::vector<Restrict> restricts_for(const Chunk& chunk);
ChunkDetailEntry detail_for(const Chunk& chunk);

}  // namespace rag_core
