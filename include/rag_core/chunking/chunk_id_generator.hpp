#pragma once

#include <cstddef>
#include <string>

namespace rag_core {

enum class ChunkIdPolicy {
  // Derived from document id, position and text; stable across runs
  ContentDerived,
  // Fresh UUID v4 per chunk per run
  Random
};

std::string to_string(ChunkIdPolicy policy);
// Accepts "content" and "random"; throws ConfigurationError otherwise
ChunkIdPolicy chunk_id_policy_from_string(const std::string& str);

class ChunkIdGenerator {
 public:
  explicit ChunkIdGenerator(ChunkIdPolicy policy) : policy_(policy) {}

  std::string generate(const std::string& document_id,
                       int index_in_document,
                       size_t start_offset,
                       const std::string& text) const;

  ChunkIdPolicy policy() const {
    return policy_;
  }

 private:
  ChunkIdPolicy policy_;
};

}  // namespace rag_core
