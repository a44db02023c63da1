#include "rag_core/chunking/chunk_id_generator.hpp"

#include "rag_core/errors.hpp"
#include "rag_core/util/hashing.hpp"

namespace rag_core {

std::string to_string(ChunkIdPolicy policy) {
  switch (policy) {
    case ChunkIdPolicy::Random:
      return "random";
    default:
      return "content";
  }
}

ChunkIdPolicy chunk_id_policy_from_string(const std::string& str) {
  if (str == "content")
    return ChunkIdPolicy::ContentDerived;
  if (str == "random")
    return ChunkIdPolicy::Random;
  throw ConfigurationError("Unknown chunk id policy '" + str + "'. Expected 'content' or 'random'.");
}

std::string ChunkIdGenerator::generate(const std::string& document_id,
                                       int index_in_document,
                                       size_t start_offset,
                                       const std::string& text) const {
  if (policy_ == ChunkIdPolicy::Random) {
    return random_uuid();
  }

  // NUL-separated fields
  std::string material;
  material.reserve(document_id.size() + text.size() + 32);
  material.append(document_id);
  material.push_back('\0');
  material.append(std::to_string(index_in_document));
  material.push_back('\0');
  material.append(std::to_string(start_offset));
  material.push_back('\0');
  material.append(text);

  // UUID-shaped prefix of the digest
  const std::string digest = sha256_hex(material);
  return digest.substr(0, 8) + "-" + digest.substr(8, 4) + "-" + digest.substr(12, 4) + "-" +
         digest.substr(16, 4) + "-" + digest.substr(20, 12);
}

}  // namespace rag_core
