#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "rag_core/storage/corpus_repository.hpp"
#include "rag_core/types/records.hpp"

namespace rag_core {

struct MaterializerOptions {
  // A shard is closed before the next line would push it past this size
  size_t shard_max_bytes = 8 * 1024 * 1024;
};

/**
 * @class IndexMaterializer
 * @brief Writes the ingestion payload and chunk-detail map of one corpus
 * version and publishes it.
 *
 * Layout under the version prefix:
 *   versions/<version>/embeddings/shard-00000.jsonl ...
 *   versions/<version>/metadata/id_to_chunk_details_map.json
 *
 * materialize() only writes fresh keys, so readers keep seeing the active
 * version until publish() switches the pointer.
 */
class IndexMaterializer {
 public:
  IndexMaterializer(std::shared_ptr<CorpusRepository> repository, MaterializerOptions options);

  /**
   * @brief Writes payload shards and the chunk-detail map for the entries.
   *
   * @return A manifest naming the written artifacts. Document fingerprints
   *         and the index signature are left for the caller to fill in.
   * @throw IndexPublishError on an empty entry set, duplicate chunk ids,
   *        inconsistent vector dimensions or a repository write failure.
   */
  CorpusManifest materialize(const std::vector<IndexEntry>& entries, const std::string& version);

  // Makes the manifest's version the active one. Throws IndexPublishError.
  void publish(const CorpusManifest& manifest);

  /**
   * @brief Deletes the artifacts of every stored version not in keep.
   * @return Number of artifacts removed.
   * @throw RepositoryError if the repository cannot list or delete.
   */
  size_t prune(const std::set<std::string>& keep);

  // UTC timestamp plus a random suffix, e.g. 20260101T120000Z-1a2b3c4d
  static std::string new_version_id();

  static std::string version_prefix(const std::string& version);
  static std::string shard_key(const std::string& version, size_t shard_index);
  static std::string chunk_map_key(const std::string& version);

 private:
  std::shared_ptr<CorpusRepository> repository_;
  MaterializerOptions options_;
};

}  // namespace rag_core
