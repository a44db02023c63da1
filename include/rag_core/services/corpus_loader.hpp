#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/search/vector_search_client.hpp"
#include "rag_core/services/chunk_detail_map.hpp"
#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

// Everything a query needs from one corpus version. Immutable once built.
struct CorpusSnapshot {
  CorpusManifest manifest;
  ChunkDetailMap details;
  std::shared_ptr<VectorSearchClient> search;
};

class SnapshotSource {
 public:
  virtual ~SnapshotSource() = default;
  // nullptr when no corpus has been published
  virtual std::shared_ptr<const CorpusSnapshot> current() = 0;
};

/**
 * @class CorpusLoader
 * @brief Loads the active corpus version into a CorpusSnapshot.
 *
 * The payload of the version is ingested into a FaissVectorIndex and paired
 * with the chunk-detail map of the same version. refresh() swaps in a new
 * snapshot when the active version changes; queries already holding the old
 * snapshot finish against it.
 */
class CorpusLoader : public SnapshotSource {
 public:
  explicit CorpusLoader(std::shared_ptr<CorpusRepository> repository);

  // Loads lazily on first use. A version that failed to load is not retried
  // here until it stops being the active one; refresh() always retries.
  std::shared_ptr<const CorpusSnapshot> current() override;

  /**
   * @brief Reloads if the active version differs from the loaded one.
   *
   * @return true if a new snapshot was swapped in.
   * @throw CorpusDataError or VectorSearchError if the active version cannot
   *        be loaded; the previous snapshot is kept.
   */
  bool refresh();

  static std::vector<EmbeddingRecord> read_payload(const CorpusRepository& repository,
                                                   const CorpusManifest& manifest);
  static ChunkDetailMap read_chunk_map(const CorpusRepository& repository,
                                       const CorpusManifest& manifest);

 private:
  std::shared_ptr<const CorpusSnapshot> load(const CorpusManifest& manifest) const;

  std::shared_ptr<CorpusRepository> repository_;
  // Serializes refreshes
  std::mutex reload_mutex_;
  // Guards snapshot_ itself
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const CorpusSnapshot> snapshot_;
  std::optional<std::string> failed_version_;
  std::string failed_reason_;
};

}  // namespace rag_core
