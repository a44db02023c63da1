#include "rag_core/services/corpus_loader.hpp"

#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/search/faiss_vector_index.hpp"
#include "rag_core/services/ingestion_payload.hpp"

namespace rag_core {

CorpusLoader::CorpusLoader(std::shared_ptr<CorpusRepository> repository)
    : repository_(std::move(repository)) {
  if (!repository_) {
    throw ConfigurationError("CorpusLoader requires a repository");
  }
}

std::shared_ptr<const CorpusSnapshot> CorpusLoader::current() {
  std::optional<std::string> failed_version;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (snapshot_) {
      return snapshot_;
    }
    failed_version = failed_version_;
  }
  if (failed_version) {
    std::optional<CorpusManifest> manifest = repository_->active_manifest();
    if (manifest && manifest->version == *failed_version) {
      std::lock_guard<std::mutex> lock(snapshot_mutex_);
      throw CorpusDataError("Corpus version " + *failed_version +
                            " failed to load earlier: " + failed_reason_);
    }
  }
  refresh();
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

bool CorpusLoader::refresh() {
  std::lock_guard<std::mutex> reload_lock(reload_mutex_);

  std::optional<CorpusManifest> manifest = repository_->active_manifest();
  if (!manifest) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (snapshot_ && snapshot_->manifest.version == manifest->version) {
      return false;
    }
  }

  std::shared_ptr<const CorpusSnapshot> loaded;
  try {
    loaded = load(*manifest);
  } catch (const RagError& e) {
    std::cerr << "[CorpusLoader] Failed to load corpus version " << manifest->version << ": "
              << e.what() << std::endl;
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    failed_version_ = manifest->version;
    failed_reason_ = e.what();
    throw;
  }
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = loaded;
    failed_version_.reset();
    failed_reason_.clear();
  }
  std::cout << "[CorpusLoader] Loaded corpus version " << manifest->version << " ("
            << manifest->record_count << " chunks)" << std::endl;
  return true;
}

std::vector<EmbeddingRecord> CorpusLoader::read_payload(const CorpusRepository& repository,
                                                        const CorpusManifest& manifest) {
  std::vector<EmbeddingRecord> records;
  records.reserve(manifest.record_count);
  for (const auto& shard_key : manifest.payload_shards) {
    std::optional<std::string> content = repository.get_artifact(shard_key);
    if (!content) {
      throw CorpusDataError("Payload shard missing: " + shard_key);
    }
    std::vector<EmbeddingRecord> shard_records = parse_ingestion_shard(*content);
    records.insert(records.end(), std::make_move_iterator(shard_records.begin()),
                   std::make_move_iterator(shard_records.end()));
  }
  return records;
}

ChunkDetailMap CorpusLoader::read_chunk_map(const CorpusRepository& repository,
                                            const CorpusManifest& manifest) {
  std::optional<std::string> content = repository.get_artifact(manifest.chunk_map);
  if (!content) {
    throw CorpusDataError("Chunk-detail map missing: " + manifest.chunk_map);
  }
  return ChunkDetailMap::from_json_string(*content);
}

std::shared_ptr<const CorpusSnapshot> CorpusLoader::load(const CorpusManifest& manifest) const {
  std::vector<EmbeddingRecord> records = read_payload(*repository_, manifest);
  ChunkDetailMap details = read_chunk_map(*repository_, manifest);

  size_t unmapped = 0;
  for (const auto& record : records) {
    if (!details.contains(record.chunk_id)) {
      ++unmapped;
    }
  }
  if (unmapped > 0 || records.size() != details.size()) {
    std::cerr << "[CorpusLoader] Warning: version " << manifest.version << " has "
              << records.size() << " payload records and " << details.size()
              << " chunk-detail entries (" << unmapped << " records without details)"
              << std::endl;
  }

  const size_t dimension =
      manifest.dimension > 0 ? manifest.dimension
                             : (records.empty() ? 0 : records.front().vector.size());
  auto index = std::make_shared<FaissVectorIndex>(dimension);
  index->ingest(records);

  auto snapshot = std::make_shared<CorpusSnapshot>();
  snapshot->manifest = manifest;
  snapshot->details = std::move(details);
  snapshot->search = index;
  return snapshot;
}

}  // namespace rag_core
