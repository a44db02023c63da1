#include "rag_core/services/index_materializer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "rag_core/errors.hpp"
#include "rag_core/services/chunk_detail_map.hpp"
#include "rag_core/services/ingestion_payload.hpp"
#include "rag_core/util/hashing.hpp"
#include "rag_core/util/time_format.hpp"

namespace rag_core {

IndexMaterializer::IndexMaterializer(std::shared_ptr<CorpusRepository> repository,
                                     MaterializerOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw ConfigurationError("IndexMaterializer requires a repository");
  }
  if (options_.shard_max_bytes == 0) {
    throw ConfigurationError("indexing.shard_max_bytes must be greater than 0");
  }
}

CorpusManifest IndexMaterializer::materialize(const std::vector<IndexEntry>& entries,
                                              const std::string& version) {
  if (entries.empty()) {
    throw IndexPublishError("No embedding records to materialize for version " + version);
  }

  const size_t dimension = entries.front().record.vector.size();
  ChunkDetailMap detail_map;
  for (const auto& entry : entries) {
    if (entry.record.vector.size() != dimension) {
      throw IndexPublishError("Inconsistent embedding dimension for chunk " +
                              entry.record.chunk_id + ": expected " + std::to_string(dimension) +
                              ", got " + std::to_string(entry.record.vector.size()));
    }
    if (!detail_map.insert(entry.record.chunk_id, entry.detail)) {
      throw IndexPublishError("Duplicate chunk id in corpus: " + entry.record.chunk_id);
    }
  }

  CorpusManifest manifest;
  manifest.version = version;
  manifest.created_at = time_point_to_string(std::chrono::system_clock::now());
  manifest.record_count = entries.size();
  manifest.dimension = dimension;
  manifest.chunk_map = chunk_map_key(version);

  try {
    std::string shard;
    auto flush_shard = [&]() {
      const std::string key = shard_key(version, manifest.payload_shards.size());
      repository_->put_artifact(key, shard);
      manifest.payload_shards.push_back(key);
      shard.clear();
    };

    for (const auto& entry : entries) {
      const std::string line = to_ingestion_line(entry.record);
      if (!shard.empty() && shard.size() + line.size() > options_.shard_max_bytes) {
        flush_shard();
      }
      shard += line;
    }
    if (!shard.empty()) {
      flush_shard();
    }

    repository_->put_artifact(manifest.chunk_map, detail_map.to_json_string());
  } catch (const RepositoryError& e) {
    throw IndexPublishError("Failed to write artifacts for version " + version + ": " + e.what());
  }

  std::cout << "[IndexMaterializer] Version " << version << ": " << manifest.record_count
            << " records in " << manifest.payload_shards.size() << " shard(s)" << std::endl;
  return manifest;
}

void IndexMaterializer::publish(const CorpusManifest& manifest) {
  try {
    repository_->activate(manifest);
  } catch (const RepositoryError& e) {
    throw IndexPublishError("Failed to publish version " + manifest.version + ": " + e.what());
  }
  std::cout << "[IndexMaterializer] Published version " << manifest.version << std::endl;
}

size_t IndexMaterializer::prune(const std::set<std::string>& keep) {
  const std::string root = "versions/";
  std::set<std::string> stored;
  for (const auto& key : repository_->list_artifacts(root)) {
    const size_t end = key.find('/', root.size());
    if (end != std::string::npos) {
      stored.insert(key.substr(root.size(), end - root.size()));
    }
  }

  size_t removed = 0;
  for (const auto& version : stored) {
    if (keep.count(version) == 0) {
      removed += repository_->delete_artifacts(version_prefix(version));
      std::cout << "[IndexMaterializer] Pruned version " << version << std::endl;
    }
  }
  return removed;
}

std::string IndexMaterializer::new_version_id() {
  return time_point_to_compact_string(std::chrono::system_clock::now()) + "-" +
         random_uuid().substr(0, 8);
}

std::string IndexMaterializer::version_prefix(const std::string& version) {
  return "versions/" + version + "/";
}

std::string IndexMaterializer::shard_key(const std::string& version, size_t shard_index) {
  std::ostringstream ss;
  ss << version_prefix(version) << "embeddings/shard-" << std::setw(5) << std::setfill('0')
     << shard_index << ".jsonl";
  return ss.str();
}

std::string IndexMaterializer::chunk_map_key(const std::string& version) {
  return version_prefix(version) + "metadata/id_to_chunk_details_map.json";
}

}  // namespace rag_core
