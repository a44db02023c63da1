#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rag_core {

struct DocumentFingerprint {
  std::string document_id;
  std::string content_hash;
  size_t chunk_count = 0;
};

/**
 * @brief Describes one published corpus version.
 *
 * The payload shards and chunk-detail map it names are written before the
 * manifest is activated and are never modified afterwards.
 */
struct CorpusManifest {
  std::string version;
  std::string created_at;
  std::vector<std::string> payload_shards;
  std::string chunk_map;
  size_t record_count = 0;
  size_t dimension = 0;
  // Chunking options, id policy, embedding model and dimension the version
  // was built with; a prior version is only reused when these match
  std::string index_signature;
  std::vector<DocumentFingerprint> documents;

  nlohmann::json to_json() const;
  // Throws CorpusDataError on malformed input
  static CorpusManifest from_json(const nlohmann::json& json);

  std::optional<DocumentFingerprint> find_document(const std::string& document_id) const;
};

// Persisted outcome of one indexing run
struct RunRecord {
  std::string run_id;
  std::string started_at;
  std::string finished_at;
  // Empty when the run did not publish
  std::string version;
  std::string status;
  std::string summary_json;
};

// Held while a run is materializing and publishing; releases on destruction
class PublishLock {
 public:
  virtual ~PublishLock() = default;
  virtual const std::string& owner() const = 0;
};

/**
 * @class CorpusRepository
 * @brief Storage for corpus artifacts, versions and run history.
 *
 * Artifacts are immutable blobs addressed by key. A version becomes visible
 * to readers only through activate(), which switches the active-version
 * pointer in one step.
 */
class CorpusRepository {
 public:
  virtual ~CorpusRepository() = default;

  // Throws IndexPublishError if the key already exists
  virtual void put_artifact(const std::string& key, const std::string& content) = 0;
  virtual std::optional<std::string> get_artifact(const std::string& key) const = 0;
  // Keys starting with prefix, sorted
  virtual std::vector<std::string> list_artifacts(const std::string& prefix) const = 0;
  // Removes every artifact whose key starts with prefix; returns how many
  virtual size_t delete_artifacts(const std::string& prefix) = 0;

  /**
   * @brief Records the manifest and makes it the active version atomically.
   *
   * @throw IndexPublishError if an artifact the manifest names is missing or
   *        the version already exists. The previous version stays active.
   */
  virtual void activate(const CorpusManifest& manifest) = 0;
  virtual std::optional<CorpusManifest> active_manifest() const = 0;

  /**
   * @brief Acquires the single publish lock.
   *
   * A lock older than stale_after is considered abandoned and taken over.
   *
   * @throw IndexPublishError if another owner holds a live lock.
   */
  virtual std::unique_ptr<PublishLock> acquire_publish_lock(const std::string& owner,
                                                            std::chrono::minutes stale_after) = 0;

  virtual void record_run(const RunRecord& run) = 0;
  // Newest first
  virtual std::vector<RunRecord> recent_runs(size_t limit) const = 0;
};

}  // namespace rag_core
