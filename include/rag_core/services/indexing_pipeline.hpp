#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/services/embedder.hpp"
#include "rag_core/services/index_materializer.hpp"
#include "rag_core/storage/corpus_repository.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

class DocumentLoaderFactory;
class Embedder;

struct IndexingOptions {
  size_t document_concurrency = 4;
  // Carry unchanged documents forward from the active version
  bool reuse_unchanged_documents = true;
  std::chrono::minutes stale_lock_after{60};
  // After a publish, drop stored versions older than the one it replaced
  bool prune_superseded_versions = true;
  // Part of the index signature; a model change invalidates reuse
  std::string embedding_model;
};

enum class DocumentStatus { Indexed, Partial, Reused, Skipped, Failed };

std::string to_string(DocumentStatus status);

struct DocumentOutcome {
  std::string document_id;
  DocumentStatus status = DocumentStatus::Failed;
  size_t chunks_total = 0;
  size_t chunks_embedded = 0;
  size_t chunks_failed = 0;
  std::string error;
};

struct RunSummary {
  std::string run_id;
  std::string started_at;
  std::string finished_at;
  // Version published by this run; empty if nothing was published
  std::string version;
  bool published = false;

  size_t documents_succeeded = 0;
  size_t documents_failed = 0;
  size_t documents_skipped = 0;
  size_t documents_reused = 0;
  size_t chunks_embedded = 0;
  size_t chunks_failed = 0;

  std::vector<EmbeddingFailure> embedding_failures;
  std::vector<DocumentOutcome> documents;
  std::vector<Event> events;
  std::string publish_error;

  // "published" or "failed"
  std::string status() const;
  nlohmann::json to_json() const;
};

/**
 * @class IndexingPipeline
 * @brief Runs one offline indexing job over a source directory.
 *
 * Documents are loaded, chunked and embedded on a pool of
 * document_concurrency threads; a document that fails does not stop the
 * others. Every chunk that was embedded is materialized into a new corpus
 * version which is then published. The whole run holds the repository's
 * publish lock, so only one run can be active at a time.
 */
class IndexingPipeline {
 public:
  /**
   * @throw ConfigurationError if the chunking options are invalid or a
   *        dependency is missing.
   */
  IndexingPipeline(std::shared_ptr<CorpusRepository> repository,
                   std::shared_ptr<DocumentLoaderFactory> loader_factory,
                   std::shared_ptr<Embedder> embedder,
                   ChunkerOptions chunker_options,
                   MaterializerOptions materializer_options,
                   IndexingOptions options);

  /**
   * @brief Indexes every supported file below source_dir and publishes.
   *
   * Per-document and per-batch problems are reported in the summary. A
   * failure to publish leaves the previous version active and is reported
   * in publish_error.
   *
   * @throw ConfigurationError if source_dir is not a directory.
   * @throw IndexPublishError if another run holds the publish lock.
   */
  RunSummary run(const std::filesystem::path& source_dir);

  // Describes everything that must match for a prior version to be reused
  std::string index_signature() const;

  IndexingPipeline(const IndexingPipeline&) = delete;
  IndexingPipeline& operator=(const IndexingPipeline&) = delete;

 private:
  struct SourceFile {
    std::filesystem::path path;
    std::string document_id;
  };

  struct DocumentWork {
    DocumentOutcome outcome;
    std::string content_hash;
    std::vector<IndexEntry> entries;
    std::vector<EmbeddingFailure> failures;
    std::vector<Event> events;
  };

  using PriorEntries = std::unordered_map<std::string, std::vector<IndexEntry>>;

  static std::vector<SourceFile> list_source_files(const std::filesystem::path& source_dir);

  // Entries of the active version grouped by document, when reuse applies
  PriorEntries load_reusable_entries(const std::optional<CorpusManifest>& active,
                                     std::vector<Event>& events) const;

  DocumentWork process_document(const SourceFile& file,
                                const std::optional<CorpusManifest>& active,
                                const PriorEntries& prior) const;

  void publish_entries(const std::vector<IndexEntry>& entries,
                       const std::vector<DocumentFingerprint>& fingerprints,
                       const std::optional<CorpusManifest>& previous,
                       RunSummary& summary);
  void prune_superseded(const std::string& published,
                        const std::optional<CorpusManifest>& previous,
                        RunSummary& summary);

  std::shared_ptr<CorpusRepository> repository_;
  std::shared_ptr<DocumentLoaderFactory> loader_factory_;
  std::shared_ptr<Embedder> embedder_;
  TextChunker chunker_;
  IndexMaterializer materializer_;
  IndexingOptions options_;
};

}  // namespace rag_core
