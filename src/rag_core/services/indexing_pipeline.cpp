#include "rag_core/services/indexing_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <set>
#include <sstream>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/extractors/document_loader_factory.hpp"
#include "rag_core/services/chunk_detail_map.hpp"
#include "rag_core/services/corpus_loader.hpp"
#include "rag_core/services/embedder.hpp"
#include "rag_core/util/hashing.hpp"
#include "rag_core/util/time_format.hpp"

namespace rag_core {

namespace {

const char* const kComponent = "IndexingPipeline";

Event info(const std::string& message, const std::string& subject = "") {
  return Event{EventLevel::Info, kComponent, message, subject};
}

Event warning(const std::string& message, const std::string& subject = "") {
  return Event{EventLevel::Warning, kComponent, message, subject};
}

Event error(const std::string& message, const std::string& subject = "") {
  return Event{EventLevel::Error, kComponent, message, subject};
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string now_string() {
  return time_point_to_string(std::chrono::system_clock::now());
}

}  // namespace

std::string to_string(DocumentStatus status) {
  switch (status) {
    case DocumentStatus::Indexed:
      return "indexed";
    case DocumentStatus::Partial:
      return "partial";
    case DocumentStatus::Reused:
      return "reused";
    case DocumentStatus::Skipped:
      return "skipped";
    case DocumentStatus::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

std::string RunSummary::status() const {
  return published ? "published" : "failed";
}

nlohmann::json RunSummary::to_json() const {
  nlohmann::json documents_json = nlohmann::json::array();
  for (const auto& doc : documents) {
    nlohmann::json entry = {{"document_id", doc.document_id},
                            {"status", to_string(doc.status)},
                            {"chunks_total", doc.chunks_total},
                            {"chunks_embedded", doc.chunks_embedded},
                            {"chunks_failed", doc.chunks_failed}};
    if (!doc.error.empty()) {
      entry["error"] = doc.error;
    }
    documents_json.push_back(std::move(entry));
  }

  nlohmann::json failures_json = nlohmann::json::array();
  for (const auto& failure : embedding_failures) {
    failures_json.push_back(
        {{"failed_chunk_ids", failure.failed_chunk_ids}, {"cause", failure.cause}});
  }

  nlohmann::json events_json = nlohmann::json::array();
  for (const auto& event : events) {
    events_json.push_back({{"level", to_string(event.level)},
                           {"component", event.component},
                           {"message", event.message},
                           {"subject", event.subject}});
  }

  return {{"run_id", run_id},
          {"started_at", started_at},
          {"finished_at", finished_at},
          {"version", version},
          {"status", status()},
          {"published", published},
          {"documents_succeeded", documents_succeeded},
          {"documents_failed", documents_failed},
          {"documents_skipped", documents_skipped},
          {"documents_reused", documents_reused},
          {"chunks_embedded", chunks_embedded},
          {"chunks_failed", chunks_failed},
          {"publish_error", publish_error},
          {"embedding_failures", failures_json},
          {"documents", documents_json},
          {"events", events_json}};
}

IndexingPipeline::IndexingPipeline(std::shared_ptr<CorpusRepository> repository,
                                   std::shared_ptr<DocumentLoaderFactory> loader_factory,
                                   std::shared_ptr<Embedder> embedder,
                                   ChunkerOptions chunker_options,
                                   MaterializerOptions materializer_options,
                                   IndexingOptions options)
    : repository_(std::move(repository)),
      loader_factory_(std::move(loader_factory)),
      embedder_(std::move(embedder)),
      chunker_(chunker_options),
      materializer_(repository_, materializer_options),
      options_(std::move(options)) {
  if (!repository_ || !loader_factory_ || !embedder_) {
    throw ConfigurationError(
        "IndexingPipeline requires a repository, a loader factory and an embedder");
  }
  if (options_.document_concurrency == 0) {
    throw ConfigurationError("indexing.document_concurrency must be greater than 0");
  }
}

std::string IndexingPipeline::index_signature() const {
  std::ostringstream signature;
  signature << "max_size=" << chunker_.options().max_size
            << ";overlap=" << chunker_.options().overlap
            << ";id_policy=" << to_string(chunker_.options().id_policy)
            << ";dimension=" << embedder_->options().dimension
            << ";model=" << options_.embedding_model;
  return signature.str();
}

RunSummary IndexingPipeline::run(const std::filesystem::path& source_dir) {
  if (!std::filesystem::is_directory(source_dir)) {
    throw ConfigurationError("Source directory does not exist: " + source_dir.string());
  }

  RunSummary summary;
  summary.run_id = random_uuid();
  summary.started_at = now_string();

  std::unique_ptr<PublishLock> lock =
      repository_->acquire_publish_lock("run-" + summary.run_id, options_.stale_lock_after);

  auto emit = [&summary](Event event) {
    log_event(event);
    summary.events.push_back(std::move(event));
  };

  emit(info("Step 1/4: Listing documents in " + source_dir.string()));
  const std::vector<SourceFile> files = list_source_files(source_dir);
  emit(info("Found " + std::to_string(files.size()) + " files"));

  const std::optional<CorpusManifest> active = repository_->active_manifest();
  std::vector<Event> reuse_events;
  const PriorEntries prior = load_reusable_entries(active, reuse_events);
  for (auto& event : reuse_events) {
    emit(std::move(event));
  }

  emit(info("Step 2/4: Chunking and embedding documents"));
  std::vector<DocumentWork> work(files.size());
  {
    async::WorkerPool pool(std::max<size_t>(1, std::min(options_.document_concurrency,
                                                        files.size())),
                           "DocumentPool");
    std::vector<std::future<DocumentWork>> futures;
    futures.reserve(files.size());
    for (const auto& file : files) {
      futures.push_back(pool.submit(
          [this, &file, &active, &prior] { return process_document(file, active, prior); }));
    }
    for (size_t i = 0; i < futures.size(); ++i) {
      try {
        work[i] = futures[i].get();
      } catch (const std::exception& e) {
        work[i].outcome.document_id = files[i].document_id;
        work[i].outcome.status = DocumentStatus::Failed;
        work[i].outcome.error = e.what();
        work[i].events.push_back(
            error("Document failed: " + std::string(e.what()), files[i].document_id));
      }
    }
  }

  std::vector<IndexEntry> entries;
  std::vector<DocumentFingerprint> fingerprints;
  for (auto& item : work) {
    for (auto& event : item.events) {
      emit(std::move(event));
    }
    DocumentOutcome& outcome = item.outcome;
    switch (outcome.status) {
      case DocumentStatus::Indexed:
      case DocumentStatus::Partial:
        ++summary.documents_succeeded;
        break;
      case DocumentStatus::Reused:
        ++summary.documents_reused;
        break;
      case DocumentStatus::Skipped:
        ++summary.documents_skipped;
        break;
      case DocumentStatus::Failed:
        ++summary.documents_failed;
        break;
    }
    summary.chunks_embedded += outcome.chunks_embedded;
    summary.chunks_failed += outcome.chunks_failed;
    for (auto& failure : item.failures) {
      summary.embedding_failures.push_back(std::move(failure));
    }
    if (!item.entries.empty()) {
      fingerprints.push_back(
          DocumentFingerprint{outcome.document_id, item.content_hash, outcome.chunks_total});
      entries.insert(entries.end(), std::make_move_iterator(item.entries.begin()),
                     std::make_move_iterator(item.entries.end()));
    }
    summary.documents.push_back(std::move(outcome));
  }

  emit(info("Step 3/4: Materializing " + std::to_string(entries.size()) + " chunks"));
  if (entries.empty()) {
    emit(error(active ? "No chunks to publish; version " + active->version + " stays active"
                      : "No chunks to publish"));
    summary.publish_error = "No chunks to publish";
  } else {
    publish_entries(entries, fingerprints, active, summary);
  }

  summary.finished_at = now_string();
  emit(info("Step 4/4: Run " + summary.run_id + " " + summary.status() + ": " +
            std::to_string(summary.documents_succeeded) + " documents indexed, " +
            std::to_string(summary.documents_reused) + " reused, " +
            std::to_string(summary.documents_skipped) + " skipped, " +
            std::to_string(summary.documents_failed) + " failed; " +
            std::to_string(summary.chunks_embedded) + " chunks embedded, " +
            std::to_string(summary.chunks_failed) + " failed"));

  RunRecord record;
  record.run_id = summary.run_id;
  record.started_at = summary.started_at;
  record.finished_at = summary.finished_at;
  record.version = summary.version;
  record.status = summary.status();
  record.summary_json = summary.to_json().dump();
  try {
    repository_->record_run(record);
  } catch (const RepositoryError& e) {
    emit(warning("Failed to record run history: " + std::string(e.what())));
  }
  return summary;
}

std::vector<IndexingPipeline::SourceFile> IndexingPipeline::list_source_files(
    const std::filesystem::path& source_dir) {
  std::vector<SourceFile> files;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(source_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    SourceFile file;
    file.path = entry.path();
    file.document_id = std::filesystem::relative(entry.path(), source_dir).generic_string();
    files.push_back(std::move(file));
  }
  std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.document_id < b.document_id;
  });
  return files;
}

IndexingPipeline::PriorEntries IndexingPipeline::load_reusable_entries(
    const std::optional<CorpusManifest>& active,
    std::vector<Event>& events) const {
  PriorEntries prior;
  if (!options_.reuse_unchanged_documents || !active) {
    return prior;
  }
  if (active->index_signature != index_signature()) {
    events.push_back(info("Index settings changed since version " + active->version +
                          "; re-embedding all documents"));
    return prior;
  }

  try {
    std::vector<EmbeddingRecord> records = CorpusLoader::read_payload(*repository_, *active);
    ChunkDetailMap details = CorpusLoader::read_chunk_map(*repository_, *active);
    for (auto& record : records) {
      const ChunkDetailEntry* detail = details.find(record.chunk_id);
      if (!detail) {
        continue;
      }
      const std::string document_id = detail->source_document_name;
      prior[document_id].push_back(IndexEntry{std::move(record), *detail});
    }
  } catch (const CorpusDataError& e) {
    events.push_back(warning("Cannot reuse version " + active->version + ": " + e.what()));
    prior.clear();
    return prior;
  }

  for (auto& [document_id, entries] : prior) {
    std::sort(entries.begin(), entries.end(), [](const IndexEntry& a, const IndexEntry& b) {
      return a.detail.index_in_document < b.detail.index_in_document;
    });
  }
  return prior;
}

IndexingPipeline::DocumentWork IndexingPipeline::process_document(
    const SourceFile& file,
    const std::optional<CorpusManifest>& active,
    const PriorEntries& prior) const {
  DocumentWork work;
  work.outcome.document_id = file.document_id;

  const DocumentLoader* loader = loader_factory_->find_loader_for(file.path);
  if (!loader) {
    work.outcome.status = DocumentStatus::Skipped;
    work.outcome.error = "unsupported file type";
    work.events.push_back(warning("Skipping unsupported file type", file.document_id));
    return work;
  }

  Document document;
  try {
    document = loader->load(file.path, file.document_id);
  } catch (const DocumentLoadError& e) {
    work.outcome.status = DocumentStatus::Failed;
    work.outcome.error = e.what();
    work.events.push_back(error("Failed to load document: " + std::string(e.what()),
                                file.document_id));
    return work;
  }
  work.content_hash = document.content_hash;

  if (is_blank(document.text)) {
    work.outcome.status = DocumentStatus::Skipped;
    work.outcome.error = "empty content";
    work.events.push_back(warning("Skipping document with empty content", file.document_id));
    return work;
  }

  if (active) {
    const std::optional<DocumentFingerprint> fingerprint = active->find_document(file.document_id);
    const auto prior_it = prior.find(file.document_id);
    if (fingerprint && prior_it != prior.end() &&
        fingerprint->content_hash == document.content_hash &&
        prior_it->second.size() == fingerprint->chunk_count) {
      work.entries = prior_it->second;
      work.outcome.status = DocumentStatus::Reused;
      work.outcome.chunks_total = fingerprint->chunk_count;
      work.events.push_back(Event{EventLevel::Debug, kComponent,
                                  "Reusing " + std::to_string(fingerprint->chunk_count) +
                                      " chunks from version " + active->version,
                                  file.document_id});
      return work;
    }
  }

  const std::vector<Chunk> chunks = chunker_.chunk(document);
  work.outcome.chunks_total = chunks.size();

  ChunkEmbeddingResult embedded = embedder_->embed_chunks(chunks);
  for (auto& event : embedded.events) {
    event.subject = file.document_id;
    work.events.push_back(std::move(event));
  }

  std::unordered_map<std::string, const Chunk*> by_id;
  for (const auto& chunk : chunks) {
    by_id.emplace(chunk.chunk_id, &chunk);
  }
  for (auto& record : embedded.records) {
    const Chunk* chunk = by_id.at(record.chunk_id);
    work.entries.push_back(IndexEntry{std::move(record), detail_for(*chunk)});
  }

  work.outcome.chunks_embedded = work.entries.size();
  work.outcome.chunks_failed = embedded.failed_chunk_count();
  work.failures = std::move(embedded.failures);

  if (work.outcome.chunks_failed == 0) {
    work.outcome.status = DocumentStatus::Indexed;
  } else if (work.outcome.chunks_embedded > 0) {
    work.outcome.status = DocumentStatus::Partial;
    work.outcome.error = work.failures.front().cause;
  } else {
    work.outcome.status = DocumentStatus::Failed;
    work.outcome.error = work.failures.front().cause;
  }
  work.events.push_back(Event{EventLevel::Debug, kComponent,
                              "Embedded " + std::to_string(work.outcome.chunks_embedded) + "/" +
                                  std::to_string(work.outcome.chunks_total) + " chunks",
                              file.document_id});
  return work;
}

void IndexingPipeline::publish_entries(const std::vector<IndexEntry>& entries,
                                       const std::vector<DocumentFingerprint>& fingerprints,
                                       const std::optional<CorpusManifest>& previous,
                                       RunSummary& summary) {
  try {
    CorpusManifest manifest = materializer_.materialize(entries, IndexMaterializer::new_version_id());
    manifest.documents = fingerprints;
    manifest.index_signature = index_signature();
    materializer_.publish(manifest);
    summary.version = manifest.version;
    summary.published = true;
    Event event = info("Published version " + manifest.version + " with " +
                       std::to_string(manifest.record_count) + " chunks in " +
                       std::to_string(manifest.payload_shards.size()) + " payload shards");
    log_event(event);
    summary.events.push_back(std::move(event));
  } catch (const IndexPublishError& e) {
    summary.publish_error = e.what();
    Event event = error("Publish failed, previous version stays active: " + std::string(e.what()));
    log_event(event);
    summary.events.push_back(std::move(event));
    return;
  }

  if (options_.prune_superseded_versions) {
    prune_superseded(summary.version, previous, summary);
  }
}

// The replaced version stays readable for snapshots still serving it
void IndexingPipeline::prune_superseded(const std::string& published,
                                        const std::optional<CorpusManifest>& previous,
                                        RunSummary& summary) {
  std::set<std::string> keep{published};
  if (previous) {
    keep.insert(previous->version);
  }
  try {
    const size_t removed = materializer_.prune(keep);
    if (removed > 0) {
      Event event = info("Pruned " + std::to_string(removed) + " artifacts of superseded versions");
      log_event(event);
      summary.events.push_back(std::move(event));
    }
  } catch (const RepositoryError& e) {
    Event event = warning("Pruning superseded versions failed: " + std::string(e.what()));
    log_event(event);
    summary.events.push_back(std::move(event));
  }
}

}  // namespace rag_core
