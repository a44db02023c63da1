#pragma once

#include <filesystem>
#include <vector>

#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

/**
 * @brief Copies the active version's artifacts into output_dir.
 *
 * Writes the payload shards under embeddings/, the chunk-detail map under
 * metadata/ and the manifest as manifest.json, ready for bulk ingestion by
 * an external vector service. Shards, map and manifest from an earlier
 * export to the same directory are removed first.
 *
 * @return The files written, in write order.
 * @throw CorpusDataError if nothing is published or an artifact is missing.
 * @throw std::filesystem::filesystem_error if output_dir cannot be written.
 */
std::vector<std::filesystem::path> export_active_corpus(const CorpusRepository& repository,
                                                        const std::filesystem::path& output_dir);

}  // namespace rag_core
