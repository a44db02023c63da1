#include "rag_core/services/corpus_export.hpp"

#include <fstream>
#include <iostream>
#include <optional>

#include "rag_core/errors.hpp"
#include "rag_core/services/index_materializer.hpp"

namespace rag_core {

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw CorpusDataError("Cannot open export file: " + path.string());
  }
  out << content;
  if (!out) {
    throw CorpusDataError("Failed to write export file: " + path.string());
  }
}

// Key relative to the version prefix, e.g. embeddings/shard-00000.jsonl
std::string relative_key(const CorpusManifest& manifest, const std::string& key) {
  const std::string prefix = IndexMaterializer::version_prefix(manifest.version);
  if (key.compare(0, prefix.size(), prefix) == 0) {
    return key.substr(prefix.size());
  }
  return key;
}

// Drops what an earlier export left behind so the directory holds one version only
void clear_previous_export(const std::filesystem::path& output_dir) {
  std::filesystem::remove_all(output_dir / "embeddings");
  std::filesystem::remove_all(output_dir / "metadata");
  std::filesystem::remove(output_dir / "manifest.json");
}

}  // namespace

std::vector<std::filesystem::path> export_active_corpus(const CorpusRepository& repository,
                                                        const std::filesystem::path& output_dir) {
  std::optional<CorpusManifest> manifest = repository.active_manifest();
  if (!manifest) {
    throw CorpusDataError("No corpus has been published yet");
  }

  std::vector<std::string> keys = manifest->payload_shards;
  keys.push_back(manifest->chunk_map);

  // Fetch everything first so a missing artifact leaves the previous export intact
  std::vector<std::string> contents;
  contents.reserve(keys.size());
  for (const auto& key : keys) {
    std::optional<std::string> content = repository.get_artifact(key);
    if (!content) {
      throw CorpusDataError("Artifact missing from version " + manifest->version + ": " + key);
    }
    contents.push_back(std::move(*content));
  }

  clear_previous_export(output_dir);

  std::vector<std::filesystem::path> written;
  for (size_t i = 0; i < keys.size(); ++i) {
    const std::filesystem::path target = output_dir / relative_key(*manifest, keys[i]);
    write_file(target, contents[i]);
    written.push_back(target);
  }

  const std::filesystem::path manifest_path = output_dir / "manifest.json";
  write_file(manifest_path, manifest->to_json().dump(2));
  written.push_back(manifest_path);

  std::cout << "[CorpusExport] Exported version " << manifest->version << " to "
            << output_dir.string() << " (" << written.size() << " files)" << std::endl;
  return written;
}

}  // namespace rag_core
