#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "document_loader.hpp"

/**
 * @class DocumentLoaderFactory
 * @brief Provides the DocumentLoader for a given source file.
 *
 * The factory owns one instance of every available loader and selects one
 * by file extension. Files no loader handles are not an error: the indexing
 * pipeline skips them with a warning.
 */
namespace rag_core {
class DocumentLoaderFactory {
 public:
  DocumentLoaderFactory();
  virtual ~DocumentLoaderFactory() = default;

  /**
   * @brief Finds the loader for the given file.
   *
   * @param file_path The path to the file that needs to be loaded.
   * @return The first registered loader that can handle the file, or nullptr.
   */
  virtual const DocumentLoader* find_loader_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const {
    return find_loader_for(file_path) != nullptr;
  }

  DocumentLoaderFactory(const DocumentLoaderFactory&) = delete;
  DocumentLoaderFactory& operator=(const DocumentLoaderFactory&) = delete;
  DocumentLoaderFactory(DocumentLoaderFactory&&) = delete;
  DocumentLoaderFactory& operator=(DocumentLoaderFactory&&) = delete;

 private:
  std::vector<DocumentLoaderPtr> loaders_;
};
}  // namespace rag_core
