#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file.hpp"

namespace fs = std::filesystem;

namespace rag_core {

class DocumentLoader {
 public:
  virtual ~DocumentLoader() = default;

  // Checks if this loader can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  /**
   * @brief Reads a source file into a Document.
   *
   * The document text is the file content unchanged, so chunk offsets are
   * positions in the source file. The content hash is taken over the same bytes.
   *
   * @param file_path Location of the file on disk.
   * @param document_id Corpus-relative name of the document.
   * @throw DocumentLoadError if the file cannot be read or is not valid UTF-8.
   */
  virtual Document load(const fs::path& file_path, const std::string& document_id) const;

  virtual FileType get_file_type() const = 0;

 protected:
  std::string read_file(const fs::path& file_path) const;

  static bool has_extension(const fs::path& file_path, const std::string& extension);
};

using DocumentLoaderPtr = std::unique_ptr<DocumentLoader>;

}  // namespace rag_core
