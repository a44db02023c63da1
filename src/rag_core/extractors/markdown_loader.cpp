#include "rag_core/extractors/markdown_loader.hpp"

namespace rag_core {

bool MarkdownLoader::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".md") || has_extension(file_path, ".markdown");
}

}  // namespace rag_core
