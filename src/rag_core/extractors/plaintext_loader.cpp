#include "rag_core/extractors/plaintext_loader.hpp"

namespace rag_core {

bool PlainTextLoader::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".txt");
}

}  // namespace rag_core
