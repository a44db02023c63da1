#include "rag_core/extractors/document_loader_factory.hpp"

#include "rag_core/extractors/markdown_loader.hpp"
#include "rag_core/extractors/plaintext_loader.hpp"

namespace rag_core {
DocumentLoaderFactory::DocumentLoaderFactory() {
  loaders_.push_back(std::make_unique<MarkdownLoader>());
  loaders_.push_back(std::make_unique<PlainTextLoader>());
}

const DocumentLoader* DocumentLoaderFactory::find_loader_for(
    const std::filesystem::path& file_path) const {
  for (const auto& loader : loaders_) {
    if (loader->can_handle(file_path)) {
      return loader.get();
    }
  }
  return nullptr;
}
}  // namespace rag_core
