#pragma once

#include "document_loader.hpp"

namespace rag_core {

// Markdown sources; the markup is kept as reference text
class MarkdownLoader : public DocumentLoader {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override {
    return FileType::Markdown;
  }
};

}  // namespace rag_core
