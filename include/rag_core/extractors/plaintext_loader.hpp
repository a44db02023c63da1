#pragma once

#include "document_loader.hpp"

namespace rag_core {

class PlainTextLoader : public DocumentLoader {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override {
    return FileType::Text;
  }
};

}  // namespace rag_core
