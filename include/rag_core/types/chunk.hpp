#pragma once

#include <cstddef>
#include <string>

#include "rag_core/types/file.hpp"

namespace rag_core {

// A source document as read from the corpus directory.
// document_id is the path relative to the corpus root and is also the
// citable source_document_name of every chunk cut from it.
struct Document {
  std::string document_id;
  std::string source_location;
  std::string text;
  std::string content_hash;
  FileType file_type = FileType::Unknown;
};

// A contiguous window of a document. Offsets and lengths count code points.
struct Chunk {
  std::string chunk_id;
  std::string document_id;
  std::string text;
  int index_in_document = 0;
  size_t start_offset = 0;
  size_t length = 0;
};

}  // namespace rag_core
