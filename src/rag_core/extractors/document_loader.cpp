#include "rag_core/extractors/document_loader.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "rag_core/errors.hpp"
#include "rag_core/util/hashing.hpp"

namespace rag_core {

Document DocumentLoader::load(const fs::path& file_path, const std::string& document_id) const {
  const std::string raw = read_file(file_path);

  auto invalid = utf8::find_invalid(raw.begin(), raw.end());
  if (invalid != raw.end()) {
    throw DocumentLoadError("File is not valid UTF-8 (byte " +
                            std::to_string(std::distance(raw.begin(), invalid)) +
                            "): " + file_path.string());
  }

  Document document;
  document.document_id = document_id;
  document.source_location = file_path.string();
  document.content_hash = sha256_hex(raw);
  // Chunked verbatim so chunk offsets index the source file
  document.text = raw;
  document.file_type = get_file_type();
  return document;
}

std::string DocumentLoader::read_file(const fs::path& file_path) const {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    throw DocumentLoadError("Not a readable file: " + file_path.string());
  }

  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentLoadError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentLoadError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

bool DocumentLoader::has_extension(const fs::path& file_path, const std::string& extension) {
  std::string actual = file_path.extension().string();
  std::transform(actual.begin(), actual.end(), actual.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return actual == extension;
}

}  // namespace rag_core
