#include "rag_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

// Strongest boundary first
const std::vector<std::u32string>& separators() {
  static const std::vector<std::u32string> kSeparators = {
      U"\n\n", U"\n", U". ", U"? ", U"! ", U" "};
  return kSeparators;
}

std::string encode_range(const std::u32string& text, size_t start, size_t length) {
  std::string out;
  auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
  utf8::utf32to8(first, first + static_cast<std::ptrdiff_t>(length), std::back_inserter(out));
  return out;
}

}  // namespace

TextChunker::TextChunker(ChunkerOptions options)
    : options_(options), id_generator_(options.id_policy) {
  if (options_.max_size == 0) {
    throw ConfigurationError("chunking.max_size must be greater than 0");
  }
  if (options_.overlap >= options_.max_size) {
    throw ConfigurationError("chunking.overlap (" + std::to_string(options_.overlap) +
                             ") must be smaller than chunking.max_size (" +
                             std::to_string(options_.max_size) + ")");
  }
}

std::vector<Chunk> TextChunker::chunk(const Document& document) const {
  std::vector<Chunk> chunks;
  if (document.text.empty()) {
    return chunks;
  }

  auto invalid = utf8::find_invalid(document.text.begin(), document.text.end());
  if (invalid != document.text.end()) {
    throw DocumentLoadError("Document '" + document.document_id +
                            "' is not valid UTF-8 at byte " +
                            std::to_string(std::distance(document.text.begin(), invalid)));
  }

  std::u32string text;
  text.reserve(document.text.size());
  utf8::utf8to32(document.text.begin(), document.text.end(), std::back_inserter(text));

  const std::vector<ChunkSpan> spans = split(text);
  chunks.reserve(spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    Chunk chunk;
    chunk.document_id = document.document_id;
    chunk.index_in_document = static_cast<int>(i);
    chunk.start_offset = spans[i].start;
    chunk.length = spans[i].length;
    chunk.text = encode_range(text, spans[i].start, spans[i].length);
    chunk.chunk_id = id_generator_.generate(chunk.document_id, chunk.index_in_document,
                                            chunk.start_offset, chunk.text);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::vector<ChunkSpan> TextChunker::split(const std::u32string& text) const {
  std::vector<ChunkSpan> spans;
  if (text.empty()) {
    return spans;
  }

  size_t start = 0;
  while (true) {
    const size_t end = find_cut(text, start);
    spans.push_back(ChunkSpan{start, end - start});
    if (end >= text.size()) {
      break;
    }
    // end > start + overlap, so every window advances
    start = end - options_.overlap;
  }
  return spans;
}

size_t TextChunker::find_cut(const std::u32string& text, size_t start) const {
  const size_t window_end = start + options_.max_size;
  if (window_end >= text.size()) {
    return text.size();
  }

  const size_t min_cut = start + std::max(options_.overlap + 1, options_.max_size / 2);
  for (const std::u32string& separator : separators()) {
    if (separator.size() > options_.max_size) {
      continue;
    }
    const size_t pos = text.rfind(separator, window_end - separator.size());
    if (pos != std::u32string::npos && pos >= start && pos + separator.size() >= min_cut) {
      return pos + separator.size();
    }
  }
  return window_end;
}

}  // namespace rag_core
