#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rag_core/chunking/chunk_id_generator.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct ChunkerOptions {
  // Both measured in code points
  size_t max_size = 1000;
  size_t overlap = 150;
  ChunkIdPolicy id_policy = ChunkIdPolicy::ContentDerived;
};

// Half-open code point range [start, start + length) of a document
struct ChunkSpan {
  size_t start = 0;
  size_t length = 0;
};

/**
 * @class TextChunker
 * @brief Splits document text into overlapping windows of at most max_size
 * code points.
 *
 * Each window ends right after the strongest separator it contains, trying
 * paragraph breaks first, then line breaks, then sentence ends, then spaces,
 * and falls back to a hard cut at max_size. A boundary is only accepted if it
 * leaves the window longer than both the overlap and half of max_size. The
 * next window starts `overlap` code points before the previous one ended, so
 * dropping the first `overlap` code points of every chunk after the first
 * and concatenating reconstructs the document.
 *
 * The chunker is pure: the same text and options always produce the same
 * boundaries.
 */
class TextChunker {
 public:
  // Throws ConfigurationError if max_size is zero or overlap >= max_size
  explicit TextChunker(ChunkerOptions options);

  // Chunks of one document in order. Empty text yields no chunks.
  // Throws DocumentLoadError if the text is not valid UTF-8.
  std::vector<Chunk> chunk(const Document& document) const;

  // Chunk boundaries for already decoded text
  std::vector<ChunkSpan> split(const std::u32string& text) const;

  const ChunkerOptions& options() const {
    return options_;
  }

 private:
  size_t find_cut(const std::u32string& text, size_t start) const;

  ChunkerOptions options_;
  ChunkIdGenerator id_generator_;
};

}  // namespace rag_core
