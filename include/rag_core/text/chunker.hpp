#pragma once

#include <string>
#include <vector>

#include "rag_core/text/preprocessor.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core::text {

struct ChunkerOptions {
  // Both measured in tokens; a token is one Unicode code point of the
  // normalized text.
  int chunk_size = 300;
  int chunk_overlap = 100;
  bool use_preprocessing = true;
  // Ends a window early at the last sentence break in its second half.
  bool snap_to_sentence_boundary = false;
};

/**
 * @class Chunker
 * @brief Splits a document into overlapping, bounded fragments.
 *
 * A window of chunk_size tokens slides forward by chunk_size - chunk_overlap
 * tokens; the last window is truncated to the remaining text. Consecutive
 * chunks share exactly chunk_overlap tokens. Output depends only on the input
 * text and the options, so re-chunking reproduces the same chunks and ids.
 */
class Chunker {
 public:
  // Throws ConfigError unless 0 <= chunk_overlap < chunk_size.
  explicit Chunker(const ChunkerOptions &options, TextPreprocessor preprocessor = TextPreprocessor());

  std::vector<Chunk> split(const std::string &source_doc_id, const std::string &text) const;

  // Preprocessing (if enabled) plus whitespace normalization.
  std::string normalize(const std::string &text) const;

  const ChunkerOptions &options() const {
    return options_;
  }

 private:
  ChunkerOptions options_;
  TextPreprocessor preprocessor_;

  size_t find_sentence_break(const std::u32string &text, size_t start, size_t end) const;
};

}  // namespace rag_core::text
