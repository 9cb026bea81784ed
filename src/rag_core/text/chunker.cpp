#include "rag_core/text/chunker.hpp"

#include <algorithm>
#include <array>

#include "rag_core/errors.hpp"
#include "rag_core/text/utf8_text.hpp"

namespace rag_core::text {

namespace {

// Highest priority first.
const std::array<std::u32string, 10> kSentenceBreaks = {
    U"。\n", U"。", U"！", U"？", U"．", U"\n\n", U".", U"!", U"?", U"\n"};

}  // namespace

Chunker::Chunker(const ChunkerOptions &options, TextPreprocessor preprocessor)
    : options_(options), preprocessor_(std::move(preprocessor)) {
  if (options_.chunk_size <= 0) {
    throw ConfigError("Chunker", "chunk_size must be positive, got " +
                                     std::to_string(options_.chunk_size));
  }
  if (options_.chunk_overlap < 0) {
    throw ConfigError("Chunker", "chunk_overlap must not be negative, got " +
                                     std::to_string(options_.chunk_overlap));
  }
  if (options_.chunk_overlap >= options_.chunk_size) {
    throw ConfigError("Chunker", "chunk_overlap (" + std::to_string(options_.chunk_overlap) +
                                     ") must be smaller than chunk_size (" +
                                     std::to_string(options_.chunk_size) + ")");
  }
}

std::string Chunker::normalize(const std::string &text) const {
  std::string processed = options_.use_preprocessing ? preprocessor_.process(text) : text;

  std::u32string input = decode_utf8(processed);
  std::u32string out;
  out.reserve(input.size());
  for (char32_t cp : input) {
    if (cp == U' ' || cp == U'\t') {
      if (!out.empty() && out.back() == U' ') {
        continue;
      }
      cp = U' ';
    }
    out.push_back(cp);
  }

  size_t begin = 0;
  size_t end = out.size();
  while (begin < end && is_whitespace(out[begin])) {
    ++begin;
  }
  while (end > begin && is_whitespace(out[end - 1])) {
    --end;
  }
  return encode_utf8(out.begin() + begin, out.begin() + end);
}

size_t Chunker::find_sentence_break(const std::u32string &text, size_t start, size_t end) const {
  const size_t search_start = start + static_cast<size_t>(options_.chunk_size / 2);
  if (search_start >= end) {
    return end;
  }
  const std::u32string window = text.substr(search_start, end - search_start);
  for (const auto &mark : kSentenceBreaks) {
    size_t pos = window.rfind(mark);
    if (pos != std::u32string::npos && pos > 0) {
      size_t candidate = search_start + pos + mark.size();
      // Never shrink a window to the point where it could not advance.
      if (candidate - start > static_cast<size_t>(options_.chunk_overlap)) {
        return candidate;
      }
      return end;
    }
  }
  return end;
}

std::vector<Chunk> Chunker::split(const std::string &source_doc_id, const std::string &text) const {
  const std::u32string tokens = decode_utf8(normalize(text));
  std::vector<Chunk> chunks;
  if (tokens.empty()) {
    return chunks;
  }

  const size_t size = static_cast<size_t>(options_.chunk_size);
  const size_t overlap = static_cast<size_t>(options_.chunk_overlap);
  size_t start = 0;
  int sequence = 0;

  while (true) {
    size_t end = std::min(start + size, tokens.size());
    if (options_.snap_to_sentence_boundary && end < tokens.size()) {
      end = find_sentence_break(tokens, start, end);
    }

    Chunk chunk;
    chunk.id = make_chunk_id(source_doc_id, sequence);
    chunk.source_doc_id = source_doc_id;
    chunk.sequence_index = sequence;
    chunk.text = encode_utf8(tokens.begin() + start, tokens.begin() + end);
    chunk.start_offset = static_cast<int>(start);
    chunk.token_count = static_cast<int>(end - start);
    chunk.metadata = ChunkMetadata{.source_doc_id = source_doc_id,
                                   .sequence_index = sequence,
                                   .start_offset = static_cast<int64_t>(start),
                                   .end_offset = static_cast<int64_t>(end),
                                   .token_count = static_cast<int64_t>(end - start),
                                   .preprocessed = options_.use_preprocessing};
    chunks.push_back(std::move(chunk));
    ++sequence;

    if (end >= tokens.size()) {
      break;
    }
    start = end - overlap;
  }

  return chunks;
}

}  // namespace rag_core::text
