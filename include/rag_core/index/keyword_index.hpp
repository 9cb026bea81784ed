#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/text/tokenizer.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct Bm25Options {
  double k1 = 1.2;
  double b = 0.75;
};

struct KeywordDocument {
  std::string id;
  std::string text;
  ChunkMetadata metadata;
};

struct KeywordHit {
  std::string chunk_id;
  double score = 0.0;
};

/**
 * @class KeywordIndex
 * @brief Okapi BM25 over an immutable set of documents.
 *
 * Built once from the full document set; a rebuild constructs a new index.
 * Scores are unnormalized and only comparable within one query.
 *
 *   idf(t)   = ln((N - df + 0.5) / (df + 0.5) + 1)
 *   score(d) = sum over distinct query terms of
 *              idf(t) * tf * (k1 + 1) / (tf + k1 * (1 - b + b * |d| / avgdl))
 */
class KeywordIndex {
 public:
  explicit KeywordIndex(std::vector<KeywordDocument> documents,
                        const Bm25Options &options = Bm25Options());

  // Documents containing at least one query term, highest score first, ties by
  // id. Empty when the query has no terms.
  std::vector<KeywordHit> query(const std::string &text, size_t top_k) const;

  size_t document_count() const {
    return documents_.size();
  }
  bool contains(const std::string &id) const {
    return index_by_id_.count(id) > 0;
  }
  std::vector<std::string> ids() const;

  const KeywordDocument &document(const std::string &id) const;

  double average_document_length() const {
    return average_length_;
  }

 private:
  struct Posting {
    size_t doc;
    int term_frequency;
  };

  double idf(size_t document_frequency) const;

  Bm25Options options_;
  text::Tokenizer tokenizer_;
  std::vector<KeywordDocument> documents_;
  std::vector<int> lengths_;
  double average_length_ = 0.0;
  std::unordered_map<std::string, std::vector<Posting>> postings_;
  std::unordered_map<std::string, size_t> index_by_id_;
};

}  // namespace rag_core
