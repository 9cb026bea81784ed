#include "rag_core/index/keyword_index.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "rag_core/errors.hpp"

namespace rag_core {

KeywordIndex::KeywordIndex(std::vector<KeywordDocument> documents, const Bm25Options &options)
    : options_(options), documents_(std::move(documents)) {
  if (options_.k1 < 0.0 || options_.b < 0.0 || options_.b > 1.0) {
    throw ConfigError("keyword_index", "BM25 requires k1 >= 0 and 0 <= b <= 1");
  }

  lengths_.reserve(documents_.size());
  size_t total_length = 0;
  for (size_t doc = 0; doc < documents_.size(); ++doc) {
    const auto &document = documents_[doc];
    if (!index_by_id_.emplace(document.id, doc).second) {
      throw VectorIndexError("keyword_index", "duplicate document id " + document.id);
    }

    const auto terms = tokenizer_.tokenize(document.text);
    lengths_.push_back(static_cast<int>(terms.size()));
    total_length += terms.size();

    std::unordered_map<std::string, int> frequencies;
    for (const auto &term : terms) {
      ++frequencies[term];
    }
    for (const auto &[term, tf] : frequencies) {
      postings_[term].push_back({doc, tf});
    }
  }
  if (!documents_.empty()) {
    average_length_ = static_cast<double>(total_length) / static_cast<double>(documents_.size());
  }
}

double KeywordIndex::idf(size_t document_frequency) const {
  const double n = static_cast<double>(documents_.size());
  const double df = static_cast<double>(document_frequency);
  return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

std::vector<KeywordHit> KeywordIndex::query(const std::string &text, size_t top_k) const {
  if (top_k == 0 || documents_.empty()) {
    return {};
  }

  // Repeated query terms count once.
  std::unordered_set<std::string> seen;
  std::unordered_map<size_t, double> scores;
  for (const auto &term : tokenizer_.tokenize(text)) {
    if (!seen.insert(term).second) {
      continue;
    }
    auto it = postings_.find(term);
    if (it == postings_.end()) {
      continue;
    }
    const double term_idf = idf(it->second.size());
    for (const auto &posting : it->second) {
      const double tf = posting.term_frequency;
      const double length_ratio =
          average_length_ > 0.0 ? lengths_[posting.doc] / average_length_ : 0.0;
      const double denominator = tf + options_.k1 * (1.0 - options_.b + options_.b * length_ratio);
      scores[posting.doc] += term_idf * tf * (options_.k1 + 1.0) / denominator;
    }
  }

  std::vector<KeywordHit> hits;
  hits.reserve(scores.size());
  for (const auto &[doc, score] : scores) {
    hits.push_back({documents_[doc].id, score});
  }
  std::sort(hits.begin(), hits.end(), [](const KeywordHit &a, const KeywordHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
  });
  if (hits.size() > top_k) {
    hits.resize(top_k);
  }
  return hits;
}

std::vector<std::string> KeywordIndex::ids() const {
  std::vector<std::string> all;
  all.reserve(documents_.size());
  for (const auto &document : documents_) {
    all.push_back(document.id);
  }
  return all;
}

const KeywordDocument &KeywordIndex::document(const std::string &id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) {
    throw RetrievalError("keyword_document", "unknown chunk id " + id);
  }
  return documents_[it->second];
}

}  // namespace rag_core
