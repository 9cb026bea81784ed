#include "rag_core/search/hybrid_retriever.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <map>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

// Outcome of one sub-query after the fusion barrier.
template <typename T>
struct SideResult {
  std::optional<std::vector<T>> hits;
  std::string failure;
};

template <typename T>
SideResult<T> collect(std::future<std::vector<T>> &future, Deadline::Clock::time_point wait_until,
                      const char *side) {
  SideResult<T> result;
  if (future.wait_until(wait_until) != std::future_status::ready) {
    result.failure = std::string(side) + " search timed out";
    return result;
  }
  try {
    result.hits = future.get();
  } catch (const std::exception &e) {
    result.failure = std::string(side) + " search failed: " + e.what();
  }
  return result;
}

void sort_ranked(std::vector<RankedChunk> &ranked) {
  std::sort(ranked.begin(), ranked.end(), [](const RankedChunk &a, const RankedChunk &b) {
    if (a.fused_score != b.fused_score) {
      return a.fused_score > b.fused_score;
    }
    return a.chunk_id < b.chunk_id;
  });
}

}  // namespace

HybridRetriever::HybridRetriever(const IndexLifecycle &lifecycle,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 async::WorkerPool &pool, const RetrievalOptions &options)
    : lifecycle_(lifecycle), embedder_(std::move(embedder)), pool_(pool), options_(options) {
  if (options_.hybrid_weight < 0.0 || options_.hybrid_weight > 1.0) {
    throw ConfigError("hybrid_retriever", "hybrid_weight must be within [0, 1]");
  }
  if (options_.default_top_k <= 0 || options_.max_top_k < options_.default_top_k) {
    throw ConfigError("hybrid_retriever", "require 0 < default_top_k <= max_top_k");
  }
  if (options_.candidate_overdraw <= 0) {
    throw ConfigError("hybrid_retriever", "candidate_overdraw must be positive");
  }
}

int HybridRetriever::resolve_top_k(int requested) const {
  const int top_k = requested > 0 ? requested : options_.default_top_k;
  return std::min(top_k, options_.max_top_k);
}

std::vector<double> HybridRetriever::min_max_normalize(const std::vector<double> &scores) {
  if (scores.empty()) {
    return {};
  }
  const auto [min_it, max_it] = std::minmax_element(scores.begin(), scores.end());
  const double lo = *min_it;
  const double hi = *max_it;
  std::vector<double> normalized;
  normalized.reserve(scores.size());
  for (double score : scores) {
    normalized.push_back(hi > lo ? (score - lo) / (hi - lo) : 1.0);
  }
  return normalized;
}

RetrievalResult HybridRetriever::query(const std::string &text, const QueryParams &params,
                                       const Deadline &deadline) const {
  deadline.throw_if_expired("hybrid_query");
  // Fail fast before paying for the embedding.
  lifecycle_.acquire();

  Embedding embedding;
  try {
    embedding = embedder_->embed_one(text, deadline);
  } catch (const EmbeddingProviderError &e) {
    throw RetrievalError("embed_query", e.what());
  }
  return query_with_embedding(text, embedding, params, deadline);
}

RetrievalResult HybridRetriever::vector_only(const std::shared_ptr<const IndexSet> &set,
                                             const Embedding &embedding, int top_k,
                                             const Deadline &deadline) const {
  auto future = pool_.submit(
      [set, embedding, top_k] {
        return set->vector_index->query(embedding, static_cast<size_t>(top_k));
      },
      "vector_query");
  auto side = collect(future, deadline.bounded_by(options_.sub_query_timeout), "vector");
  deadline.throw_if_expired("vector_query");
  if (!side.hits) {
    throw RetrievalError("vector_query", side.failure);
  }

  RetrievalResult result;
  for (auto &hit : *side.hits) {
    RankedChunk chunk;
    chunk.chunk_id = std::move(hit.chunk_id);
    chunk.fused_score = 1.0 - hit.distance;
    chunk.vector_score = chunk.fused_score;
    chunk.text = std::move(hit.text);
    chunk.metadata = std::move(hit.metadata);
    result.chunks.push_back(std::move(chunk));
  }
  sort_ranked(result.chunks);
  return result;
}

RetrievalResult HybridRetriever::query_with_embedding(const std::string &text,
                                                      const Embedding &embedding,
                                                      const QueryParams &params,
                                                      const Deadline &deadline) const {
  deadline.throw_if_expired("hybrid_query");
  auto set = lifecycle_.acquire();

  const int top_k = resolve_top_k(params.top_k);
  if (!params.use_hybrid) {
    return vector_only(set, embedding, top_k, deadline);
  }

  const double weight = params.hybrid_weight.value_or(options_.hybrid_weight);
  if (weight < 0.0 || weight > 1.0) {
    throw RetrievalError("hybrid_query", "hybrid weight must be within [0, 1]");
  }
  const auto candidates = static_cast<size_t>(std::max(top_k, options_.candidate_overdraw));

  auto vector_future = pool_.submit(
      [set, embedding, candidates] { return set->vector_index->query(embedding, candidates); },
      "vector_query");
  auto keyword_future = pool_.submit(
      [set, text, candidates] { return set->keyword_index->query(text, candidates); },
      "keyword_query");

  const auto wait_until = deadline.bounded_by(options_.sub_query_timeout);
  auto vector_side = collect(vector_future, wait_until, "vector");
  auto keyword_side = collect(keyword_future, wait_until, "keyword");

  const bool complete = vector_side.hits && keyword_side.hits;
  if (!complete) {
    deadline.throw_if_expired("hybrid_query");
  }
  if (!vector_side.hits && !keyword_side.hits) {
    throw RetrievalError("hybrid_query", vector_side.failure + "; " + keyword_side.failure);
  }

  RetrievalResult result;
  if (!complete) {
    result.degraded = true;
    result.degraded_reason = vector_side.hits ? keyword_side.failure : vector_side.failure;
    std::cerr << "[HybridRetriever] Warning: degraded retrieval: " << result.degraded_reason
              << std::endl;
  }

  std::map<std::string, RankedChunk> fused;
  if (vector_side.hits) {
    std::vector<double> similarities;
    similarities.reserve(vector_side.hits->size());
    for (const auto &hit : *vector_side.hits) {
      similarities.push_back(1.0 - hit.distance);
    }
    const auto normalized = min_max_normalize(similarities);
    for (size_t i = 0; i < vector_side.hits->size(); ++i) {
      auto &hit = (*vector_side.hits)[i];
      RankedChunk &chunk = fused[hit.chunk_id];
      chunk.chunk_id = hit.chunk_id;
      chunk.vector_score = normalized[i];
      chunk.text = std::move(hit.text);
      chunk.metadata = std::move(hit.metadata);
    }
  }
  if (keyword_side.hits) {
    std::vector<double> scores;
    scores.reserve(keyword_side.hits->size());
    for (const auto &hit : *keyword_side.hits) {
      scores.push_back(hit.score);
    }
    const auto normalized = min_max_normalize(scores);
    for (size_t i = 0; i < keyword_side.hits->size(); ++i) {
      const auto &hit = (*keyword_side.hits)[i];
      RankedChunk &chunk = fused[hit.chunk_id];
      if (chunk.chunk_id.empty()) {
        const auto &document = set->keyword_index->document(hit.chunk_id);
        chunk.chunk_id = hit.chunk_id;
        chunk.text = document.text;
        chunk.metadata = document.metadata;
      }
      chunk.keyword_score = normalized[i];
    }
  }

  result.chunks.reserve(fused.size());
  for (auto &[id, chunk] : fused) {
    chunk.fused_score =
        weight * chunk.vector_score.value_or(0.0) + (1.0 - weight) * chunk.keyword_score.value_or(0.0);
    result.chunks.push_back(std::move(chunk));
  }
  sort_ranked(result.chunks);
  if (result.chunks.size() > static_cast<size_t>(top_k)) {
    result.chunks.resize(top_k);
  }
  return result;
}

}  // namespace rag_core
