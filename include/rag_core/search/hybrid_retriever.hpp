#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/deadline.hpp"
#include "rag_core/index/index_lifecycle.hpp"
#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

struct RankedChunk {
  std::string chunk_id;
  double fused_score = 0.0;
  // Min-max normalized per-method scores; empty when the method did not
  // return this chunk.
  std::optional<double> vector_score;
  std::optional<double> keyword_score;
  std::string text;
  ChunkMetadata metadata;
};

struct RetrievalResult {
  std::vector<RankedChunk> chunks;
  // One side failed or timed out and the other ranked alone.
  bool degraded = false;
  std::string degraded_reason;
};

struct RetrievalOptions {
  // Weight of the vector side; 1 - w goes to BM25.
  double hybrid_weight = 0.7;
  int default_top_k = 5;
  int max_top_k = 20;
  int candidate_overdraw = 10;
  std::chrono::milliseconds sub_query_timeout{2000};
};

struct QueryParams {
  // <= 0 selects default_top_k. Clamped to max_top_k.
  int top_k = 0;
  bool use_hybrid = true;
  std::optional<double> hybrid_weight;
};

/**
 * @class HybridRetriever
 * @brief Fuses vector similarity and BM25 rankings over the published index
 * pair.
 *
 * The query is embedded once; both sub-queries then run concurrently on the
 * worker pool and fetch max(top_k, candidate_overdraw) candidates. Each list
 * is min-max normalized on its own and combined as
 * w * vector + (1 - w) * keyword, a missing side counting as 0. Results are
 * ordered by fused score, ties by chunk id.
 */
class HybridRetriever {
 public:
  HybridRetriever(const IndexLifecycle &lifecycle, std::shared_ptr<EmbeddingProvider> embedder,
                  async::WorkerPool &pool, const RetrievalOptions &options);

  /**
   * @throws IndexNotReady when no index pair is published.
   * @throws RetrievalTimeout when the deadline expires first.
   * @throws RetrievalError when the embedding or both sub-queries fail.
   */
  RetrievalResult query(const std::string &text, const QueryParams &params = QueryParams(),
                        const Deadline &deadline = Deadline()) const;

  // Same as query() with an embedding the caller already computed.
  RetrievalResult query_with_embedding(const std::string &text, const Embedding &embedding,
                                       const QueryParams &params = QueryParams(),
                                       const Deadline &deadline = Deadline()) const;

  int resolve_top_k(int requested) const;

  // Scales into [0, 1]. A single score, or all-equal scores, map to 1.
  static std::vector<double> min_max_normalize(const std::vector<double> &scores);

  const RetrievalOptions &options() const {
    return options_;
  }

 private:
  RetrievalResult vector_only(const std::shared_ptr<const IndexSet> &set,
                              const Embedding &embedding, int top_k,
                              const Deadline &deadline) const;

  const IndexLifecycle &lifecycle_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  async::WorkerPool &pool_;
  RetrievalOptions options_;
};

}  // namespace rag_core
