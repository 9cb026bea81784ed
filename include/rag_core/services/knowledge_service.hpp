#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/db/collection_registry.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/index/index_lifecycle.hpp"
#include "rag_core/llm/cached_embedding_provider.hpp"
#include "rag_core/search/hybrid_retriever.hpp"
#include "rag_core/search/response_cache.hpp"

namespace rag_core {

struct KnowledgeServiceOptions {
  IndexLifecycleOptions lifecycle;
  RetrievalOptions retrieval;
  ResponseCacheOptions response_cache;
  QueryEmbeddingCacheOptions query_embedding_cache;
  size_t num_workers = 2;
};

struct KnowledgeStatus {
  IndexStatus index;
  CacheStats response_cache;
  size_t query_embedding_cache_size = 0;
  std::string data_file;
};

struct SearchResponse {
  RetrievalResult result;
  std::string formatted_for_prompt;
  bool cached = false;
};

void to_json(nlohmann::json &j, const RankedChunk &chunk);
void to_json(nlohmann::json &j, const KnowledgeStatus &status);

/**
 * @class KnowledgeService
 * @brief Entry point of the retrieval core for the rest of the application.
 *
 * Wires the index lifecycle, the hybrid retriever and the response cache over
 * one database and one embedding provider. Builds use the provider directly;
 * query-time embeddings go through an exact-text memo.
 */
class KnowledgeService {
 public:
  // With no factory, vector collections are FaissVectorStores in db_manager.
  KnowledgeService(DatabaseManager &db_manager, std::shared_ptr<EmbeddingProvider> embedder,
                   text::Chunker chunker, const KnowledgeServiceOptions &options,
                   VectorIndexFactory vector_factory = VectorIndexFactory());
  ~KnowledgeService();

  void initialize(const std::filesystem::path &data_file = {}, const Deadline &deadline = Deadline());

  // Full rebuild. Cached responses are dropped once the new pair is live.
  void rebuild(const std::filesystem::path &data_file = {}, const Deadline &deadline = Deadline());

  KnowledgeStatus get_status() const;

  RetrievalResult query(const std::string &text, const QueryParams &params = QueryParams(),
                        const Deadline &deadline = Deadline()) const;

  ResponseCache::Outcome lookup_or_compute(const std::string &text,
                                           const ResponseCache::ComputeFn &compute,
                                           const Deadline &deadline = Deadline());

  // Retrieval through the response cache. Degraded results are returned but
  // not cached.
  SearchResponse search(const std::string &text, const QueryParams &params = QueryParams(),
                        const Deadline &deadline = Deadline());

  static std::string format_for_prompt(const std::vector<RankedChunk> &chunks);

  const IndexLifecycle &lifecycle() const {
    return *lifecycle_;
  }

  KnowledgeService(const KnowledgeService &) = delete;
  KnowledgeService &operator=(const KnowledgeService &) = delete;

 private:
  KnowledgeServiceOptions options_;
  CollectionRegistry registry_;
  std::shared_ptr<CachedEmbeddingProvider> query_embedder_;
  std::unique_ptr<IndexLifecycle> lifecycle_;
  std::unique_ptr<async::WorkerPool> pool_;
  std::unique_ptr<HybridRetriever> retriever_;
  std::unique_ptr<ResponseCache> response_cache_;
};

}  // namespace rag_core
