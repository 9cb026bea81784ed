#include "rag_core/services/knowledge_service.hpp"

#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/index/faiss_vector_store.hpp"

namespace rag_core {

namespace {

constexpr const char *kNoResults = "関連する情報が見つかりませんでした。";

std::string format_time(const std::chrono::system_clock::time_point &tp) {
  return CollectionRegistry::time_point_to_string(tp);
}

// Cached payload: the ranked chunks plus their prompt rendering.
std::string serialize_response(const RetrievalResult &result, const std::string &formatted) {
  nlohmann::json payload;
  payload["results"] = result.chunks;
  payload["formatted_for_prompt"] = formatted;
  return payload.dump();
}

RetrievalResult deserialize_response(const std::string &payload, std::string &formatted) {
  const auto j = nlohmann::json::parse(payload);
  RetrievalResult result;
  for (const auto &item : j.at("results")) {
    RankedChunk chunk;
    chunk.chunk_id = item.at("id").get<std::string>();
    chunk.fused_score = item.at("score").get<double>();
    if (item.contains("vector_score") && !item["vector_score"].is_null()) {
      chunk.vector_score = item["vector_score"].get<double>();
    }
    if (item.contains("keyword_score") && !item["keyword_score"].is_null()) {
      chunk.keyword_score = item["keyword_score"].get<double>();
    }
    chunk.text = item.at("text").get<std::string>();
    chunk.metadata = item.at("metadata").get<ChunkMetadata>();
    result.chunks.push_back(std::move(chunk));
  }
  formatted = j.at("formatted_for_prompt").get<std::string>();
  return result;
}

}  // namespace

void to_json(nlohmann::json &j, const RankedChunk &chunk) {
  j = nlohmann::json{{"id", chunk.chunk_id},
                     {"score", chunk.fused_score},
                     {"vector_score", nullptr},
                     {"keyword_score", nullptr},
                     {"text", chunk.text},
                     {"metadata", chunk.metadata}};
  if (chunk.vector_score) {
    j["vector_score"] = *chunk.vector_score;
  }
  if (chunk.keyword_score) {
    j["keyword_score"] = *chunk.keyword_score;
  }
}

void to_json(nlohmann::json &j, const KnowledgeStatus &status) {
  j = nlohmann::json{{"state", to_string(status.index.state)},
                     {"initialized", status.index.state == IndexState::READY},
                     {"documentCount", status.index.document_count},
                     {"bm25DocumentCount", status.index.keyword_document_count},
                     {"collection", status.index.collection_name},
                     {"generation", status.index.generation},
                     {"warmStarted", status.index.warm_started},
                     {"lastBuildTime", nullptr},
                     {"lastError", status.index.last_error},
                     {"similarityCacheSize", status.response_cache.size},
                     {"similarityCacheHits", status.response_cache.hits},
                     {"similarityCacheMisses", status.response_cache.misses},
                     {"queryEmbeddingCacheSize", status.query_embedding_cache_size},
                     {"dataFile", status.data_file}};
  if (status.index.last_build_time) {
    j["lastBuildTime"] = format_time(*status.index.last_build_time);
  }
}

KnowledgeService::KnowledgeService(DatabaseManager &db_manager,
                                   std::shared_ptr<EmbeddingProvider> embedder,
                                   text::Chunker chunker, const KnowledgeServiceOptions &options,
                                   VectorIndexFactory vector_factory)
    : options_(options), registry_(db_manager) {
  if (!embedder) {
    throw ConfigError("knowledge_service", "an embedding provider is required");
  }
  if (!vector_factory) {
    const int dimension = embedder->dimension();
    vector_factory = [&db_manager, dimension](const std::string &name) {
      return std::make_shared<FaissVectorStore>(db_manager, name, dimension);
    };
  }

  query_embedder_ =
      std::make_shared<CachedEmbeddingProvider>(embedder, options_.query_embedding_cache);
  lifecycle_ = std::make_unique<IndexLifecycle>(options_.lifecycle, embedder, std::move(chunker),
                                                std::move(vector_factory), registry_);
  pool_ = std::make_unique<async::WorkerPool>(options_.num_workers);
  retriever_ = std::make_unique<HybridRetriever>(*lifecycle_, query_embedder_, *pool_,
                                                 options_.retrieval);
  response_cache_ = std::make_unique<ResponseCache>(query_embedder_, options_.response_cache);
  pool_->start();
}

KnowledgeService::~KnowledgeService() {
  pool_->stop();
}

void KnowledgeService::initialize(const std::filesystem::path &data_file,
                                  const Deadline &deadline) {
  lifecycle_->initialize(data_file, deadline);
}

void KnowledgeService::rebuild(const std::filesystem::path &data_file, const Deadline &deadline) {
  lifecycle_->rebuild(data_file, deadline);
  response_cache_->clear();
}

KnowledgeStatus KnowledgeService::get_status() const {
  KnowledgeStatus status;
  status.index = lifecycle_->status();
  status.response_cache = response_cache_->stats();
  status.query_embedding_cache_size = query_embedder_->size();
  status.data_file = options_.lifecycle.data_file.string();
  return status;
}

RetrievalResult KnowledgeService::query(const std::string &text, const QueryParams &params,
                                        const Deadline &deadline) const {
  return retriever_->query(text, params, deadline);
}

ResponseCache::Outcome KnowledgeService::lookup_or_compute(const std::string &text,
                                                           const ResponseCache::ComputeFn &compute,
                                                           const Deadline &deadline) {
  return response_cache_->lookup_or_compute(text, compute, deadline);
}

SearchResponse KnowledgeService::search(const std::string &text, const QueryParams &params,
                                        const Deadline &deadline) {
  deadline.throw_if_expired("search");
  // Read before the index pair is acquired: a rebuild that publishes a new
  // pair clears the cache afterwards, which invalidates this epoch.
  const uint64_t cache_epoch = response_cache_->epoch();
  lifecycle_->acquire();

  Embedding embedding;
  try {
    embedding = query_embedder_->embed_one(text, deadline);
  } catch (const EmbeddingProviderError &e) {
    throw RetrievalError("embed_query", e.what());
  }

  // Results depend on the request parameters, so only default-shaped requests
  // share cache entries.
  const bool cacheable = options_.response_cache.enabled && params.use_hybrid &&
                         !params.hybrid_weight &&
                         retriever_->resolve_top_k(params.top_k) ==
                             retriever_->resolve_top_k(0);

  SearchResponse response;
  if (cacheable) {
    if (auto hit = response_cache_->lookup(embedding)) {
      try {
        response.result = deserialize_response(hit->response, response.formatted_for_prompt);
        response.cached = true;
        return response;
      } catch (const nlohmann::json::exception &e) {
        std::cerr << "[KnowledgeService] Warning: discarding unreadable cached response: "
                  << e.what() << std::endl;
      }
    }
  }

  response.result = retriever_->query_with_embedding(text, embedding, params, deadline);
  response.formatted_for_prompt = format_for_prompt(response.result.chunks);
  if (cacheable && !response.result.degraded) {
    if (!response_cache_->store(
            embedding, serialize_response(response.result, response.formatted_for_prompt),
            cache_epoch)) {
      std::cout << "[KnowledgeService] Index rebuilt during search; result not cached."
                << std::endl;
    }
  }
  return response;
}

std::string KnowledgeService::format_for_prompt(const std::vector<RankedChunk> &chunks) {
  if (chunks.empty()) {
    return kNoResults;
  }
  std::string formatted;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      formatted += "\n\n";
    }
    formatted += "【参考情報 " + std::to_string(i + 1) + "】\n" + chunks[i].text;
  }
  return formatted;
}

}  // namespace rag_core
