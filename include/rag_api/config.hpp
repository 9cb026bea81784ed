#pragma once

#include <chrono>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/services/knowledge_service.hpp"
#include "rag_core/text/chunker.hpp"

namespace rag_api {

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  std::string data_file;
  std::string collection_name;
  int num_workers;

  // Embedding provider
  std::string embedding_provider;
  std::string embedding_base_url;
  std::string embedding_model;
  std::string embedding_api_key_env;
  int embedding_dimensions;
  int embedding_batch_size;
  int embedding_max_retries;
  int embedding_timeout_ms;
  int query_embedding_cache_ttl_ms;
  int query_embedding_cache_max_size;

  // Chunking
  int chunk_size;
  int chunk_overlap;
  bool use_preprocessing;
  bool snap_to_sentence_boundary;

  // Retrieval
  double bm25_k1;
  double bm25_b;
  double hybrid_search_weight;
  int default_top_k;
  int max_top_k;
  int candidate_overdraw;
  int sub_query_timeout_ms;
  int search_timeout_ms;

  // Similarity cache
  bool similarity_cache_enabled;
  int similarity_cache_ttl_ms;
  int similarity_cache_max_size;
  double similarity_threshold;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw rag_core::ConfigError("load_config", "cannot open config file " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw rag_core::ConfigError("load_config",
                                  "invalid JSON in '" + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
      config.database_path = json_config.value("database_path", std::string("./data/rag.db"));
      config.data_file = json_config.value(
          "data_file",
          std::string("../assets/instruction-manual/prius-instruction-manual.txt"));
      config.collection_name = json_config.value("collection_name", std::string("car_manual"));
      config.num_workers = json_config.value("num_workers", 2);

      config.embedding_provider = json_config.value("embedding_provider", std::string("openai"));
      config.embedding_base_url = json_config.value(
          "embedding_base_url",
          std::string("https://dashscope-intl.aliyuncs.com/compatible-mode/v1"));
      config.embedding_model = json_config.value("embedding_model", std::string("text-embedding-v4"));
      config.embedding_api_key_env =
          json_config.value("embedding_api_key_env", std::string("DASHSCOPE_API_KEY"));
      config.embedding_dimensions = json_config.value("embedding_dimensions", 1024);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 10);
      config.embedding_max_retries = json_config.value("embedding_max_retries", 2);
      config.embedding_timeout_ms = json_config.value("embedding_timeout_ms", 30000);
      config.query_embedding_cache_ttl_ms =
          json_config.value("query_embedding_cache_ttl_ms", 300000);
      config.query_embedding_cache_max_size =
          json_config.value("query_embedding_cache_max_size", 100);

      config.chunk_size = json_config.value("chunk_size", 300);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.use_preprocessing = json_config.value("use_preprocessing", true);
      config.snap_to_sentence_boundary = json_config.value("snap_to_sentence_boundary", false);

      config.bm25_k1 = json_config.value("bm25_k1", 1.2);
      config.bm25_b = json_config.value("bm25_b", 0.75);
      config.hybrid_search_weight = json_config.value("hybrid_search_weight", 0.7);
      config.default_top_k = json_config.value("default_top_k", 5);
      config.max_top_k = json_config.value("max_top_k", 20);
      config.candidate_overdraw = json_config.value("candidate_overdraw", 10);
      config.sub_query_timeout_ms = json_config.value("sub_query_timeout_ms", 2000);
      config.search_timeout_ms = json_config.value("search_timeout_ms", 15000);

      config.similarity_cache_enabled = json_config.value("similarity_cache_enabled", true);
      config.similarity_cache_ttl_ms = json_config.value("similarity_cache_ttl_ms", 600000);
      config.similarity_cache_max_size = json_config.value("similarity_cache_max_size", 100);
      config.similarity_threshold = json_config.value("similarity_threshold", 0.90);
    } catch (const nlohmann::json::exception &e) {
      throw rag_core::ConfigError("load_config", std::string("wrong value type: ") + e.what());
    }

    config.validate();
    return config;
  }

  rag_core::text::ChunkerOptions chunker_options() const {
    return {.chunk_size = chunk_size,
            .chunk_overlap = chunk_overlap,
            .use_preprocessing = use_preprocessing,
            .snap_to_sentence_boundary = snap_to_sentence_boundary};
  }

  rag_core::EmbeddingOptions embedding_options() const {
    rag_core::EmbeddingOptions options;
    options.model = embedding_model;
    options.dimensions = embedding_dimensions;
    options.batch_size = embedding_batch_size;
    options.max_retries = embedding_max_retries;
    options.request_timeout = std::chrono::milliseconds(embedding_timeout_ms);
    return options;
  }

  rag_core::KnowledgeServiceOptions service_options() const {
    rag_core::KnowledgeServiceOptions options;
    options.lifecycle.collection_base_name = collection_name;
    options.lifecycle.data_file = data_file;
    options.lifecycle.bm25 = {bm25_k1, bm25_b};
    options.retrieval.hybrid_weight = hybrid_search_weight;
    options.retrieval.default_top_k = default_top_k;
    options.retrieval.max_top_k = max_top_k;
    options.retrieval.candidate_overdraw = candidate_overdraw;
    options.retrieval.sub_query_timeout = std::chrono::milliseconds(sub_query_timeout_ms);
    options.response_cache.enabled = similarity_cache_enabled;
    options.response_cache.similarity_threshold = similarity_threshold;
    options.response_cache.ttl = std::chrono::milliseconds(similarity_cache_ttl_ms);
    options.response_cache.max_size = static_cast<size_t>(similarity_cache_max_size);
    options.query_embedding_cache.ttl = std::chrono::milliseconds(query_embedding_cache_ttl_ms);
    options.query_embedding_cache.max_size = static_cast<size_t>(query_embedding_cache_max_size);
    options.num_workers = static_cast<size_t>(num_workers);
    return options;
  }

 private:
  static void require(bool condition, const std::string &message) {
    if (!condition) {
      throw rag_core::ConfigError("validate_config", message);
    }
  }

  void validate() const {
    require(!api_base_url.empty() && api_base_url.find(':') != std::string::npos,
            "api_base_url must be host:port");
    require(!database_path.empty(), "database_path cannot be empty");
    require(!data_file.empty(), "data_file cannot be empty");
    require(!collection_name.empty() && collection_name.find('@') == std::string::npos,
            "collection_name must be non-empty and must not contain '@'");
    require(num_workers > 0, "num_workers must be greater than 0");

    require(embedding_provider == "openai" || embedding_provider == "ollama",
            "embedding_provider must be 'openai' or 'ollama'");
    require(!embedding_base_url.empty(), "embedding_base_url cannot be empty");
    require(!embedding_model.empty(), "embedding_model cannot be empty");
    require(embedding_provider != "openai" || !embedding_api_key_env.empty(),
            "embedding_api_key_env cannot be empty for the openai provider");
    require(embedding_dimensions > 0, "embedding_dimensions must be greater than 0");
    require(embedding_batch_size > 0, "embedding_batch_size must be greater than 0");
    require(embedding_max_retries >= 0, "embedding_max_retries cannot be negative");
    require(embedding_timeout_ms > 0, "embedding_timeout_ms must be greater than 0");
    require(query_embedding_cache_ttl_ms > 0 && query_embedding_cache_max_size > 0,
            "query embedding cache ttl and size must be greater than 0");

    require(chunk_size > 0, "chunk_size must be greater than 0");
    require(chunk_overlap >= 0 && chunk_overlap < chunk_size,
            "chunk_overlap must be in [0, chunk_size)");

    require(bm25_k1 >= 0.0, "bm25_k1 cannot be negative");
    require(bm25_b >= 0.0 && bm25_b <= 1.0, "bm25_b must be within [0, 1]");
    require(hybrid_search_weight >= 0.0 && hybrid_search_weight <= 1.0,
            "hybrid_search_weight must be within [0, 1]");
    require(default_top_k > 0 && default_top_k <= max_top_k,
            "default_top_k must be in (0, max_top_k]");
    require(candidate_overdraw > 0, "candidate_overdraw must be greater than 0");
    require(sub_query_timeout_ms > 0, "sub_query_timeout_ms must be greater than 0");
    require(search_timeout_ms > 0, "search_timeout_ms must be greater than 0");

    require(similarity_cache_ttl_ms > 0, "similarity_cache_ttl_ms must be greater than 0");
    require(similarity_cache_max_size > 0, "similarity_cache_max_size must be greater than 0");
    require(similarity_threshold > 0.0 && similarity_threshold <= 1.0,
            "similarity_threshold must be within (0, 1]");
  }
};

}  // namespace rag_api
