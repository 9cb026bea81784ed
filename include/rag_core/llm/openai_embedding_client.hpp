#pragma once

#include <curl/curl.h>

#include <mutex>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

/**
 * @class OpenAIEmbeddingClient
 * @brief Embedding backend for OpenAI-compatible /embeddings endpoints
 *        (DashScope compatible mode by default).
 *
 * Request:  {"model", "input": [text...], "dimensions"}
 * Response: {"data": [{"embedding": [...], "index": n}, ...]}
 *
 * The curl handle is created on first use and reused for connection reuse.
 * Requests are serialized on that handle.
 */
class OpenAIEmbeddingClient : public BatchingEmbeddingClient {
 public:
  // Throws ConfigError if api_key is empty.
  OpenAIEmbeddingClient(const std::string &base_url, const std::string &api_key,
                        const EmbeddingOptions &options);
  ~OpenAIEmbeddingClient() override;

  OpenAIEmbeddingClient(const OpenAIEmbeddingClient &) = delete;
  OpenAIEmbeddingClient &operator=(const OpenAIEmbeddingClient &) = delete;

 protected:
  std::vector<IndexedEmbedding> fetch_batch(const std::vector<std::string> &batch,
                                            const Deadline &deadline) override;

 private:
  std::string base_url_;
  std::string api_key_;
  CURL *curl_handle_ = nullptr;
  std::mutex curl_mutex_;

  CURL *ensure_handle();
  std::string post_json(const std::string &url, const std::string &body, const Deadline &deadline);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace rag_core
