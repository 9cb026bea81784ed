#include "rag_core/llm/openai_embedding_client.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace rag_core {

OpenAIEmbeddingClient::OpenAIEmbeddingClient(const std::string &base_url,
                                             const std::string &api_key,
                                             const EmbeddingOptions &options)
    : BatchingEmbeddingClient(options), base_url_(base_url), api_key_(api_key) {
  if (api_key_.empty()) {
    throw ConfigError("OpenAIEmbeddingClient", "embedding API key is not set");
  }
  if (base_url_.empty()) {
    throw ConfigError("OpenAIEmbeddingClient", "embedding base URL is not set");
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

OpenAIEmbeddingClient::~OpenAIEmbeddingClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

size_t OpenAIEmbeddingClient::write_callback(void *contents, size_t size, size_t nmemb,
                                             std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

CURL *OpenAIEmbeddingClient::ensure_handle() {
  if (!curl_handle_) {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
      throw EmbeddingProviderError("embed", "failed to initialize CURL");
    }
  }
  return curl_handle_;
}

std::string OpenAIEmbeddingClient::post_json(const std::string &url, const std::string &body,
                                             const Deadline &deadline) {
  std::lock_guard<std::mutex> lock(curl_mutex_);
  CURL *curl = ensure_handle();
  curl_easy_reset(curl);

  long timeout_ms = static_cast<long>(std::min(options().request_timeout, deadline.remaining()).count());
  if (timeout_ms <= 0) {
    throw RetrievalTimeout("embed", "deadline expired before the embedding request");
  }

  std::string response_body;
  std::string auth_header = "Authorization: Bearer " + api_key_;
  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, auth_header.c_str());

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    throw EmbeddingProviderError("embed", std::string("HTTP request failed: ") + curl_easy_strerror(res),
                                 /*transient*/ true);
  }
  if (http_code == 429 || http_code >= 500) {
    throw EmbeddingProviderError("embed", "provider returned HTTP " + std::to_string(http_code) +
                                              ": " + response_body,
                                 /*transient*/ true);
  }
  if (http_code < 200 || http_code >= 300) {
    throw EmbeddingProviderError("embed", "provider returned HTTP " + std::to_string(http_code) +
                                              ": " + response_body);
  }
  return response_body;
}

std::vector<IndexedEmbedding> OpenAIEmbeddingClient::fetch_batch(
    const std::vector<std::string> &batch, const Deadline &deadline) {
  nlohmann::json request = {{"model", options().model},
                            {"input", batch},
                            {"dimensions", options().dimensions},
                            {"encoding_format", "float"}};

  std::string response_body = post_json(base_url_ + "/embeddings", request.dump(), deadline);

  try {
    nlohmann::json response = nlohmann::json::parse(response_body);
    if (!response.contains("data") || !response["data"].is_array()) {
      throw EmbeddingProviderError("embed", "response does not contain a data array");
    }

    std::vector<IndexedEmbedding> items;
    items.reserve(response["data"].size());
    for (const auto &item : response["data"]) {
      IndexedEmbedding indexed;
      indexed.index = item.at("index").get<int>();
      indexed.embedding = item.at("embedding").get<std::vector<float>>();
      items.push_back(std::move(indexed));
    }
    return items;
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingProviderError("embed", std::string("malformed provider response: ") + e.what());
  }
}

}  // namespace rag_core
