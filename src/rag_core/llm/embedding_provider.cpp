#include "rag_core/llm/embedding_provider.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace rag_core {

Embedding EmbeddingProvider::embed_one(const std::string &text, const Deadline &deadline) {
  std::vector<Embedding> embeddings = embed({text}, deadline);
  if (embeddings.size() != 1) {
    throw EmbeddingProviderError("embed_one", "expected 1 embedding, got " +
                                                  std::to_string(embeddings.size()));
  }
  return std::move(embeddings.front());
}

BatchingEmbeddingClient::BatchingEmbeddingClient(const EmbeddingOptions &options)
    : options_(options) {
  if (options_.dimensions <= 0) {
    throw ConfigError("BatchingEmbeddingClient", "dimensions must be positive");
  }
  if (options_.batch_size <= 0) {
    throw ConfigError("BatchingEmbeddingClient", "batch_size must be positive");
  }
  if (options_.max_retries < 0) {
    throw ConfigError("BatchingEmbeddingClient", "max_retries must not be negative");
  }
}

std::vector<Embedding> BatchingEmbeddingClient::embed(const std::vector<std::string> &texts,
                                                      const Deadline &deadline) {
  std::vector<Embedding> all_embeddings;
  if (texts.empty()) {
    return all_embeddings;
  }
  all_embeddings.reserve(texts.size());

  const size_t batch_size = static_cast<size_t>(options_.batch_size);
  for (size_t offset = 0; offset < texts.size(); offset += batch_size) {
    const size_t end = std::min(offset + batch_size, texts.size());
    std::vector<std::string> batch(texts.begin() + offset, texts.begin() + end);

    std::vector<Embedding> batch_embeddings = fetch_with_retry(batch, deadline);
    for (auto &embedding : batch_embeddings) {
      all_embeddings.push_back(std::move(embedding));
    }

    if (texts.size() > batch_size) {
      std::cout << "[Embedding] Processed " << end << "/" << texts.size() << " texts" << std::endl;
    }
  }
  return all_embeddings;
}

std::vector<Embedding> BatchingEmbeddingClient::fetch_with_retry(
    const std::vector<std::string> &batch, const Deadline &deadline) {
  for (int attempt = 0;; ++attempt) {
    deadline.throw_if_expired("embed");
    try {
      return reorder_and_validate(fetch_batch(batch, deadline), batch.size());
    } catch (const EmbeddingProviderError &e) {
      if (!e.is_transient() || attempt >= options_.max_retries) {
        throw;
      }
      deadline.throw_if_expired("embed");
      auto backoff = options_.retry_backoff * (attempt + 1);
      backoff = std::min(backoff, deadline.remaining());
      std::cerr << "[Embedding] Warning: transient failure (attempt " << attempt + 1 << " of "
                << options_.max_retries + 1 << "): " << e.what() << ". Retrying in "
                << backoff.count() << "ms" << std::endl;
      std::this_thread::sleep_for(backoff);
    }
  }
}

std::vector<Embedding> BatchingEmbeddingClient::reorder_and_validate(
    std::vector<IndexedEmbedding> items, size_t expected) const {
  if (items.size() != expected) {
    throw EmbeddingProviderError("embed", "provider returned " + std::to_string(items.size()) +
                                              " embeddings for " + std::to_string(expected) +
                                              " inputs");
  }

  std::sort(items.begin(), items.end(),
            [](const IndexedEmbedding &a, const IndexedEmbedding &b) { return a.index < b.index; });

  std::vector<Embedding> ordered;
  ordered.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    if (items[i].index != static_cast<int>(i)) {
      throw EmbeddingProviderError("embed", "provider returned an invalid or duplicate index " +
                                                std::to_string(items[i].index));
    }
    if (items[i].embedding.size() != static_cast<size_t>(options_.dimensions)) {
      throw EmbeddingProviderError("embed", "embedding dimension mismatch. Expected " +
                                                std::to_string(options_.dimensions) + ", got " +
                                                std::to_string(items[i].embedding.size()));
    }
    ordered.push_back(std::move(items[i].embedding));
  }
  return ordered;
}

}  // namespace rag_core
