#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

struct QueryEmbeddingCacheOptions {
  std::chrono::milliseconds ttl{300000};
  size_t max_size = 100;
};

/**
 * @class CachedEmbeddingProvider
 * @brief Exact-text memo in front of another provider for single-text calls.
 *
 * Repeated queries ("how do I start the engine?") skip the network round
 * trip. Keys are trimmed and lower-cased. Multi-text calls (index builds)
 * bypass the cache.
 */
class CachedEmbeddingProvider : public EmbeddingProvider {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  CachedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                          const QueryEmbeddingCacheOptions &options, NowFn now = Clock::now);

  std::vector<Embedding> embed(const std::vector<std::string> &texts,
                               const Deadline &deadline = Deadline()) override;
  Embedding embed_one(const std::string &text, const Deadline &deadline = Deadline()) override;

  int dimension() const override {
    return inner_->dimension();
  }

  size_t size() const;

 private:
  struct Entry {
    Embedding embedding;
    Clock::time_point created_at;
    uint64_t sequence;
  };

  std::shared_ptr<EmbeddingProvider> inner_;
  QueryEmbeddingCacheOptions options_;
  NowFn now_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t next_sequence_ = 0;

  static std::string normalize_key(const std::string &text);
  void evict_locked(Clock::time_point now);
};

}  // namespace rag_core
