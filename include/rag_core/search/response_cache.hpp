#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/deadline.hpp"
#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

struct ResponseCacheOptions {
  bool enabled = true;
  double similarity_threshold = 0.90;
  std::chrono::milliseconds ttl{600000};
  size_t max_size = 100;
};

struct CacheHit {
  std::string response;
  double similarity = 0.0;
};

struct CacheStats {
  size_t size = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t evictions = 0;
  uint64_t expirations = 0;
};

/**
 * @class ResponseCache
 * @brief Memoizes responses keyed by the embedding of the query that produced
 * them rather than its exact text.
 *
 * A lookup scans the live entries for the highest cosine similarity; at or
 * above the threshold the entry is a hit and its access time is refreshed.
 * Entries older than the TTL are skipped and removed during the scan. Inserts
 * beyond max_size evict the least recently accessed entry. Every read-modify
 * step runs under one mutex; compute functions run outside it.
 */
class ResponseCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;
  // Receives the query embedding so callers need not embed the text again.
  using ComputeFn = std::function<std::string(const Embedding &)>;

  struct Outcome {
    std::string response;
    bool cached = false;
    double similarity = 0.0;
  };

  ResponseCache(std::shared_ptr<EmbeddingProvider> embedder, const ResponseCacheOptions &options,
                NowFn now = Clock::now);

  // Empty on a miss. Refreshes the access time of the matched entry.
  std::optional<CacheHit> lookup(const Embedding &query_embedding);

  // Incremented by clear(). A response computed against data read before a
  // clear() passes the epoch it started under so it is not stored afterwards.
  uint64_t epoch() const;

  // Returns false when epoch no longer matches and nothing was stored.
  bool store(const Embedding &query_embedding, std::string response,
             std::optional<uint64_t> epoch = std::nullopt);

  /**
   * @brief Embeds query_text, returns a cached response on a hit, otherwise
   * runs compute and caches its result.
   * @throws RetrievalError when the query cannot be embedded. Exceptions from
   * compute propagate and nothing is cached.
   */
  Outcome lookup_or_compute(const std::string &query_text, const ComputeFn &compute,
                            const Deadline &deadline = Deadline());

  size_t size() const;
  void clear();
  CacheStats stats() const;

  const ResponseCacheOptions &options() const {
    return options_;
  }

 private:
  struct Entry {
    Embedding query_embedding;
    std::string response;
    Clock::time_point created_at;
    Clock::time_point last_accessed_at;
    // Breaks ties between accesses at the same clock reading.
    uint64_t access_sequence = 0;
  };

  bool is_expired(const Entry &entry, Clock::time_point now) const;
  void purge_expired_locked(Clock::time_point now);
  void evict_lru_locked();

  std::shared_ptr<EmbeddingProvider> embedder_;
  ResponseCacheOptions options_;
  NowFn now_;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  uint64_t next_sequence_ = 0;
  uint64_t epoch_ = 0;
  CacheStats stats_;
};

}  // namespace rag_core
