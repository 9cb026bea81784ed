#include "rag_core/search/response_cache.hpp"

#include <algorithm>
#include <iostream>

#include "rag_core/errors.hpp"
#include "rag_core/index/similarity.hpp"

namespace rag_core {

ResponseCache::ResponseCache(std::shared_ptr<EmbeddingProvider> embedder,
                             const ResponseCacheOptions &options, NowFn now)
    : embedder_(std::move(embedder)), options_(options), now_(std::move(now)) {
  if (options_.similarity_threshold <= 0.0 || options_.similarity_threshold > 1.0) {
    throw ConfigError("response_cache", "similarity_threshold must be within (0, 1]");
  }
  if (options_.max_size == 0) {
    throw ConfigError("response_cache", "max_size must be positive");
  }
  if (options_.ttl.count() <= 0) {
    throw ConfigError("response_cache", "ttl must be positive");
  }
}

bool ResponseCache::is_expired(const Entry &entry, Clock::time_point now) const {
  return now - entry.created_at >= options_.ttl;
}

void ResponseCache::purge_expired_locked(Clock::time_point now) {
  const auto before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const Entry &entry) { return is_expired(entry, now); }),
                 entries_.end());
  stats_.expirations += before - entries_.size();
}

void ResponseCache::evict_lru_locked() {
  auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                 [](const Entry &a, const Entry &b) {
                                   if (a.last_accessed_at != b.last_accessed_at) {
                                     return a.last_accessed_at < b.last_accessed_at;
                                   }
                                   return a.access_sequence < b.access_sequence;
                                 });
  if (oldest != entries_.end()) {
    entries_.erase(oldest);
    ++stats_.evictions;
  }
}

std::optional<CacheHit> ResponseCache::lookup(const Embedding &query_embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = now_();
  purge_expired_locked(now);

  Entry *best = nullptr;
  double best_similarity = -1.0;
  for (auto &entry : entries_) {
    const double similarity = cosine_similarity(query_embedding, entry.query_embedding);
    if (similarity > best_similarity) {
      best_similarity = similarity;
      best = &entry;
    }
  }

  if (!best || best_similarity < options_.similarity_threshold) {
    ++stats_.misses;
    return std::nullopt;
  }
  best->last_accessed_at = now;
  best->access_sequence = next_sequence_++;
  ++stats_.hits;
  return CacheHit{best->response, best_similarity};
}

uint64_t ResponseCache::epoch() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return epoch_;
}

bool ResponseCache::store(const Embedding &query_embedding, std::string response,
                          std::optional<uint64_t> epoch) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (epoch && *epoch != epoch_) {
    return false;
  }
  const auto now = now_();
  purge_expired_locked(now);
  while (entries_.size() >= options_.max_size) {
    evict_lru_locked();
  }

  Entry entry;
  entry.query_embedding = query_embedding;
  entry.response = std::move(response);
  entry.created_at = now;
  entry.last_accessed_at = now;
  entry.access_sequence = next_sequence_++;
  entries_.push_back(std::move(entry));
  return true;
}

ResponseCache::Outcome ResponseCache::lookup_or_compute(const std::string &query_text,
                                                        const ComputeFn &compute,
                                                        const Deadline &deadline) {
  Embedding embedding;
  try {
    embedding = embedder_->embed_one(query_text, deadline);
  } catch (const EmbeddingProviderError &e) {
    throw RetrievalError("embed_query", e.what());
  }

  const uint64_t started_epoch = epoch();
  if (options_.enabled) {
    if (auto hit = lookup(embedding)) {
      std::cout << "[ResponseCache] Hit (similarity " << hit->similarity << ")" << std::endl;
      return {std::move(hit->response), true, hit->similarity};
    }
  }

  std::string response = compute(embedding);
  if (options_.enabled) {
    store(embedding, response, started_epoch);
  }
  return {std::move(response), false, 0.0};
}

size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  ++epoch_;
}

CacheStats ResponseCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats = stats_;
  stats.size = entries_.size();
  return stats;
}

}  // namespace rag_core
