#include "rag_core/llm/cached_embedding_provider.hpp"

#include <cctype>

namespace rag_core {

CachedEmbeddingProvider::CachedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                                                 const QueryEmbeddingCacheOptions &options,
                                                 NowFn now)
    : inner_(std::move(inner)), options_(options), now_(std::move(now)) {
  if (!inner_) {
    throw ConfigError("CachedEmbeddingProvider", "inner provider is null");
  }
}

std::string CachedEmbeddingProvider::normalize_key(const std::string &text) {
  size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\r\n");
  std::string key = text.substr(begin, end - begin + 1);
  for (char &c : key) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return key;
}

std::vector<Embedding> CachedEmbeddingProvider::embed(const std::vector<std::string> &texts,
                                                      const Deadline &deadline) {
  if (texts.size() == 1) {
    return {embed_one(texts.front(), deadline)};
  }
  return inner_->embed(texts, deadline);
}

Embedding CachedEmbeddingProvider::embed_one(const std::string &text, const Deadline &deadline) {
  const std::string key = normalize_key(text);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      if (now_() - it->second.created_at < options_.ttl) {
        return it->second.embedding;
      }
      entries_.erase(it);
    }
  }

  Embedding embedding = inner_->embed_one(text, deadline);

  if (options_.max_size > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    entries_[key] = Entry{embedding, now, next_sequence_++};
    evict_locked(now);
  }
  return embedding;
}

void CachedEmbeddingProvider::evict_locked(Clock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.created_at >= options_.ttl) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  while (entries_.size() > options_.max_size) {
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->second.sequence < oldest->second.sequence) {
        oldest = it;
      }
    }
    entries_.erase(oldest);
  }
}

size_t CachedEmbeddingProvider::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace rag_core
