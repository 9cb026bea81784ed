#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "rag_core/deadline.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

using Embedding = std::vector<float>;

// One vector of a provider response, tagged with the position of its input.
struct IndexedEmbedding {
  int index = 0;
  Embedding embedding;
};

struct EmbeddingOptions {
  std::string model = "text-embedding-v4";
  int dimensions = 1024;
  int batch_size = 10;
  // Extra attempts for transient failures only.
  int max_retries = 2;
  std::chrono::milliseconds retry_backoff{250};
  std::chrono::milliseconds request_timeout{30000};
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Returns exactly one vector per input text, in input order.
  virtual std::vector<Embedding> embed(const std::vector<std::string> &texts,
                                       const Deadline &deadline = Deadline()) = 0;

  virtual Embedding embed_one(const std::string &text, const Deadline &deadline = Deadline());

  virtual int dimension() const = 0;
};

/**
 * @class BatchingEmbeddingClient
 * @brief Shared request policy for remote embedding backends.
 *
 * Splits the input into batches of at most batch_size texts, issues them one
 * after another, restores input order from each item's index field (never
 * from arrival order), validates count and dimension, and retries transient
 * failures a bounded number of times. Subclasses implement a single request.
 */
class BatchingEmbeddingClient : public EmbeddingProvider {
 public:
  explicit BatchingEmbeddingClient(const EmbeddingOptions &options);

  std::vector<Embedding> embed(const std::vector<std::string> &texts,
                               const Deadline &deadline = Deadline()) final;

  int dimension() const override {
    return options_.dimensions;
  }
  const EmbeddingOptions &options() const {
    return options_;
  }

 protected:
  // One outbound request. Items may come back in any order.
  virtual std::vector<IndexedEmbedding> fetch_batch(const std::vector<std::string> &batch,
                                                    const Deadline &deadline) = 0;

 private:
  std::vector<Embedding> fetch_with_retry(const std::vector<std::string> &batch,
                                          const Deadline &deadline);
  std::vector<Embedding> reorder_and_validate(std::vector<IndexedEmbedding> items,
                                              size_t expected) const;

  EmbeddingOptions options_;
};

}  // namespace rag_core
