#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "rag_core/db/collection_registry.hpp"
#include "rag_core/deadline.hpp"
#include "rag_core/index/keyword_index.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/source_document.hpp"
#include "rag_core/text/chunker.hpp"

namespace rag_core {

enum class IndexState { UNINITIALIZED, INITIALIZING, READY, FAILED };

std::string to_string(IndexState state);

// A complete, immutable pair of indexes over the same chunk set. Readers hold
// it through a shared_ptr for the duration of one query.
struct IndexSet {
  std::shared_ptr<VectorIndex> vector_index;
  std::shared_ptr<const KeywordIndex> keyword_index;
  std::string collection_name;
  int64_t generation = 0;
  std::string source_hash;
};

struct IndexStatus {
  IndexState state = IndexState::UNINITIALIZED;
  size_t document_count = 0;
  size_t keyword_document_count = 0;
  std::optional<std::chrono::system_clock::time_point> last_build_time;
  std::string collection_name;
  int64_t generation = 0;
  bool warm_started = false;
  std::string last_error;
};

struct IndexLifecycleOptions {
  std::string collection_base_name = "car_manual";
  std::filesystem::path data_file;
  Bm25Options bm25;
};

/**
 * @class IndexLifecycle
 * @brief Builds the vector and keyword indexes from the source document and
 * publishes them together.
 *
 * States: UNINITIALIZED -> INITIALIZING -> READY | FAILED, and
 * READY/FAILED -> INITIALIZING on rebuild(). A build writes into a fresh
 * collection generation and a fresh KeywordIndex; only after both agree on
 * the chunk id set is the pair published with a single pointer swap, so
 * acquire() never observes a half-built pair. While a rebuild started from
 * READY is running, the previously published pair keeps serving even though
 * state() reports INITIALIZING; acquire() throws only when no complete pair
 * exists. Dropping superseded generations happens after publishing, and a
 * failure there is logged without affecting state().
 */
class IndexLifecycle {
 public:
  IndexLifecycle(IndexLifecycleOptions options, std::shared_ptr<EmbeddingProvider> embedder,
                 text::Chunker chunker, VectorIndexFactory vector_factory,
                 CollectionRegistry &registry);

  /**
   * @brief Brings the indexes to READY. Reuses the active persisted collection
   * when it was built from the same document with the same dimension.
   * A no-op when already READY.
   * @param data_file Overrides the configured source document when non-empty.
   * @throws InitError if the build fails or another build is in progress.
   */
  void initialize(const std::filesystem::path &data_file = {}, const Deadline &deadline = Deadline());

  // Always chunks, embeds and indexes from scratch.
  void rebuild(const std::filesystem::path &data_file = {}, const Deadline &deadline = Deadline());

  // The published pair. Throws IndexNotReady when nothing may be served.
  std::shared_ptr<const IndexSet> acquire() const;

  IndexStatus status() const;
  IndexState state() const;

  const IndexLifecycleOptions &options() const {
    return options_;
  }

 private:
  void run_build(const char *operation, bool allow_warm_start,
                 const std::filesystem::path &data_file, const Deadline &deadline);
  std::shared_ptr<const IndexSet> try_warm_start(const SourceDocument &document);
  std::shared_ptr<const IndexSet> full_build(const SourceDocument &document,
                                             const Deadline &deadline);
  void verify_consistent(const VectorIndex &vector_index, const KeywordIndex &keyword_index) const;

  IndexLifecycleOptions options_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  text::Chunker chunker_;
  VectorIndexFactory vector_factory_;
  CollectionRegistry &registry_;

  mutable std::mutex mutex_;
  IndexState state_ = IndexState::UNINITIALIZED;
  std::shared_ptr<const IndexSet> current_;
  IndexStatus status_;
};

}  // namespace rag_core
