#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

// A stored chunk as returned by get_all().
struct VectorEntry {
  std::string chunk_id;
  std::string text;
  ChunkMetadata metadata;
};

// Smaller distance means more similar. distance = 1 - cosine similarity.
struct VectorHit {
  std::string chunk_id;
  float distance = 0.0f;
  std::string text;
  ChunkMetadata metadata;
};

/**
 * @class VectorIndex
 * @brief Nearest-neighbour store keyed by chunk id within one named collection.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Inserts or replaces entries by chunk id. Every chunk must carry an
  // embedding of dimension().
  virtual void upsert(const std::vector<Chunk> &chunks) = 0;

  // Up to top_k hits by ascending distance; fewer when the collection is small.
  virtual std::vector<VectorHit> query(const Embedding &embedding, size_t top_k) const = 0;

  // Drops every entry. A collection that does not exist is not an error.
  virtual void reset() = 0;

  virtual size_t count() const = 0;
  virtual std::vector<VectorEntry> get_all() const = 0;
  virtual int dimension() const = 0;
  virtual const std::string &collection_name() const = 0;
};

// Opens (or creates) the vector collection with the given name.
using VectorIndexFactory =
    std::function<std::shared_ptr<VectorIndex>(const std::string &collection_name)>;

}  // namespace rag_core
