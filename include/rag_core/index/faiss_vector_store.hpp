#pragma once

#include <faiss/IndexIDMap.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/db/database_manager.hpp"
#include "rag_core/index/vector_index.hpp"

namespace rag_core {

/**
 * @class FaissVectorStore
 * @brief VectorIndex persisted in SQLite and searched through an exact
 * inner-product faiss index over unit vectors.
 *
 * Rows of the collection are loaded into memory on construction, so a store
 * opened on an existing collection serves queries without re-embedding.
 */
class FaissVectorStore : public VectorIndex {
 public:
  // Opens the collection, creating it when absent. Throws ConfigError when the
  // stored collection has a different dimension.
  FaissVectorStore(DatabaseManager &db_manager, const std::string &collection_name, int dimension);

  void upsert(const std::vector<Chunk> &chunks) override;
  std::vector<VectorHit> query(const Embedding &embedding, size_t top_k) const override;
  void reset() override;
  size_t count() const override;
  std::vector<VectorEntry> get_all() const override;

  int dimension() const override {
    return dimension_;
  }
  const std::string &collection_name() const override {
    return collection_name_;
  }

  FaissVectorStore(const FaissVectorStore &) = delete;
  FaissVectorStore &operator=(const FaissVectorStore &) = delete;

 private:
  void create_collection_if_not_exists();
  void load_from_store();
  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  void validate_dimension(const std::vector<float> &vector, const std::string &what) const;

  DatabaseManager &db_manager_;
  std::string collection_name_;
  int dimension_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  // faiss label -> entry; labels are never reused within one store.
  std::unordered_map<faiss::idx_t, VectorEntry> entries_;
  std::unordered_map<std::string, faiss::idx_t> label_by_chunk_id_;
  faiss::idx_t next_label_ = 0;
};

}  // namespace rag_core
