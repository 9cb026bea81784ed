#include "rag_core/index/faiss_vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/similarity.hpp"
#include "rag_core/services/compression_service.hpp"

namespace rag_core {

namespace {

std::string now_as_string() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::vector<char> vector_to_blob(const std::vector<float> &v) {
  const char *begin = reinterpret_cast<const char *>(v.data());
  return std::vector<char>(begin, begin + v.size() * sizeof(float));
}

}  // namespace

FaissVectorStore::FaissVectorStore(DatabaseManager &db_manager, const std::string &collection_name,
                                   int dimension)
    : db_manager_(db_manager), collection_name_(collection_name), dimension_(dimension) {
  if (dimension_ <= 0) {
    throw ConfigError("open_collection", "embedding dimension must be positive");
  }
  if (collection_name_.empty()) {
    throw ConfigError("open_collection", "collection name must not be empty");
  }
  create_collection_if_not_exists();
  load_from_store();
}

void FaissVectorStore::create_collection_if_not_exists() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO collections (name, base_name, dimension, created_at) "
             "VALUES (?, ?, ?, ?)"
          << collection_name_ << collection_name_ << dimension_ << now_as_string();

    int stored_dimension = 0;
    *conn << "SELECT dimension FROM collections WHERE name = ?" << collection_name_ >>
        stored_dimension;
    if (stored_dimension != dimension_) {
      throw ConfigError("open_collection",
                        "collection '" + collection_name_ + "' stores dimension " +
                            std::to_string(stored_dimension) + " but " +
                            std::to_string(dimension_) + " is configured");
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("open_collection", format_db_error(e));
  }
}

std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_base_index() const {
  auto index = std::make_unique<faiss::IndexIDMap>(new faiss::IndexFlatIP(dimension_));
  index->own_fields = true;
  return index;
}

void FaissVectorStore::load_from_store() {
  std::vector<VectorEntry> loaded;
  std::vector<float> all_vectors_flat;
  const size_t expected_bytes = static_cast<size_t>(dimension_) * sizeof(float);

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_id, content, metadata, vector_blob FROM vector_entries "
             "WHERE collection = ? ORDER BY sequence_index, chunk_id"
          << collection_name_ >>
        [&](std::string chunk_id, std::vector<char> content, std::string metadata_json,
            std::vector<char> vector_blob) {
          if (vector_blob.size() != expected_bytes) {
            std::cerr << "[FaissVectorStore] Warning: skipping " << chunk_id
                      << " with mismatched vector size " << vector_blob.size() << " bytes"
                      << std::endl;
            return;
          }
          VectorEntry entry;
          entry.chunk_id = std::move(chunk_id);
          entry.text = CompressionService::decompress(content);
          entry.metadata = nlohmann::json::parse(metadata_json).get<ChunkMetadata>();
          loaded.push_back(std::move(entry));

          const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
          all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension_);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("load_collection", format_db_error(e));
  } catch (const nlohmann::json::exception &e) {
    throw VectorIndexError("load_collection", std::string("corrupt metadata: ") + e.what());
  }

  std::unique_lock lock(mutex_);
  faiss_index_ = create_base_index();
  entries_.clear();
  label_by_chunk_id_.clear();
  next_label_ = 0;

  std::vector<faiss::idx_t> labels;
  labels.reserve(loaded.size());
  for (auto &entry : loaded) {
    const faiss::idx_t label = next_label_++;
    labels.push_back(label);
    label_by_chunk_id_[entry.chunk_id] = label;
    entries_.emplace(label, std::move(entry));
  }
  if (!labels.empty()) {
    faiss_index_->add_with_ids(static_cast<faiss::idx_t>(labels.size()), all_vectors_flat.data(),
                               labels.data());
  }
}

void FaissVectorStore::validate_dimension(const std::vector<float> &vector,
                                          const std::string &what) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw ConfigError("vector_dimension", what + " has dimension " +
                                              std::to_string(vector.size()) + ", collection '" +
                                              collection_name_ + "' expects " +
                                              std::to_string(dimension_));
  }
}

void FaissVectorStore::upsert(const std::vector<Chunk> &chunks) {
  if (chunks.empty()) {
    return;
  }

  std::vector<std::vector<float>> normalized;
  normalized.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    validate_dimension(chunk.embedding, "embedding of " + chunk.id);
    normalized.push_back(l2_normalized(chunk.embedding));
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (size_t i = 0; i < chunks.size(); ++i) {
      const auto &chunk = chunks[i];
      *conn << "INSERT OR REPLACE INTO vector_entries "
               "(collection, chunk_id, sequence_index, content, metadata, vector_blob) "
               "VALUES (?, ?, ?, ?, ?, ?)"
            << collection_name_ << chunk.id << chunk.metadata.sequence_index
            << CompressionService::compress(chunk.text) << nlohmann::json(chunk.metadata).dump()
            << vector_to_blob(normalized[i]);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("upsert", format_db_error(e));
  }

  std::unique_lock lock(mutex_);
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto &chunk = chunks[i];
    auto existing = label_by_chunk_id_.find(chunk.id);
    if (existing != label_by_chunk_id_.end()) {
      faiss::idx_t old_label = existing->second;
      faiss::IDSelectorBatch selector(1, &old_label);
      faiss_index_->remove_ids(selector);
      entries_.erase(old_label);
    }
    const faiss::idx_t label = next_label_++;
    faiss_index_->add_with_ids(1, normalized[i].data(), &label);
    label_by_chunk_id_[chunk.id] = label;
    entries_[label] = VectorEntry{chunk.id, chunk.text, chunk.metadata};
  }
}

std::vector<VectorHit> FaissVectorStore::query(const Embedding &embedding, size_t top_k) const {
  validate_dimension(embedding, "query embedding");

  std::shared_lock lock(mutex_);
  const auto actual_k =
      static_cast<faiss::idx_t>(std::min<size_t>(top_k, static_cast<size_t>(faiss_index_->ntotal)));
  if (actual_k <= 0) {
    return {};
  }

  const std::vector<float> query_vector = l2_normalized(embedding);
  std::vector<float> similarities(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  faiss_index_->search(1, query_vector.data(), actual_k, similarities.data(), labels.data());

  std::vector<VectorHit> hits;
  hits.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    auto it = entries_.find(labels[i]);
    if (it == entries_.end()) {
      std::cerr << "[FaissVectorStore] Warning: faiss returned unknown label " << labels[i]
                << std::endl;
      continue;
    }
    hits.push_back({it->second.chunk_id, 1.0f - similarities[i], it->second.text,
                    it->second.metadata});
  }
  return hits;
}

void FaissVectorStore::reset() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM vector_entries WHERE collection = ?" << collection_name_;
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("reset", format_db_error(e));
  }
  create_collection_if_not_exists();

  std::unique_lock lock(mutex_);
  faiss_index_ = create_base_index();
  entries_.clear();
  label_by_chunk_id_.clear();
}

size_t FaissVectorStore::count() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::vector<VectorEntry> FaissVectorStore::get_all() const {
  std::vector<VectorEntry> all;
  // Same rows as load_from_store: entries with a wrong-sized vector are not indexed.
  const auto expected_bytes =
      static_cast<int64_t>(dimension_) * static_cast<int64_t>(sizeof(float));
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_id, content, metadata FROM vector_entries "
             "WHERE collection = ? AND length(vector_blob) = ? "
             "ORDER BY sequence_index, chunk_id"
          << collection_name_ << expected_bytes >>
        [&](std::string chunk_id, std::vector<char> content, std::string metadata_json) {
          all.push_back({std::move(chunk_id), CompressionService::decompress(content),
                         nlohmann::json::parse(metadata_json).get<ChunkMetadata>()});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("get_all", format_db_error(e));
  } catch (const nlohmann::json::exception &e) {
    throw VectorIndexError("get_all", std::string("corrupt metadata: ") + e.what());
  }
  return all;
}

}  // namespace rag_core
