#include "rag_core/index/index_lifecycle.hpp"

#include <iostream>
#include <unordered_set>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string to_string(IndexState state) {
  switch (state) {
    case IndexState::UNINITIALIZED:
      return "UNINITIALIZED";
    case IndexState::INITIALIZING:
      return "INITIALIZING";
    case IndexState::READY:
      return "READY";
    case IndexState::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

IndexLifecycle::IndexLifecycle(IndexLifecycleOptions options,
                               std::shared_ptr<EmbeddingProvider> embedder, text::Chunker chunker,
                               VectorIndexFactory vector_factory, CollectionRegistry &registry)
    : options_(std::move(options)),
      embedder_(std::move(embedder)),
      chunker_(std::move(chunker)),
      vector_factory_(std::move(vector_factory)),
      registry_(registry) {
  if (!embedder_) {
    throw ConfigError("index_lifecycle", "an embedding provider is required");
  }
  if (!vector_factory_) {
    throw ConfigError("index_lifecycle", "a vector index factory is required");
  }
}

void IndexLifecycle::initialize(const std::filesystem::path &data_file, const Deadline &deadline) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == IndexState::READY) {
      return;
    }
  }
  run_build("initialize", true, data_file, deadline);
}

void IndexLifecycle::rebuild(const std::filesystem::path &data_file, const Deadline &deadline) {
  run_build("rebuild", false, data_file, deadline);
}

void IndexLifecycle::run_build(const char *operation, bool allow_warm_start,
                               const std::filesystem::path &data_file, const Deadline &deadline) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == IndexState::INITIALIZING) {
      throw InitError(operation, "an index build is already in progress");
    }
    state_ = IndexState::INITIALIZING;
    status_.state = state_;
  }

  const std::filesystem::path path = data_file.empty() ? options_.data_file : data_file;
  std::cout << "[IndexLifecycle] " << operation << " from " << path << std::endl;

  std::shared_ptr<const IndexSet> built;
  bool warm = false;
  try {
    SourceDocument document = SourceDocumentLoader::load(path);

    if (allow_warm_start) {
      built = try_warm_start(document);
      warm = built != nullptr;
    }
    if (!built) {
      built = full_build(document, deadline);
    }

    const size_t document_count = built->vector_index->count();
    std::shared_ptr<const IndexSet> previous;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      previous = current_;
      current_ = built;
      state_ = IndexState::READY;
      status_.state = state_;
      status_.document_count = document_count;
      status_.keyword_document_count = built->keyword_index->document_count();
      status_.last_build_time = std::chrono::system_clock::now();
      status_.collection_name = built->collection_name;
      status_.generation = built->generation;
      status_.warm_started = warm;
      status_.last_error.clear();
    }
  } catch (const std::exception &e) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = IndexState::FAILED;
    status_.state = state_;
    status_.last_error = e.what();
    std::cerr << "[IndexLifecycle] ERROR: " << operation << " failed: " << e.what() << std::endl;
    throw InitError(operation, e.what());
  }
  std::cout << "[IndexLifecycle] READY with " << built->keyword_index->document_count()
            << " chunks in " << built->collection_name << (warm ? " (warm start)" : "")
            << std::endl;

  if (!warm) {
    // The new pair is already published; leftover generations are retried by
    // the next full build.
    try {
      registry_.drop_all_except(options_.collection_base_name, built->collection_name);
    } catch (const RagError &e) {
      std::cerr << "[IndexLifecycle] Warning: could not drop old generations of "
                << options_.collection_base_name << ": " << e.what() << std::endl;
    }
  }
}

std::shared_ptr<const IndexSet> IndexLifecycle::try_warm_start(const SourceDocument &document) {
  auto active = registry_.find_active(options_.collection_base_name);
  if (!active) {
    return nullptr;
  }
  if (active->source_hash != document.content_hash) {
    std::cout << "[IndexLifecycle] Source document changed since " << active->name
              << ", rebuilding." << std::endl;
    return nullptr;
  }
  if (active->dimension != embedder_->dimension()) {
    std::cout << "[IndexLifecycle] Embedding dimension changed since " << active->name
              << ", rebuilding." << std::endl;
    return nullptr;
  }

  auto vector_index = vector_factory_(active->name);
  auto entries = vector_index->get_all();
  if (entries.empty()) {
    return nullptr;
  }

  std::vector<KeywordDocument> documents;
  documents.reserve(entries.size());
  for (auto &entry : entries) {
    documents.push_back({std::move(entry.chunk_id), std::move(entry.text), entry.metadata});
  }
  auto keyword_index = std::make_shared<const KeywordIndex>(std::move(documents), options_.bm25);
  verify_consistent(*vector_index, *keyword_index);

  auto set = std::make_shared<IndexSet>();
  set->vector_index = std::move(vector_index);
  set->keyword_index = std::move(keyword_index);
  set->collection_name = active->name;
  set->generation = active->generation;
  set->source_hash = active->source_hash;
  return set;
}

std::shared_ptr<const IndexSet> IndexLifecycle::full_build(const SourceDocument &document,
                                                           const Deadline &deadline) {
  std::vector<Chunk> chunks = chunker_.split(document.doc_id, document.content);
  if (chunks.empty()) {
    throw InitError("chunk_document", "no text in " + document.path.string());
  }
  std::cout << "[IndexLifecycle] Split " << document.path.filename() << " into " << chunks.size()
            << " chunks." << std::endl;

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }
  auto embeddings = embedder_->embed(texts, deadline);
  if (embeddings.size() != chunks.size()) {
    throw EmbeddingProviderError("embed_chunks", "expected " + std::to_string(chunks.size()) +
                                                     " embeddings, got " +
                                                     std::to_string(embeddings.size()));
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    chunks[i].embedding = std::move(embeddings[i]);
  }

  const std::string name = registry_.create_generation(
      options_.collection_base_name, document.content_hash, embedder_->dimension());
  auto set = std::make_shared<IndexSet>();
  try {
    auto vector_index = vector_factory_(name);
    vector_index->reset();
    vector_index->upsert(chunks);

    std::vector<KeywordDocument> documents;
    documents.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      documents.push_back({chunk.id, chunk.text, chunk.metadata});
    }
    auto keyword_index = std::make_shared<const KeywordIndex>(std::move(documents), options_.bm25);
    verify_consistent(*vector_index, *keyword_index);

    set->vector_index = std::move(vector_index);
    set->keyword_index = std::move(keyword_index);
    set->collection_name = name;
    set->source_hash = document.content_hash;
    for (const auto &info : registry_.list(options_.collection_base_name)) {
      if (info.name == name) {
        set->generation = info.generation;
      }
    }

    // Last step: once this commits the generation is live and must not be dropped.
    registry_.activate(name);
  } catch (const std::exception &) {
    registry_.drop(name);
    throw;
  }
  return set;
}

void IndexLifecycle::verify_consistent(const VectorIndex &vector_index,
                                       const KeywordIndex &keyword_index) const {
  if (vector_index.count() != keyword_index.document_count()) {
    throw VectorIndexError("verify_index_pair",
                           "vector index holds " + std::to_string(vector_index.count()) +
                               " chunks, keyword index " +
                               std::to_string(keyword_index.document_count()));
  }
  for (const auto &entry : vector_index.get_all()) {
    if (!keyword_index.contains(entry.chunk_id)) {
      throw VectorIndexError("verify_index_pair",
                             "chunk " + entry.chunk_id + " missing from keyword index");
    }
  }
}

std::shared_ptr<const IndexSet> IndexLifecycle::acquire() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == IndexState::READY && current_) {
    return current_;
  }
  if (state_ == IndexState::INITIALIZING && current_) {
    return current_;
  }
  throw IndexNotReady("acquire_index", "index state is " + to_string(state_));
}

IndexStatus IndexLifecycle::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

IndexState IndexLifecycle::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

}  // namespace rag_core
