#include "utilities_test.hpp"

#include <atomic>
#include <cmath>
#include <fstream>
#include <functional>
#include <random>

namespace rag_tests {

namespace {

std::string unique_suffix() {
  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  return std::to_string(timestamp) + "_" + std::to_string(counter++);
}

std::filesystem::path temp_dir() {
  auto dir = std::filesystem::temp_directory_path() / "manual_rag_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

void normalize(std::vector<float> &v) {
  double norm = 0.0;
  for (float x : v) {
    norm += static_cast<double>(x) * x;
  }
  norm = std::sqrt(norm);
  if (norm > 0.0) {
    for (float &x : v) {
      x = static_cast<float>(x / norm);
    }
  }
}

}  // namespace

std::filesystem::path TestUtilities::create_temp_test_db() {
  return temp_dir() / ("test_" + unique_suffix() + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path &db_path) {
  for (const std::string suffix : {"", "-wal", "-shm"}) {
    std::filesystem::path path = db_path.string() + suffix;
    if (std::filesystem::exists(path)) {
      std::filesystem::remove(path);
    }
  }

  // Also cleanup the parent directory if it's empty
  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir) && std::filesystem::is_empty(parent_dir)) {
    std::filesystem::remove(parent_dir);
  }
}

std::filesystem::path TestUtilities::write_temp_text_file(const std::string &contents,
                                                          const std::string &stem) {
  auto path = temp_dir() / (stem + "_" + unique_suffix() + ".txt");
  std::ofstream out(path, std::ios::binary);
  out << contents;
  return path;
}

void TestUtilities::remove_temp_file(const std::filesystem::path &path) {
  std::filesystem::remove(path);
}

std::vector<float> TestUtilities::create_test_vector(const std::string &seed_text, int dimension) {
  std::mt19937 rng(static_cast<uint32_t>(std::hash<std::string>{}(seed_text)));
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dimension);
  for (float &x : v) {
    x = dist(rng);
  }
  normalize(v);
  return v;
}

std::vector<float> TestUtilities::vector_with_cosine(const std::vector<float> &base, double cosine,
                                                     const std::string &seed_text) {
  std::vector<float> b = base;
  normalize(b);

  // Gram-Schmidt: a unit vector orthogonal to b.
  std::vector<float> u = create_test_vector(seed_text, static_cast<int>(b.size()));
  double dot = 0.0;
  for (size_t i = 0; i < b.size(); ++i) {
    dot += static_cast<double>(u[i]) * b[i];
  }
  for (size_t i = 0; i < b.size(); ++i) {
    u[i] = static_cast<float>(u[i] - dot * b[i]);
  }
  normalize(u);

  const double sine = std::sqrt(std::max(0.0, 1.0 - cosine * cosine));
  std::vector<float> out(b.size());
  for (size_t i = 0; i < b.size(); ++i) {
    out[i] = static_cast<float>(cosine * b[i] + sine * u[i]);
  }
  return out;
}

rag_core::Chunk TestUtilities::create_test_chunk(const std::string &doc_id, int sequence_index,
                                                 const std::string &text, int dimension) {
  rag_core::Chunk chunk;
  chunk.id = rag_core::make_chunk_id(doc_id, sequence_index);
  chunk.source_doc_id = doc_id;
  chunk.sequence_index = sequence_index;
  chunk.text = text;
  chunk.token_count = static_cast<int>(text.size());
  chunk.embedding = create_test_vector(text, dimension);
  chunk.metadata.source_doc_id = doc_id;
  chunk.metadata.sequence_index = sequence_index;
  chunk.metadata.end_offset = static_cast<int64_t>(text.size());
  chunk.metadata.token_count = static_cast<int64_t>(text.size());
  return chunk;
}

std::vector<rag_core::Embedding> FakeEmbeddingProvider::embed(
    const std::vector<std::string> &texts, const rag_core::Deadline &deadline) {
  ++calls_;
  texts_ += texts.size();
  deadline.throw_if_expired("embed");

  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_) {
    throw *failure_;
  }
  std::vector<rag_core::Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto it = fixed_.find(text);
    out.push_back(it != fixed_.end() ? it->second
                                     : TestUtilities::create_test_vector(text, dimension_));
  }
  return out;
}

void FakeEmbeddingProvider::set_embedding(const std::string &text,
                                          const rag_core::Embedding &embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  fixed_[text] = embedding;
}

void FakeEmbeddingProvider::fail_with(std::optional<rag_core::EmbeddingProviderError> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = std::move(error);
}

}  // namespace rag_tests
