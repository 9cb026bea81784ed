#include <gtest/gtest.h>

#include "rag_core/llm/cached_embedding_provider.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::CachedEmbeddingProvider;
using rag_core::QueryEmbeddingCacheOptions;

class CachedEmbeddingProviderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    inner_ = std::make_shared<FakeEmbeddingProvider>(8);
  }

  std::unique_ptr<CachedEmbeddingProvider> make_cache(size_t max_size = 100) {
    QueryEmbeddingCacheOptions options;
    options.max_size = max_size;
    return std::make_unique<CachedEmbeddingProvider>(inner_, options, clock_.as_function());
  }

  std::shared_ptr<FakeEmbeddingProvider> inner_;
  FakeClock clock_;
};

TEST_F(CachedEmbeddingProviderTest, RepeatedQueryHitsCache) {
  auto cache = make_cache();
  auto first = cache->embed_one("How do I start the engine?");
  auto second = cache->embed_one("How do I start the engine?");

  EXPECT_EQ(first, second);
  EXPECT_EQ(inner_->call_count(), 1);
  EXPECT_EQ(cache->size(), 1u);
}

TEST_F(CachedEmbeddingProviderTest, KeyIgnoresCaseAndSurroundingWhitespace) {
  auto cache = make_cache();
  cache->embed_one("Start Engine");
  cache->embed_one("  start engine\n");
  EXPECT_EQ(inner_->call_count(), 1);
}

TEST_F(CachedEmbeddingProviderTest, EntriesExpireAfterTtl) {
  auto cache = make_cache();
  cache->embed_one("tire pressure");
  clock_.advance(std::chrono::milliseconds(299999));
  cache->embed_one("tire pressure");
  EXPECT_EQ(inner_->call_count(), 1);

  clock_.advance(std::chrono::milliseconds(1));
  cache->embed_one("tire pressure");
  EXPECT_EQ(inner_->call_count(), 2);
}

TEST_F(CachedEmbeddingProviderTest, EvictsOldestBeyondMaxSize) {
  auto cache = make_cache(2);
  cache->embed_one("a");
  cache->embed_one("b");
  cache->embed_one("c");
  EXPECT_EQ(cache->size(), 2u);
  EXPECT_EQ(inner_->call_count(), 3);

  cache->embed_one("c");
  EXPECT_EQ(inner_->call_count(), 3);
  cache->embed_one("a");
  EXPECT_EQ(inner_->call_count(), 4);
}

TEST_F(CachedEmbeddingProviderTest, MultiTextCallsBypassCache) {
  auto cache = make_cache();
  auto embeddings = cache->embed({"one", "two"});
  cache->embed({"one", "two"});

  EXPECT_EQ(embeddings.size(), 2u);
  EXPECT_EQ(inner_->call_count(), 2);
  EXPECT_EQ(cache->size(), 0u);
}

TEST_F(CachedEmbeddingProviderTest, FailuresAreNotCached) {
  auto cache = make_cache();
  inner_->fail_with(rag_core::EmbeddingProviderError("embed", "down", true));
  EXPECT_THROW(cache->embed_one("brake"), rag_core::EmbeddingProviderError);
  EXPECT_EQ(cache->size(), 0u);

  inner_->fail_with(std::nullopt);
  EXPECT_NO_THROW(cache->embed_one("brake"));
  EXPECT_EQ(cache->size(), 1u);
}

TEST_F(CachedEmbeddingProviderTest, NullInnerProviderThrows) {
  EXPECT_THROW(CachedEmbeddingProvider(nullptr, QueryEmbeddingCacheOptions{}),
               rag_core::ConfigError);
}

}  // namespace rag_tests
