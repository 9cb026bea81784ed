#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

#include "mocks_test.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/faiss_vector_store.hpp"
#include "rag_core/search/hybrid_retriever.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::Embedding;
using rag_core::HybridRetriever;
using rag_core::QueryParams;
using rag_core::RetrievalOptions;
using testing::_;
using testing::NiceMock;

namespace {

// Four chunks of exactly ten code points each.
const std::vector<std::string> kSegments = {"brake pad.", "oil filter", "tire check", "wiper fix."};
// Cosine similarity of each segment's embedding to the query embedding.
const std::vector<double> kCosines = {0.9, 0.5, 0.1, -0.3};

}  // namespace

class HybridRetrieverTest : public DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    registry_ = std::make_unique<rag_core::CollectionRegistry>(*db_manager_);
    embedder_ = std::make_shared<FakeEmbeddingProvider>(8);
    pool_ = std::make_unique<rag_core::async::WorkerPool>(2);
    pool_->start();

    std::string content;
    for (const auto &segment : kSegments) {
      content += segment;
    }
    manual_path_ = TestUtilities::write_temp_text_file(content, "manual");

    query_embedding_ = TestUtilities::create_test_vector("query", 8);
    for (size_t i = 0; i < kSegments.size(); ++i) {
      embedder_->set_embedding(
          kSegments[i], TestUtilities::vector_with_cosine(query_embedding_, kCosines[i],
                                                          "segment" + std::to_string(i)));
    }
    for (const char *query : {"tire", "tire check", "oil", "brake", "nothing matches"}) {
      embedder_->set_embedding(query, query_embedding_);
    }

    rag_core::IndexLifecycleOptions options;
    options.data_file = manual_path_;
    rag_core::text::ChunkerOptions chunker_options;
    chunker_options.chunk_size = 10;
    chunker_options.chunk_overlap = 0;
    chunker_options.use_preprocessing = false;

    lifecycle_ = std::make_unique<rag_core::IndexLifecycle>(
        options, embedder_, rag_core::text::Chunker(chunker_options),
        [this](const std::string &name) { return make_vector_index(name); }, *registry_);

    retrieval_options_.sub_query_timeout = std::chrono::milliseconds(100);
    retriever_ = std::make_unique<HybridRetriever>(*lifecycle_, embedder_, *pool_,
                                                   retrieval_options_);
  }

  void TearDown() override {
    pool_->stop();
    retriever_.reset();
    lifecycle_.reset();
    vector_mock_.reset();
    registry_.reset();
    TestUtilities::remove_temp_file(manual_path_);
    DatabaseTestBase::TearDown();
  }

  // A mock whose default behaviour delegates to a real store, so single
  // calls can be overridden per test.
  std::shared_ptr<rag_core::VectorIndex> make_vector_index(const std::string &name) {
    auto real = std::make_shared<rag_core::FaissVectorStore>(*db_manager_, name, 8);
    auto mock = std::make_shared<NiceMock<MockVectorIndex>>(name, 8);
    ON_CALL(*mock, upsert(_)).WillByDefault([real](const std::vector<rag_core::Chunk> &chunks) {
      real->upsert(chunks);
    });
    ON_CALL(*mock, query(_, _)).WillByDefault([real](const Embedding &embedding, size_t top_k) {
      return real->query(embedding, top_k);
    });
    ON_CALL(*mock, reset()).WillByDefault([real] { real->reset(); });
    ON_CALL(*mock, count()).WillByDefault([real] { return real->count(); });
    ON_CALL(*mock, get_all()).WillByDefault([real] { return real->get_all(); });
    vector_mock_ = mock;
    return mock;
  }

  std::string chunk_id(size_t i) const {
    return rag_core::make_chunk_id(manual_path_.stem().string(), static_cast<int>(i));
  }

  static std::vector<std::string> ids(const rag_core::RetrievalResult &result) {
    std::vector<std::string> out;
    for (const auto &chunk : result.chunks) {
      out.push_back(chunk.chunk_id);
    }
    return out;
  }

  std::unique_ptr<rag_core::CollectionRegistry> registry_;
  std::shared_ptr<FakeEmbeddingProvider> embedder_;
  std::unique_ptr<rag_core::async::WorkerPool> pool_;
  std::filesystem::path manual_path_;
  Embedding query_embedding_;
  std::shared_ptr<NiceMock<MockVectorIndex>> vector_mock_;
  std::unique_ptr<rag_core::IndexLifecycle> lifecycle_;
  RetrievalOptions retrieval_options_;
  std::unique_ptr<HybridRetriever> retriever_;
};

TEST_F(HybridRetrieverTest, NotReadyThrowsBeforeEmbedding) {
  EXPECT_THROW(retriever_->query("tire"), rag_core::IndexNotReady);
  EXPECT_EQ(embedder_->call_count(), 0);
}

TEST_F(HybridRetrieverTest, VectorOnlyRanksByCosine) {
  lifecycle_->initialize();
  QueryParams params;
  params.use_hybrid = false;
  params.top_k = 4;

  auto result = retriever_->query("tire", params);
  EXPECT_EQ(ids(result), (std::vector<std::string>{chunk_id(0), chunk_id(1), chunk_id(2), chunk_id(3)}));
  EXPECT_NEAR(result.chunks[0].fused_score, 0.9, 1e-5);
  EXPECT_NEAR(result.chunks[3].fused_score, -0.3, 1e-5);
  EXPECT_FALSE(result.chunks[0].keyword_score.has_value());
  EXPECT_FALSE(result.degraded);
}

TEST_F(HybridRetrieverTest, WeightOneFollowsVectorOrder) {
  lifecycle_->initialize();
  QueryParams params;
  params.hybrid_weight = 1.0;
  params.top_k = 4;

  auto result = retriever_->query("tire", params);
  EXPECT_EQ(ids(result), (std::vector<std::string>{chunk_id(0), chunk_id(1), chunk_id(2), chunk_id(3)}));
  EXPECT_DOUBLE_EQ(result.chunks[0].fused_score, 1.0);
}

TEST_F(HybridRetrieverTest, WeightZeroFollowsKeywordOrderWithIdTieBreak) {
  lifecycle_->initialize();
  QueryParams params;
  params.hybrid_weight = 0.0;
  params.top_k = 4;

  auto result = retriever_->query("tire check", params);
  ASSERT_EQ(result.chunks.size(), 4u);
  EXPECT_EQ(result.chunks[0].chunk_id, chunk_id(2));
  EXPECT_DOUBLE_EQ(result.chunks[0].fused_score, 1.0);
  // The rest score 0 and fall back to id order.
  EXPECT_EQ(ids(result), (std::vector<std::string>{chunk_id(2), chunk_id(0), chunk_id(1), chunk_id(3)}));
}

TEST_F(HybridRetrieverTest, FusesNormalizedScores) {
  lifecycle_->initialize();
  QueryParams params;
  params.top_k = 4;

  auto result = retriever_->query("oil", params);
  ASSERT_EQ(result.chunks.size(), 4u);

  // Vector side normalizes (0.9, 0.5, 0.1, -0.3) to (1, 2/3, 1/3, 0); the
  // keyword side only matches "oil filter", which normalizes to 1.
  EXPECT_EQ(result.chunks[0].chunk_id, chunk_id(1));
  EXPECT_NEAR(result.chunks[0].fused_score, 0.7 * (2.0 / 3.0) + 0.3, 1e-5);
  ASSERT_TRUE(result.chunks[0].keyword_score.has_value());
  EXPECT_DOUBLE_EQ(*result.chunks[0].keyword_score, 1.0);

  EXPECT_EQ(result.chunks[1].chunk_id, chunk_id(0));
  EXPECT_NEAR(result.chunks[1].fused_score, 0.7, 1e-5);
  EXPECT_FALSE(result.chunks[1].keyword_score.has_value());
  EXPECT_EQ(result.chunks[1].text, "brake pad.");
}

TEST_F(HybridRetrieverTest, ResultsTruncatedToTopK) {
  lifecycle_->initialize();
  QueryParams params;
  params.top_k = 2;
  EXPECT_EQ(retriever_->query("oil", params).chunks.size(), 2u);
}

TEST_F(HybridRetrieverTest, ResolveTopKAppliesDefaultAndClamp) {
  EXPECT_EQ(retriever_->resolve_top_k(0), 5);
  EXPECT_EQ(retriever_->resolve_top_k(-3), 5);
  EXPECT_EQ(retriever_->resolve_top_k(7), 7);
  EXPECT_EQ(retriever_->resolve_top_k(100), 20);
}

TEST_F(HybridRetrieverTest, SlowVectorSideDegradesToKeywordOnly) {
  lifecycle_->initialize();
  ON_CALL(*vector_mock_, query(_, _)).WillByDefault([](const Embedding &, size_t) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    return std::vector<rag_core::VectorHit>{};
  });

  auto result = retriever_->query("tire");
  EXPECT_TRUE(result.degraded);
  EXPECT_NE(result.degraded_reason.find("vector"), std::string::npos);
  ASSERT_EQ(result.chunks.size(), 1u);
  EXPECT_EQ(result.chunks[0].chunk_id, chunk_id(2));
  EXPECT_EQ(result.chunks[0].text, "tire check");
  EXPECT_FALSE(result.chunks[0].vector_score.has_value());
}

TEST_F(HybridRetrieverTest, FailingVectorSideDegrades) {
  lifecycle_->initialize();
  ON_CALL(*vector_mock_, query(_, _))
      .WillByDefault(testing::Throw(rag_core::VectorIndexError("query", "disk I/O error")));

  auto result = retriever_->query("brake");
  EXPECT_TRUE(result.degraded);
  EXPECT_NE(result.degraded_reason.find("disk I/O error"), std::string::npos);
  ASSERT_EQ(result.chunks.size(), 1u);
  EXPECT_EQ(result.chunks[0].chunk_id, chunk_id(0));
}

TEST_F(HybridRetrieverTest, FailingVectorOnlyQueryThrows) {
  lifecycle_->initialize();
  ON_CALL(*vector_mock_, query(_, _))
      .WillByDefault(testing::Throw(rag_core::VectorIndexError("query", "disk I/O error")));
  QueryParams params;
  params.use_hybrid = false;
  EXPECT_THROW(retriever_->query("brake", params), rag_core::RetrievalError);
}

TEST_F(HybridRetrieverTest, ExpiredCallerDeadlineThrowsTimeout) {
  lifecycle_->initialize();
  rag_core::Deadline expired(rag_core::Deadline::Clock::now() - std::chrono::milliseconds(1));
  EXPECT_THROW(retriever_->query("tire", QueryParams(), expired), rag_core::RetrievalTimeout);

  ON_CALL(*vector_mock_, query(_, _)).WillByDefault([](const Embedding &, size_t) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    return std::vector<rag_core::VectorHit>{};
  });
  auto short_deadline = rag_core::Deadline::after(std::chrono::milliseconds(30));
  EXPECT_THROW(retriever_->query("tire", QueryParams(), short_deadline),
               rag_core::RetrievalTimeout);
}

TEST_F(HybridRetrieverTest, EmbeddingFailureBecomesRetrievalError) {
  lifecycle_->initialize();
  embedder_->fail_with(rag_core::EmbeddingProviderError("embed", "HTTP 503", true));
  EXPECT_THROW(retriever_->query("tire"), rag_core::RetrievalError);
}

TEST_F(HybridRetrieverTest, NoKeywordMatchStillReturnsVectorHits) {
  lifecycle_->initialize();
  auto result = retriever_->query("nothing matches");
  EXPECT_FALSE(result.degraded);
  ASSERT_EQ(result.chunks.size(), 4u);
  EXPECT_EQ(result.chunks[0].chunk_id, chunk_id(0));
}

TEST_F(HybridRetrieverTest, InvalidWeightsRejected) {
  RetrievalOptions bad;
  bad.hybrid_weight = 1.5;
  EXPECT_THROW(HybridRetriever(*lifecycle_, embedder_, *pool_, bad), rag_core::ConfigError);

  lifecycle_->initialize();
  QueryParams params;
  params.hybrid_weight = -0.1;
  EXPECT_THROW(retriever_->query("tire", params), rag_core::RetrievalError);
}

TEST(MinMaxNormalizeTest, ScalesIntoUnitRange) {
  using Scores = std::vector<double>;
  EXPECT_TRUE(HybridRetriever::min_max_normalize({}).empty());
  EXPECT_EQ(HybridRetriever::min_max_normalize({5.0}), (Scores{1.0}));
  EXPECT_EQ(HybridRetriever::min_max_normalize({2.0, 2.0}), (Scores{1.0, 1.0}));
  EXPECT_EQ(HybridRetriever::min_max_normalize({0.0, 5.0, 10.0}), (Scores{0.0, 0.5, 1.0}));
}

}  // namespace rag_tests
