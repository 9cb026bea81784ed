#include <gtest/gtest.h>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/faiss_vector_store.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::FaissVectorStore;

class FaissVectorStoreTest : public DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    store_ = std::make_unique<FaissVectorStore>(*db_manager_, "car_manual@1", 8);
    chunks_ = {TestUtilities::create_test_chunk("manual", 0, "エンジンの始動"),
               TestUtilities::create_test_chunk("manual", 1, "ブレーキの点検"),
               TestUtilities::create_test_chunk("manual", 2, "タイヤの空気圧")};
  }

  void TearDown() override {
    store_.reset();
    DatabaseTestBase::TearDown();
  }

  std::unique_ptr<FaissVectorStore> store_;
  std::vector<rag_core::Chunk> chunks_;
};

TEST_F(FaissVectorStoreTest, QueryReturnsNearestFirst) {
  store_->upsert(chunks_);
  ASSERT_EQ(store_->count(), 3u);

  auto hits = store_->query(chunks_[1].embedding, 3);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk_id, chunks_[1].id);
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
  EXPECT_EQ(hits[0].text, "ブレーキの点検");
  EXPECT_EQ(hits[0].metadata, chunks_[1].metadata);
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_LE(hits[i - 1].distance, hits[i].distance);
  }
}

TEST_F(FaissVectorStoreTest, DistanceIsOneMinusCosine) {
  auto base = TestUtilities::create_test_vector("base", 8);
  auto chunk = TestUtilities::create_test_chunk("manual", 0, "a");
  chunk.embedding = TestUtilities::vector_with_cosine(base, 0.6);
  store_->upsert({chunk});

  auto hits = store_->query(base, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].distance, 0.4f, 1e-5);
}

TEST_F(FaissVectorStoreTest, UnnormalizedEmbeddingsAreNormalized) {
  auto chunk = chunks_[0];
  for (float &x : chunk.embedding) {
    x *= 10.0f;
  }
  store_->upsert({chunk});
  auto hits = store_->query(chunks_[0].embedding, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].distance, 0.0f, 1e-5);
}

TEST_F(FaissVectorStoreTest, TopKLargerThanCollectionReturnsAll) {
  store_->upsert(chunks_);
  EXPECT_EQ(store_->query(chunks_[0].embedding, 50).size(), 3u);
  EXPECT_TRUE(store_->query(chunks_[0].embedding, 0).empty());
}

TEST_F(FaissVectorStoreTest, EmptyCollectionQueryReturnsNothing) {
  EXPECT_TRUE(store_->query(chunks_[0].embedding, 5).empty());
}

TEST_F(FaissVectorStoreTest, UpsertReplacesById) {
  store_->upsert(chunks_);
  auto updated = TestUtilities::create_test_chunk("manual", 1, "ブレーキ液の交換");
  store_->upsert({updated});

  EXPECT_EQ(store_->count(), 3u);
  auto hits = store_->query(updated.embedding, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, updated.id);
  EXPECT_EQ(hits[0].text, "ブレーキ液の交換");
  EXPECT_EQ(store_->get_all().size(), 3u);
}

TEST_F(FaissVectorStoreTest, ResetClearsEntries) {
  store_->reset();
  EXPECT_EQ(store_->count(), 0u);

  store_->upsert(chunks_);
  store_->reset();
  EXPECT_EQ(store_->count(), 0u);
  EXPECT_TRUE(store_->get_all().empty());
  EXPECT_TRUE(store_->query(chunks_[0].embedding, 5).empty());

  store_->upsert({chunks_[0]});
  EXPECT_EQ(store_->count(), 1u);
}

TEST_F(FaissVectorStoreTest, GetAllOrderedBySequence) {
  store_->upsert({chunks_[2], chunks_[0], chunks_[1]});
  auto all = store_->get_all();
  ASSERT_EQ(all.size(), 3u);
  for (size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i].chunk_id, chunks_[i].id);
    EXPECT_EQ(all[i].text, chunks_[i].text);
    EXPECT_EQ(all[i].metadata.sequence_index, static_cast<int64_t>(i));
  }
}

TEST_F(FaissVectorStoreTest, ReopenedStoreServesPersistedEntries) {
  store_->upsert(chunks_);
  store_.reset();

  FaissVectorStore reopened(*db_manager_, "car_manual@1", 8);
  EXPECT_EQ(reopened.count(), 3u);
  auto hits = reopened.query(chunks_[2].embedding, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, chunks_[2].id);
  EXPECT_EQ(hits[0].text, "タイヤの空気圧");
}

TEST_F(FaissVectorStoreTest, RowsWithWrongSizedVectorAreSkippedEverywhere) {
  store_->upsert(chunks_);
  store_.reset();
  {
    rag_core::PooledConnection conn(*db_manager_);
    *conn << "UPDATE vector_entries SET vector_blob = zeroblob(12) WHERE chunk_id = ?"
          << chunks_[1].id;
  }

  FaissVectorStore reopened(*db_manager_, "car_manual@1", 8);
  EXPECT_EQ(reopened.count(), 2u);
  auto all = reopened.get_all();
  ASSERT_EQ(all.size(), reopened.count());
  EXPECT_EQ(all[0].chunk_id, chunks_[0].id);
  EXPECT_EQ(all[1].chunk_id, chunks_[2].id);
}

TEST_F(FaissVectorStoreTest, CollectionsAreIsolated) {
  store_->upsert(chunks_);
  FaissVectorStore other(*db_manager_, "car_manual@2", 8);
  EXPECT_EQ(other.count(), 0u);
  EXPECT_TRUE(other.query(chunks_[0].embedding, 5).empty());
}

TEST_F(FaissVectorStoreTest, DimensionMismatchThrowsConfigError) {
  EXPECT_THROW(FaissVectorStore(*db_manager_, "car_manual@1", 4), rag_core::ConfigError);

  auto bad = chunks_[0];
  bad.embedding.resize(4);
  EXPECT_THROW(store_->upsert({bad}), rag_core::ConfigError);
  EXPECT_EQ(store_->count(), 0u);

  EXPECT_THROW(store_->query(std::vector<float>(3, 0.5f), 1), rag_core::ConfigError);
}

}  // namespace rag_tests
