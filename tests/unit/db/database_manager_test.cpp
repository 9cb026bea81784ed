#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <vector>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/transaction.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::PooledConnection;
using rag_core::Transaction;

class DatabaseManagerTest : public DatabaseTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"collections", "vector_entries"};

  PooledConnection conn(*db_manager_);
  for (const auto &table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name IN ('idx_vector_entries_sequence', 'idx_collections_base_active')" >>
      idx_count;
  EXPECT_EQ(idx_count, 2);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, ReopeningExistingDatabaseKeepsRows) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "INSERT INTO collections (name, base_name, dimension, created_at) "
             "VALUES ('car_manual@1', 'car_manual', 8, '2024-01-01 00:00:00')";
  }
  db_manager_->shutdown();
  db_manager_ = std::make_unique<rag_core::DatabaseManager>(temp_db_path_, 2);

  PooledConnection conn(*db_manager_);
  int count = 0;
  *conn << "SELECT COUNT(*) FROM collections" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, ZeroPoolSizeThrows) {
  EXPECT_THROW(rag_core::DatabaseManager(TestUtilities::create_temp_test_db(), 0),
               std::invalid_argument);
}

TEST_F(DatabaseManagerTest, ConnectionAfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_THROW(PooledConnection conn(*db_manager_), std::runtime_error);
}

TEST_F(DatabaseManagerTest, DeletingCollectionCascadesToEntries) {
  PooledConnection conn(*db_manager_);
  *conn << "INSERT INTO collections (name, base_name, dimension, created_at) "
           "VALUES ('c@1', 'c', 2, '2024-01-01 00:00:00')";
  *conn << "INSERT INTO vector_entries (collection, chunk_id, sequence_index, metadata, vector_blob) "
           "VALUES ('c@1', 'doc#chunk_00000', 0, '{}', x'00')";
  *conn << "DELETE FROM collections WHERE name = 'c@1'";

  int count = -1;
  *conn << "SELECT COUNT(*) FROM vector_entries" >> count;
  EXPECT_EQ(count, 0);
}

TEST_F(DatabaseManagerTest, TransactionRollsBackWithoutCommit) {
  PooledConnection conn(*db_manager_);
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO collections (name, base_name, dimension, created_at) "
             "VALUES ('t@1', 't', 2, '2024-01-01 00:00:00')";
  }
  int count = -1;
  *conn << "SELECT COUNT(*) FROM collections WHERE name = 't@1'" >> count;
  EXPECT_EQ(count, 0);

  {
    Transaction tx(*conn, true);
    *conn << "INSERT INTO collections (name, base_name, dimension, created_at) "
             "VALUES ('t@1', 't', 2, '2024-01-01 00:00:00')";
    tx.commit();
  }
  *conn << "SELECT COUNT(*) FROM collections WHERE name = 't@1'" >> count;
  EXPECT_EQ(count, 1);
}

}  // namespace rag_tests
