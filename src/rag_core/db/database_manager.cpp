#include "rag_core/db/database_manager.hpp"

#include <stdexcept>

namespace rag_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path, int pool_size)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("DatabaseManager pool_size must be positive");
  }
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // Schema first, on a single non-pooled connection.
  setup_schema();
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  // One row per vector collection. A logical collection (base_name) has one
  // active generation at a time; rebuilds write a new generation beside it.
  db << R"(
      CREATE TABLE IF NOT EXISTS collections (
          name TEXT PRIMARY KEY,
          base_name TEXT NOT NULL,
          generation INTEGER NOT NULL DEFAULT 0,
          source_hash TEXT NOT NULL DEFAULT '',
          dimension INTEGER NOT NULL,
          is_active INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS vector_entries (
          collection TEXT NOT NULL,
          chunk_id TEXT NOT NULL,
          sequence_index INTEGER NOT NULL,
          content BLOB,
          metadata TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          PRIMARY KEY (collection, chunk_id),
          FOREIGN KEY (collection) REFERENCES collections(name) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_vector_entries_sequence
      ON vector_entries(collection, sequence_index)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_collections_base_active
      ON collections(base_name, is_active)
    )";
}

}  // namespace rag_core
