#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

#include "rag_core/db/connection_pool.hpp"

namespace rag_core {

// Owns the SQLite schema and the connection pool. Constructed once at startup
// and handed by reference to every component that touches the database.
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, int pool_size);
  ~DatabaseManager();

  // Used by the PooledConnection guard.
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  std::atomic<bool> is_initialized_{false};
};

}  // namespace rag_core
