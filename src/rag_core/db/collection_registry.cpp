#include "rag_core/db/collection_registry.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_error_utils.hpp"
#include "rag_core/db/transaction.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

std::string CollectionRegistry::time_point_to_string(
    const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point CollectionRegistry::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw VectorIndexError("parse_time", "expected YYYY-MM-DD HH:MM:SS, got " + time_str);
  }
  // Stored as GMT.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

CollectionRegistry::CollectionRegistry(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::optional<CollectionInfo> CollectionRegistry::find_active(const std::string &base_name) const {
  std::optional<CollectionInfo> found;
  for (auto &info : list(base_name)) {
    if (info.active) {
      found = std::move(info);
    }
  }
  return found;
}

std::vector<CollectionInfo> CollectionRegistry::list(const std::string &base_name) const {
  std::vector<CollectionInfo> collections;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT name, base_name, generation, source_hash, dimension, is_active, created_at "
             "FROM collections WHERE base_name = ? ORDER BY generation"
          << base_name >>
        [&](std::string name, std::string base, int64_t generation, std::string source_hash,
            int dimension, int is_active, std::string created_at) {
          CollectionInfo info;
          info.name = std::move(name);
          info.base_name = std::move(base);
          info.generation = generation;
          info.source_hash = std::move(source_hash);
          info.dimension = dimension;
          info.active = is_active != 0;
          info.created_at = string_to_time_point(created_at);
          collections.push_back(std::move(info));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("list_collections", format_db_error(e));
  }
  return collections;
}

std::string CollectionRegistry::create_generation(const std::string &base_name,
                                                  const std::string &source_hash, int dimension) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);

    int64_t generation = 0;
    *conn << "SELECT COALESCE(MAX(generation), 0) + 1 FROM collections WHERE base_name = ?"
          << base_name >>
        generation;

    const std::string name = base_name + "@" + std::to_string(generation);
    *conn << "INSERT INTO collections "
             "(name, base_name, generation, source_hash, dimension, is_active, created_at) "
             "VALUES (?, ?, ?, ?, ?, 0, ?)"
          << name << base_name << generation << source_hash << dimension
          << time_point_to_string(std::chrono::system_clock::now());
    tx.commit();
    return name;
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("create_generation", format_db_error(e));
  }
}

void CollectionRegistry::activate(const std::string &name) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);

    int exists = 0;
    *conn << "SELECT COUNT(*) FROM collections WHERE name = ?" << name >> exists;
    if (exists == 0) {
      throw VectorIndexError("activate", "unknown collection " + name);
    }
    *conn << "UPDATE collections SET is_active = 0 "
             "WHERE base_name = (SELECT base_name FROM collections WHERE name = ?)"
          << name;
    *conn << "UPDATE collections SET is_active = 1 WHERE name = ?" << name;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("activate", format_db_error(e));
  }
}

void CollectionRegistry::drop(const std::string &name) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM vector_entries WHERE collection = ?" << name;
    *conn << "DELETE FROM collections WHERE name = ?" << name;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError("drop_collection", format_db_error(e));
  }
}

void CollectionRegistry::drop_all_except(const std::string &base_name,
                                         const std::string &keep_name) {
  for (const auto &info : list(base_name)) {
    if (info.name != keep_name) {
      std::cout << "[CollectionRegistry] Dropping old generation " << info.name << std::endl;
      drop(info.name);
    }
  }
}

}  // namespace rag_core
