#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/db/database_manager.hpp"

namespace rag_core {

struct CollectionInfo {
  std::string name;
  std::string base_name;
  int64_t generation = 0;
  std::string source_hash;
  int dimension = 0;
  bool active = false;
  std::chrono::system_clock::time_point created_at;
};

/**
 * @class CollectionRegistry
 * @brief Tracks the generations of each logical vector collection.
 *
 * A rebuild writes into a fresh generation named "<base>@<generation>" and
 * only becomes visible to a restart once activate() flips the active flag.
 */
class CollectionRegistry {
 public:
  explicit CollectionRegistry(DatabaseManager &db_manager);

  std::optional<CollectionInfo> find_active(const std::string &base_name) const;
  std::vector<CollectionInfo> list(const std::string &base_name) const;

  // Registers an empty, inactive generation and returns its collection name.
  std::string create_generation(const std::string &base_name, const std::string &source_hash,
                                int dimension);

  // Makes name the only active generation of its base, in one transaction.
  void activate(const std::string &name);

  // Removes the collection and its entries. Unknown names are ignored.
  void drop(const std::string &name);

  // Drops every generation of base_name except keep_name.
  void drop_all_except(const std::string &base_name, const std::string &keep_name);

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace rag_core
