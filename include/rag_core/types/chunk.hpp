#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rag_core {

// Closed metadata schema attached to every indexed chunk.
struct ChunkMetadata {
  std::string source_doc_id;
  int64_t sequence_index = 0;
  int64_t start_offset = 0;
  int64_t end_offset = 0;
  int64_t token_count = 0;
  bool preprocessed = false;

  bool operator==(const ChunkMetadata &other) const = default;
};

void to_json(nlohmann::json &j, const ChunkMetadata &metadata);
void from_json(const nlohmann::json &j, ChunkMetadata &metadata);

struct Chunk {
  std::string id;
  std::string source_doc_id;
  int sequence_index = 0;
  std::string text;
  int start_offset = 0;
  int token_count = 0;
  std::vector<float> embedding;
  ChunkMetadata metadata;

  bool operator==(const Chunk &other) const = default;
};

// Stable id for the chunk at sequence_index of a document.
std::string make_chunk_id(const std::string &source_doc_id, int sequence_index);

}  // namespace rag_core
