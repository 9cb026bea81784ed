#include "rag_core/types/chunk.hpp"

#include <iomanip>
#include <sstream>

namespace rag_core {

void to_json(nlohmann::json &j, const ChunkMetadata &metadata) {
  j = nlohmann::json{{"source_doc_id", metadata.source_doc_id},
                     {"sequence_index", metadata.sequence_index},
                     {"start_offset", metadata.start_offset},
                     {"end_offset", metadata.end_offset},
                     {"token_count", metadata.token_count},
                     {"preprocessed", metadata.preprocessed}};
}

void from_json(const nlohmann::json &j, ChunkMetadata &metadata) {
  metadata.source_doc_id = j.at("source_doc_id").get<std::string>();
  metadata.sequence_index = j.at("sequence_index").get<int64_t>();
  metadata.start_offset = j.at("start_offset").get<int64_t>();
  metadata.end_offset = j.at("end_offset").get<int64_t>();
  metadata.token_count = j.at("token_count").get<int64_t>();
  metadata.preprocessed = j.value("preprocessed", false);
}

std::string make_chunk_id(const std::string &source_doc_id, int sequence_index) {
  std::ostringstream ss;
  ss << source_doc_id << "#chunk_" << std::setw(5) << std::setfill('0') << sequence_index;
  return ss.str();
}

}  // namespace rag_core
