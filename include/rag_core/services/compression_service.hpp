#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core {

// Zstandard framing for chunk text stored in the vector_entries table.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text.
   * @param data The text to compress.
   * @param compression_level The zstd compression level.
   * @return Compressed bytes; empty for empty input.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses bytes produced by compress().
   * @throws RagError when the bytes are not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace rag_core
