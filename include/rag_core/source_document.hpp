#pragma once

#include <filesystem>
#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

class SourceDocumentError : public RagError {
 public:
  using RagError::RagError;
};

struct SourceDocument {
  std::filesystem::path path;
  // File stem; prefix of every chunk id derived from this document.
  std::string doc_id;
  std::string content;
  // Hex SHA-256 of the raw content.
  std::string content_hash;
};

class SourceDocumentLoader {
 public:
  // Reads the whole file once. Throws SourceDocumentError if it cannot be read.
  static SourceDocument load(const std::filesystem::path &path);

  static std::string compute_hash_from_content(const std::string &content);
};

}  // namespace rag_core
