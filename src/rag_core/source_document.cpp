#include "rag_core/source_document.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace rag_core {

SourceDocument SourceDocumentLoader::load(const std::filesystem::path &path) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw SourceDocumentError("load_source_document", "could not open file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw SourceDocumentError("load_source_document", "could not read file: " + path.string());
  }

  SourceDocument document;
  document.path = path;
  document.doc_id = path.stem().string();
  document.content = buffer.str();
  document.content_hash = compute_hash_from_content(document.content);
  return document;
}

std::string SourceDocumentLoader::compute_hash_from_content(const std::string &content) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!mdctx) {
    throw SourceDocumentError("compute_hash", "failed to create EVP context");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw SourceDocumentError("compute_hash", "failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw SourceDocumentError("compute_hash", "failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw SourceDocumentError("compute_hash", "failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace rag_core
