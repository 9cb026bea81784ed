#pragma once

#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

// Embedding backend for a local Ollama server. Ollama's embedding call takes
// one input, so a batch becomes one call per text with the index assigned
// from the batch position.
class OllamaClient : public BatchingEmbeddingClient {
 public:
  OllamaClient(const std::string &ollama_url, const EmbeddingOptions &options);
  ~OllamaClient() override = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual bool is_server_available();

 protected:
  std::vector<IndexedEmbedding> fetch_batch(const std::vector<std::string> &batch,
                                            const Deadline &deadline) override;

 private:
  std::string ollama_url_;

  void setup_server_connection();
};

}  // namespace rag_core
