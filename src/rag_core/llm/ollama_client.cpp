#include "rag_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace rag_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const EmbeddingOptions &options)
    : BatchingEmbeddingClient(options), ollama_url_(ollama_url) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingProviderError("OllamaClient", "Ollama server is not running at " + ollama_url_,
                                 /*transient*/ true);
  }
}

std::vector<IndexedEmbedding> OllamaClient::fetch_batch(const std::vector<std::string> &batch,
                                                        const Deadline &deadline) {
  std::vector<IndexedEmbedding> items;
  items.reserve(batch.size());

  for (size_t i = 0; i < batch.size(); ++i) {
    deadline.throw_if_expired("embed");
    try {
      ollama::response response = ollama::generate_embeddings(options().model, batch[i]);
      auto json_response = response.as_json();

      if (!json_response.contains("embeddings")) {
        throw EmbeddingProviderError("embed", "response does not contain embeddings field");
      }
      auto embeddings = json_response["embeddings"];
      if (!embeddings.is_array() || embeddings.empty()) {
        throw EmbeddingProviderError("embed", "embeddings field is not a non-empty array");
      }

      IndexedEmbedding indexed;
      indexed.index = static_cast<int>(i);
      if (embeddings[0].is_array()) {
        indexed.embedding = embeddings[0].get<std::vector<float>>();
      } else {
        indexed.embedding = embeddings.get<std::vector<float>>();
      }
      items.push_back(std::move(indexed));
    } catch (const ollama::exception &e) {
      throw EmbeddingProviderError("embed", "Embedding generation failed: " + std::string(e.what()),
                                   /*transient*/ true);
    }
  }
  return items;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
