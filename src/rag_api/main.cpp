#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/async/worker_pool.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/llm/openai_embedding_client.hpp"
#include "rag_core/services/knowledge_service.hpp"
#include "rag_core/text/chunker.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

std::shared_ptr<rag_core::EmbeddingProvider> make_embedding_provider(const rag_api::Config &config) {
  if (config.embedding_provider == "ollama") {
    return std::make_shared<rag_core::OllamaClient>(config.embedding_base_url,
                                                    config.embedding_options());
  }
  const char *api_key = std::getenv(config.embedding_api_key_env.c_str());
  if (api_key == nullptr || *api_key == '\0') {
    throw rag_core::ConfigError("load_credentials",
                                config.embedding_api_key_env + " is not set");
  }
  return std::make_shared<rag_core::OpenAIEmbeddingClient>(config.embedding_base_url, api_key,
                                                           config.embedding_options());
}

}  // namespace

int main(int argc, char **argv) {
  const std::string config_path = argc > 1 ? argv[1] : "ragrc.json";
  curl_global_init(CURL_GLOBAL_DEFAULT);

  try {
    rag_api::Config config = rag_api::Config::from_file(config_path);

    std::cout << "Starting Manual RAG API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Data File: " << config.data_file << std::endl;
    std::cout << "Embedding Provider: " << config.embedding_provider << " ("
              << config.embedding_model << ", " << config.embedding_dimensions << " dims)"
              << std::endl;

    // --- 1. CONSTRUCT CORE COMPONENTS ---
    rag_core::DatabaseManager db_manager(config.database_path,
                                         /*pool_size*/ config.num_workers + 2);
    auto embedder = make_embedding_provider(config);
    rag_core::text::Chunker chunker(config.chunker_options());
    auto knowledge_service = std::make_shared<rag_core::KnowledgeService>(
        db_manager, embedder, std::move(chunker), config.service_options());

    rag_core::async::WorkerPool maintenance_pool(1);

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    rag_api::Server server(host, port);
    rag_api::Routes routes(knowledge_service, maintenance_pool,
                           std::chrono::milliseconds(config.search_timeout_ms));
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    server.get_app().signal_clear();
    maintenance_pool.start();

    // Initial build runs in the background; /rag/status reports progress and
    // searches answer 503 until it is READY.
    maintenance_pool.submit(
        [knowledge_service] {
          try {
            knowledge_service->initialize();
          } catch (const rag_core::RagError &e) {
            std::cerr << "Initial index build failed: " << e.what() << std::endl;
          }
        },
        "initialize");

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping maintenance workers..." << std::endl;
    maintenance_pool.stop();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    curl_global_cleanup();
    return 1;
  }

  curl_global_cleanup();
  return 0;
}
