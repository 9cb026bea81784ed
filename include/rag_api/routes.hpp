#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/services/knowledge_service.hpp"
#include "server.hpp"

namespace rag_api {

class Routes {
 public:
  // Reindex jobs run on maintenance_pool so they never occupy the workers
  // that serve sub-queries.
  Routes(std::shared_ptr<rag_core::KnowledgeService> knowledge_service,
         rag_core::async::WorkerPool &maintenance_pool, std::chrono::milliseconds search_timeout);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be exercised without a socket.
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_status(const crow::request &req);
  crow::response handle_init(const crow::request &req);
  crow::response handle_reindex(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_search_get(const crow::request &req);

 private:
  std::shared_ptr<rag_core::KnowledgeService> knowledge_service_;
  rag_core::async::WorkerPool &maintenance_pool_;
  std::chrono::milliseconds search_timeout_;

  crow::response run_search(const std::string &query, const rag_core::QueryParams &params);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_file_path_from_request(const crow::request &req);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace rag_api
