#include "rag_api/routes.hpp"

#include <iostream>

#include "rag_core/errors.hpp"

namespace rag_api {

Routes::Routes(std::shared_ptr<rag_core::KnowledgeService> knowledge_service,
               rag_core::async::WorkerPool &maintenance_pool,
               std::chrono::milliseconds search_timeout)
    : knowledge_service_(std::move(knowledge_service)),
      maintenance_pool_(maintenance_pool),
      search_timeout_(search_timeout) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/rag/status")
  ([this](const crow::request &req) { return handle_status(req); });

  CROW_ROUTE(app, "/rag/init").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_init(req);
  });

  CROW_ROUTE(app, "/rag/reindex")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_reindex(req); });

  CROW_ROUTE(app, "/rag/search")
      .methods(crow::HTTPMethod::POST, crow::HTTPMethod::GET)([this](const crow::request &req) {
        if (req.method == crow::HTTPMethod::GET) {
          return handle_search_get(req);
        }
        return handle_search(req);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Manual RAG API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_status(const crow::request &req) {
  try {
    nlohmann::json status = knowledge_service_->get_status();
    return create_json_response(status);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_status: " << e.what() << std::endl;
    return create_json_response(create_error_response("Failed to get RAG status"), 500);
  }
}

crow::response Routes::handle_init(const crow::request &req) {
  try {
    const std::string file_path = extract_file_path_from_request(req);
    knowledge_service_->initialize(file_path);

    const auto status = knowledge_service_->get_status();
    nlohmann::json response = create_success_response(
        status.index.warm_started ? "Reused persisted index; keyword index rebuilt"
                                  : "Index ready");
    response["documentCount"] = status.index.document_count;
    return create_json_response(response);
  } catch (const rag_core::InitError &e) {
    std::cerr << "Exception in handle_init: " << e.what() << std::endl;
    nlohmann::json response = create_error_response(e.what());
    response["documentCount"] = 0;
    return create_json_response(response, 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  }
}

crow::response Routes::handle_reindex(const crow::request &req) {
  try {
    const std::string file_path = extract_file_path_from_request(req);
    if (knowledge_service_->lifecycle().state() == rag_core::IndexState::INITIALIZING) {
      return create_json_response(create_error_response("An index build is already running"),
                                  409);
    }

    auto service = knowledge_service_;
    maintenance_pool_.submit(
        [service, file_path] {
          try {
            service->rebuild(file_path);
          } catch (const rag_core::RagError &e) {
            // Also recorded as last_error in /rag/status.
            std::cerr << "Reindex failed: " << e.what() << std::endl;
          }
        },
        "reindex");

    return create_json_response(create_success_response("Reindex started"), 202);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_reindex: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  nlohmann::json body;
  try {
    body = parse_json_body(req.body);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  }

  rag_core::QueryParams params;
  std::string query;
  try {
    query = body.value("query", std::string());
    params.top_k = body.value("topK", 0);
    params.use_hybrid = body.value("useHybrid", true);
    if (body.contains("hybridWeight")) {
      params.hybrid_weight = body.at("hybridWeight").get<double>();
    }
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid search parameters"), 400);
  }
  return run_search(query, params);
}

crow::response Routes::handle_search_get(const crow::request &req) {
  const char *q = req.url_params.get("q");
  rag_core::QueryParams params;
  try {
    if (const char *top_k = req.url_params.get("topK")) {
      params.top_k = std::stoi(top_k);
    }
  } catch (const std::logic_error &e) {
    return create_json_response(create_error_response("topK must be an integer"), 400);
  }
  if (const char *use_hybrid = req.url_params.get("useHybrid")) {
    params.use_hybrid = std::string(use_hybrid) != "false";
  }
  return run_search(q ? q : "", params);
}

crow::response Routes::run_search(const std::string &query, const rag_core::QueryParams &params) {
  if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
    return create_json_response(create_error_response("Query is required"), 400);
  }

  try {
    std::cout << "RAG search for: " << query << " with topK: " << params.top_k << std::endl;
    auto response =
        knowledge_service_->search(query, params, rag_core::Deadline::after(search_timeout_));

    nlohmann::json json_response;
    json_response["query"] = query;
    json_response["results"] = response.result.chunks;
    json_response["formattedForAI"] = response.formatted_for_prompt;
    json_response["count"] = response.result.chunks.size();
    json_response["cached"] = response.cached;
    json_response["degraded"] = response.result.degraded;
    if (response.result.degraded) {
      json_response["degradedReason"] = response.result.degraded_reason;
    }
    return create_json_response(json_response);
  } catch (const rag_core::IndexNotReady &e) {
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const rag_core::RetrievalTimeout &e) {
    std::cerr << "Search timed out: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 504);
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(std::string("Failed to search: ") + e.what()),
                                500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  return nlohmann::json::parse(body);
}

std::string Routes::extract_file_path_from_request(const crow::request &req) {
  auto json_body = parse_json_body(req.body);
  return json_body.value("filePath", std::string());
}

}  // namespace rag_api
