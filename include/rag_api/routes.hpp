#pragma once
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace rag_core {
class ServiceProvider;
}  // namespace rag_core

namespace rag_api {

class Routes {
 public:
  explicit Routes(rag_core::ServiceProvider &services);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  rag_core::ServiceProvider &services_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_retrieve(const crow::request &req);
  crow::response handle_corpus_status(const crow::request &req);
  crow::response handle_corpus_reload(const crow::request &req);
  crow::response handle_list_runs(const crow::request &req);

  // Helper methods
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace rag_api
