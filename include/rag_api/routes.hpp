#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace rag_core {
class ServiceProvider;
}  // namespace rag_core

namespace rag_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<rag_core::ServiceProvider> services);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_reset(const crow::request &req);

 private:
  std::shared_ptr<rag_core::ServiceProvider> services_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace rag_api
