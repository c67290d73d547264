#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "harvest_core/errors.hpp"
#include "server.hpp"

// Forward declarations
namespace harvest_core {
class Scheduler;
class TaskStore;
class IWorkerBridge;
}  // namespace harvest_core

namespace harvest_api {

class LatestStatusListener;

class Routes {
 public:
  Routes(std::shared_ptr<harvest_core::Scheduler> scheduler,
         std::shared_ptr<harvest_core::TaskStore> task_store,
         std::shared_ptr<harvest_core::IWorkerBridge> worker_bridge,
         std::shared_ptr<LatestStatusListener> status_listener);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // HTTP status used for an engine error of the given kind
  static int status_for(harvest_core::ErrorKind kind);

 private:
  std::shared_ptr<harvest_core::Scheduler> scheduler_;
  std::shared_ptr<harvest_core::TaskStore> task_store_;
  std::shared_ptr<harvest_core::IWorkerBridge> worker_bridge_;
  std::shared_ptr<LatestStatusListener> status_listener_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);

  // Queue endpoints
  crow::response handle_enqueue(const crow::request &req);
  crow::response handle_list_queue(const crow::request &req);
  crow::response handle_queue_stats(const crow::request &req);
  crow::response handle_queue_status(const crow::request &req);
  crow::response handle_start_queue(const crow::request &req);
  crow::response handle_stop_queue(const crow::request &req);
  crow::response handle_remove_item(const crow::request &req, const std::string &item_id);
  crow::response handle_set_priority(const crow::request &req, const std::string &item_id);
  crow::response handle_clear_queue(const crow::request &req);

  // Task history endpoints
  crow::response handle_list_tasks(const crow::request &req);
  crow::response handle_get_task(const crow::request &req, const std::string &task_id);
  crow::response handle_get_task_logs(const crow::request &req, const std::string &task_id);
  crow::response handle_delete_task(const crow::request &req, const std::string &task_id);

  crow::response handle_recent_events(const crow::request &req);
  crow::response handle_validate(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  long long parse_id(const std::string &text);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  nlohmann::json create_error_response(harvest_core::ErrorKind kind, const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  // Maps the exception being handled to an error response. Call only from a catch block.
  crow::response current_exception_response(const std::string &handler);
};

}  // namespace harvest_api
