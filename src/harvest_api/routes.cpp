#include "harvest_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "harvest_api/serialization.hpp"
#include "harvest_api/status_listener.hpp"
#include "harvest_core/db/task_store.hpp"
#include "harvest_core/scheduler/scheduler.hpp"
#include "harvest_core/worker/worker_bridge.hpp"

namespace harvest_api {

using harvest_core::ErrorKind;

Routes::Routes(std::shared_ptr<harvest_core::Scheduler> scheduler,
               std::shared_ptr<harvest_core::TaskStore> task_store,
               std::shared_ptr<harvest_core::IWorkerBridge> worker_bridge,
               std::shared_ptr<LatestStatusListener> status_listener)
    : scheduler_(std::move(scheduler)),
      task_store_(std::move(task_store)),
      worker_bridge_(std::move(worker_bridge)),
      status_listener_(std::move(status_listener)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Queue endpoints
  CROW_ROUTE(app, "/queue").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_enqueue(req);
  });

  CROW_ROUTE(app, "/queue")
  ([this](const crow::request &req) { return handle_list_queue(req); });

  CROW_ROUTE(app, "/queue/stats")
  ([this](const crow::request &req) { return handle_queue_stats(req); });

  CROW_ROUTE(app, "/queue/status")
  ([this](const crow::request &req) { return handle_queue_status(req); });

  CROW_ROUTE(app, "/queue/start")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_start_queue(req); });

  CROW_ROUTE(app, "/queue/stop")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_stop_queue(req); });

  CROW_ROUTE(app, "/queue/clear")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_clear_queue(req); });

  CROW_ROUTE(app, "/queue/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_remove_item(req, id);
      });

  CROW_ROUTE(app, "/queue/<string>/priority")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &id) {
        return handle_set_priority(req, id);
      });

  // Task history endpoints
  CROW_ROUTE(app, "/tasks")
  ([this](const crow::request &req) { return handle_list_tasks(req); });

  // Also serves /tasks/current
  CROW_ROUTE(app, "/tasks/<string>")
  ([this](const crow::request &req, const std::string &id) { return handle_get_task(req, id); });

  CROW_ROUTE(app, "/tasks/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_delete_task(req, id);
      });

  CROW_ROUTE(app, "/tasks/<string>/logs")
  ([this](const crow::request &req, const std::string &id) {
    return handle_get_task_logs(req, id);
  });

  CROW_ROUTE(app, "/events")
  ([this](const crow::request &req) { return handle_recent_events(req); });

  CROW_ROUTE(app, "/validate").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_validate(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AlreadyRunning:
    case ErrorKind::QueueNotRunning:
    case ErrorKind::ItemNotRemovable:
      return 409;
    case ErrorKind::ValidationFailure:
      return 400;
    case ErrorKind::ProcessSpawnError:
    case ErrorKind::ProcessExitError:
    case ErrorKind::Storage:
      return 500;
  }
  return 500;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Harvest API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

// ============================================================================
// Queue
// ============================================================================

crow::response Routes::handle_enqueue(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    harvest_core::JobDescription job = harvest_core::JobDescription::from_json(body);
    int priority = 0;
    if (body.contains("priority") && !body["priority"].is_null()) {
      if (!body["priority"].is_number_integer()) {
        throw std::invalid_argument("priority must be an integer");
      }
      priority = body["priority"].get<int>();
    }

    long long id = scheduler_->enqueue(job, priority);
    nlohmann::json response = create_success_response("Task added to queue");
    response["data"]["id"] = id;
    return create_json_response(response, 201);
  } catch (const std::exception &) {
    return current_exception_response("handle_enqueue");
  }
}

crow::response Routes::handle_list_queue(const crow::request &req) {
  try {
    std::optional<harvest_core::QueueItemStatus> status;
    if (const char *status_param = req.url_params.get("status")) {
      status = harvest_core::queue_item_status_from_string(status_param);
    }

    nlohmann::json items = nlohmann::json::array();
    for (const auto &item : scheduler_->list_items(status)) {
      items.push_back(queue_item_to_json(item));
    }
    nlohmann::json response = create_success_response("Queue items retrieved successfully");
    response["data"]["items"] = items;
    response["data"]["count"] = items.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_list_queue");
  }
}

crow::response Routes::handle_queue_stats(const crow::request &req) {
  nlohmann::json response = create_success_response("Queue stats retrieved successfully");
  response["data"] = stats_to_json(scheduler_->stats());
  return create_json_response(response);
}

crow::response Routes::handle_queue_status(const crow::request &req) {
  try {
    auto snapshot = status_listener_->latest();
    nlohmann::json response = create_success_response("Queue status retrieved successfully");
    response["data"] = snapshot_to_json(snapshot ? *snapshot : scheduler_->snapshot());
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_queue_status");
  }
}

crow::response Routes::handle_start_queue(const crow::request &req) {
  try {
    harvest_core::ControlResult result = scheduler_->start();
    if (!result.success) {
      return create_json_response(create_error_response(*result.error, result.message),
                                  status_for(*result.error));
    }
    return create_json_response(create_success_response(result.message));
  } catch (const std::exception &) {
    return current_exception_response("handle_start_queue");
  }
}

crow::response Routes::handle_stop_queue(const crow::request &req) {
  try {
    harvest_core::ControlResult result = scheduler_->stop();
    if (!result.success) {
      return create_json_response(create_error_response(*result.error, result.message),
                                  status_for(*result.error));
    }
    return create_json_response(create_success_response(result.message));
  } catch (const std::exception &) {
    return current_exception_response("handle_stop_queue");
  }
}

crow::response Routes::handle_remove_item(const crow::request &req, const std::string &item_id) {
  try {
    long long id = parse_id(item_id);
    if (!scheduler_->remove(id)) {
      return create_json_response(create_error_response("Queue item not found"), 404);
    }
    return create_json_response(create_success_response("Queue item removed"));
  } catch (const std::exception &) {
    return current_exception_response("handle_remove_item");
  }
}

crow::response Routes::handle_set_priority(const crow::request &req, const std::string &item_id) {
  try {
    long long id = parse_id(item_id);
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("priority") || !body["priority"].is_number_integer()) {
      throw std::invalid_argument("priority must be an integer");
    }
    if (!task_store_->get_queue_item(id)) {
      return create_json_response(create_error_response("Queue item not found"), 404);
    }
    scheduler_->set_priority(id, body["priority"].get<int>());
    return create_json_response(create_success_response("Priority updated"));
  } catch (const std::exception &) {
    return current_exception_response("handle_set_priority");
  }
}

crow::response Routes::handle_clear_queue(const crow::request &req) {
  try {
    int removed = scheduler_->clear_completed();
    nlohmann::json response = create_success_response("Finished queue items cleared");
    response["data"]["removed"] = removed;
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_clear_queue");
  }
}

// ============================================================================
// Tasks
// ============================================================================

crow::response Routes::handle_list_tasks(const crow::request &req) {
  try {
    int limit = 50;
    if (const char *limit_param = req.url_params.get("limit")) {
      limit = std::stoi(limit_param);
      if (limit < 1 || limit > 1000) {
        throw std::invalid_argument("limit must be between 1 and 1000");
      }
    }

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto &task : task_store_->get_recent_tasks(limit)) {
      tasks.push_back(task_to_json(task));
    }
    nlohmann::json response = create_success_response("Tasks retrieved successfully");
    response["data"]["tasks"] = tasks;
    response["data"]["count"] = tasks.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_list_tasks");
  }
}

crow::response Routes::handle_get_task(const crow::request &req, const std::string &task_id) {
  try {
    std::optional<harvest_core::TaskDTO> task;
    if (task_id == "current") {
      task = task_store_->get_current_task();
    } else {
      task = task_store_->get_task(parse_id(task_id));
    }
    if (!task) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    nlohmann::json response = create_success_response("Task retrieved successfully");
    response["data"] = task_to_json(*task);
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_get_task");
  }
}

crow::response Routes::handle_get_task_logs(const crow::request &req, const std::string &task_id) {
  try {
    long long id = parse_id(task_id);
    if (!task_store_->get_task(id)) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    nlohmann::json logs = nlohmann::json::array();
    for (const auto &log : task_store_->get_task_logs(id)) {
      logs.push_back(log_to_json(log));
    }
    nlohmann::json response = create_success_response("Task logs retrieved successfully");
    response["data"]["logs"] = logs;
    response["data"]["count"] = logs.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_get_task_logs");
  }
}

crow::response Routes::handle_delete_task(const crow::request &req, const std::string &task_id) {
  try {
    long long id = parse_id(task_id);
    if (worker_bridge_->current_task_id() == id) {
      return create_json_response(
          create_error_response(ErrorKind::ItemNotRemovable, "Cannot delete a running task"),
          409);
    }
    if (!task_store_->get_task(id)) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    task_store_->delete_task(id);
    return create_json_response(create_success_response("Task deleted"));
  } catch (const std::exception &) {
    return current_exception_response("handle_delete_task");
  }
}

crow::response Routes::handle_recent_events(const crow::request &req) {
  try {
    std::size_t limit = 0;
    if (const char *limit_param = req.url_params.get("limit")) {
      int parsed = std::stoi(limit_param);
      if (parsed < 0) {
        throw std::invalid_argument("limit cannot be negative");
      }
      limit = static_cast<std::size_t>(parsed);
    }
    nlohmann::json events = nlohmann::json::array();
    for (const auto &event : status_listener_->recent_events(limit)) {
      events.push_back(event.to_json());
    }
    nlohmann::json response = create_success_response("Recent events retrieved successfully");
    response["data"]["events"] = events;
    response["data"]["count"] = events.size();
    response["data"]["total_seen"] = status_listener_->events_seen();
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_recent_events");
  }
}

crow::response Routes::handle_validate(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("payload")) {
      throw std::invalid_argument("Missing 'payload' field");
    }
    harvest_core::ValidationResult result = worker_bridge_->validate(body["payload"]);
    nlohmann::json response;
    if (result.valid) {
      response = create_success_response(result.message.empty() ? "Valid" : result.message);
    } else {
      response = create_error_response(ErrorKind::ValidationFailure, result.message);
    }
    response["data"] = result.to_json();
    return create_json_response(response);
  } catch (const std::exception &) {
    return current_exception_response("handle_validate");
  }
}

// ============================================================================
// Helpers
// ============================================================================

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw std::invalid_argument("Request body is empty");
  }
  nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  return json;
}

long long Routes::parse_id(const std::string &text) {
  std::size_t consumed = 0;
  long long id = std::stoll(text, &consumed);
  if (consumed != text.size() || id <= 0) {
    throw std::invalid_argument("Invalid id: " + text);
  }
  return id;
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

nlohmann::json Routes::create_error_response(ErrorKind kind, const std::string &error) {
  nlohmann::json response = create_error_response(error);
  response["kind"] = harvest_core::to_string(kind);
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code,
                          json_data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  response.set_header("Content-Type", "application/json");
  return response;
}

crow::response Routes::current_exception_response(const std::string &handler) {
  try {
    throw;
  } catch (const harvest_core::HarvestError &e) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.kind(), e.what()), status_for(e.kind()));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::out_of_range &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

}  // namespace harvest_api
