#include "harvest_api/serialization.hpp"

#include "harvest_core/db/task_store.hpp"

namespace harvest_api {

namespace {

using harvest_core::TaskStore;

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

nlohmann::json optional_time_to_json(
    const std::optional<std::chrono::system_clock::time_point>& tp) {
  if (!tp) {
    return nullptr;
  }
  return TaskStore::time_point_to_string(*tp);
}

}  // namespace

nlohmann::json task_to_json(const harvest_core::TaskDTO& task) {
  nlohmann::json json;
  json["id"] = task.id;
  json["task_type"] = task.task_type;
  json["params"] = task.params;
  json["status"] = harvest_core::to_string(task.status);
  json["started_at"] = TaskStore::time_point_to_string(task.started_at);
  json["completed_at"] = optional_time_to_json(task.completed_at);
  json["error_message"] = optional_to_json(task.error_message);
  json["result_count"] = task.result_count;
  json["config"] = task.config;
  return json;
}

nlohmann::json log_to_json(const harvest_core::LogDTO& log) {
  nlohmann::json json;
  json["id"] = log.id;
  json["task_id"] = log.task_id;
  json["type"] = log.type;
  json["level"] = optional_to_json(log.level);
  json["message"] = log.message;
  json["timestamp"] = TaskStore::time_point_to_string(log.timestamp);
  json["metadata"] = log.metadata;
  return json;
}

nlohmann::json queue_item_to_json(const harvest_core::QueueItemDTO& item) {
  nlohmann::json json;
  json["id"] = item.id;
  json["task_config"] = item.job.to_json();
  json["priority"] = item.priority;
  json["status"] = harvest_core::to_string(item.status);
  json["created_at"] = TaskStore::time_point_to_string(item.created_at);
  json["started_at"] = optional_time_to_json(item.started_at);
  json["completed_at"] = optional_time_to_json(item.completed_at);
  json["task_id"] = optional_to_json(item.task_id);
  json["error_message"] = optional_to_json(item.error_message);
  return json;
}

nlohmann::json stats_to_json(const harvest_core::QueueStats& stats) {
  return {{"pending", stats.pending},
          {"running", stats.running},
          {"completed", stats.completed},
          {"failed", stats.failed},
          {"total", stats.total}};
}

nlohmann::json snapshot_to_json(const harvest_core::QueueStatusSnapshot& snapshot) {
  nlohmann::json json;
  json["sequence"] = snapshot.sequence;
  json["status"] = harvest_core::to_string(snapshot.status);
  json["current_item"] =
      snapshot.current_item ? queue_item_to_json(*snapshot.current_item) : nlohmann::json();
  json["stats"] = stats_to_json(snapshot.stats);
  return json;
}

}  // namespace harvest_api
