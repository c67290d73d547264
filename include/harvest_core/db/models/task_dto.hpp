#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace harvest_core {

enum class TaskStatus { RUNNING, COMPLETED, FAILED, STOPPED, WARNING };

inline std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::RUNNING: return "running";
    case TaskStatus::COMPLETED: return "completed";
    case TaskStatus::FAILED: return "failed";
    case TaskStatus::STOPPED: return "stopped";
    case TaskStatus::WARNING: return "warning";
  }
  return "unknown";
}

inline TaskStatus task_status_from_string(const std::string& str) {
  if (str == "running") return TaskStatus::RUNNING;
  if (str == "completed") return TaskStatus::COMPLETED;
  if (str == "failed") return TaskStatus::FAILED;
  if (str == "stopped") return TaskStatus::STOPPED;
  if (str == "warning") return TaskStatus::WARNING;
  throw std::invalid_argument("Invalid TaskStatus string: " + str);
}

// One execution attempt of a job. completed_at is empty exactly while RUNNING.
struct TaskDTO {
  long long id = 0;
  std::string task_type;
  nlohmann::json params;
  TaskStatus status = TaskStatus::RUNNING;
  std::chrono::system_clock::time_point started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::optional<std::string> error_message;
  long long result_count = 0;
  nlohmann::json config;  // null when no snapshot was recorded
};

}  // namespace harvest_core
