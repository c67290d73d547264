#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "harvest_core/types/job_description.hpp"

namespace harvest_core {

enum class QueueItemStatus { PENDING, RUNNING, COMPLETED, FAILED };

inline std::string to_string(QueueItemStatus status) {
  switch (status) {
    case QueueItemStatus::PENDING: return "pending";
    case QueueItemStatus::RUNNING: return "running";
    case QueueItemStatus::COMPLETED: return "completed";
    case QueueItemStatus::FAILED: return "failed";
  }
  return "unknown";
}

inline QueueItemStatus queue_item_status_from_string(const std::string& str) {
  if (str == "pending") return QueueItemStatus::PENDING;
  if (str == "running") return QueueItemStatus::RUNNING;
  if (str == "completed") return QueueItemStatus::COMPLETED;
  if (str == "failed") return QueueItemStatus::FAILED;
  throw std::invalid_argument("Invalid QueueItemStatus string: " + str);
}

struct QueueItemDTO {
  long long id = 0;
  JobDescription job;
  int priority = 0;
  QueueItemStatus status = QueueItemStatus::PENDING;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::optional<long long> task_id;
  std::optional<std::string> error_message;
};

// Optional columns written together with a status transition.
struct QueueUpdate {
  std::optional<long long> task_id;
  std::optional<std::string> error_message;
  bool clear_task = false;  // drop task_id and error (used when reverting to PENDING)
};

struct QueueStats {
  long long pending = 0;
  long long running = 0;
  long long completed = 0;
  long long failed = 0;
  long long total = 0;

  bool operator==(const QueueStats& other) const {
    return pending == other.pending && running == other.running &&
           completed == other.completed && failed == other.failed && total == other.total;
  }
};

}  // namespace harvest_core
