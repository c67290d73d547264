#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "harvest_core/db/models/queue_item_dto.hpp"
#include "harvest_core/errors.hpp"

namespace harvest_core {

enum class SchedulerStatus { IDLE, RUNNING, PAUSED };

inline std::string to_string(SchedulerStatus status) {
  switch (status) {
    case SchedulerStatus::IDLE: return "idle";
    case SchedulerStatus::RUNNING: return "running";
    case SchedulerStatus::PAUSED: return "paused";
  }
  return "unknown";
}

// What listeners receive after every state change of the queue.
struct QueueStatusSnapshot {
  // Increases with every published snapshot; 0 for one that was never published.
  std::uint64_t sequence = 0;
  SchedulerStatus status = SchedulerStatus::IDLE;
  std::optional<QueueItemDTO> current_item;
  QueueStats stats;
};

// Outcome of start()/stop(). These fail as part of normal operation
// (double start, stop while idle) so they report instead of throwing.
struct ControlResult {
  bool success = false;
  std::string message;
  std::optional<ErrorKind> error;

  static ControlResult ok(const std::string& message) {
    return ControlResult{true, message, std::nullopt};
  }
  static ControlResult failure(ErrorKind kind, const std::string& message) {
    return ControlResult{false, message, kind};
  }
};

}  // namespace harvest_core
