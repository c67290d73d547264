#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace harvest_core {

struct LogDTO {
  long long id = 0;
  long long task_id = 0;
  std::string type;
  std::optional<std::string> level;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
  nlohmann::json metadata;  // null when the event carried none
};

}  // namespace harvest_core
