#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace harvest_core {

// What the worker should do: a kind tag ("search", "user", "notes"...), the
// kind specific parameters and the execution config (save options, output
// paths, proxy, session cookie).
struct JobDescription {
  std::string kind;
  nlohmann::json params = nlohmann::json::object();
  nlohmann::json config = nlohmann::json::object();

  // {"taskType": ..., "params": {...}, "config": {...}}
  nlohmann::json to_json() const;

  // Throws std::invalid_argument when taskType is missing or not a string.
  static JobDescription from_json(const nlohmann::json& json);

  // Config copy stored on the task row. Credentials never reach history.
  nlohmann::json config_snapshot() const;

  // Argument handed to the worker process. The worker reads the config keys
  // flattened next to taskType/params.
  std::string to_worker_argument() const;
};

}  // namespace harvest_core
