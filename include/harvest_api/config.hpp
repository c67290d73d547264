#pragma once

#include <chrono>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "harvest_core/worker/worker_process.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  std::string database_key_env;
  int db_pool_size;

  // Worker process
  std::string worker_executable;
  std::vector<std::string> worker_args;
  std::string worker_working_directory;
  std::map<std::string, std::string> worker_environment;
  int validation_timeout_seconds;
  int stop_grace_period_ms;

  // Scheduling and maintenance
  int settle_delay_ms;
  int stuck_task_threshold_minutes;
  int history_retention_days;
  int recent_event_buffer;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
      config.database_path = json_config.value("database_path", std::string("./data/harvest.db"));
      config.database_key_env = json_config.value("database_key_env", std::string("HARVEST_DB_KEY"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.worker_executable = json_config.value("worker_executable", std::string("python3"));
      config.worker_args =
          json_config.value("worker_args", std::vector<std::string>{"cli.py"});
      config.worker_working_directory =
          json_config.value("worker_working_directory", std::string(""));
      config.worker_environment = json_config.value("worker_environment",
                                                    std::map<std::string, std::string>{});
      config.validation_timeout_seconds = json_config.value("validation_timeout_seconds", 60);
      config.stop_grace_period_ms = json_config.value("stop_grace_period_ms", 3000);

      config.settle_delay_ms = json_config.value("settle_delay_ms", 1000);
      config.stuck_task_threshold_minutes = json_config.value("stuck_task_threshold_minutes", 10);
      config.history_retention_days = json_config.value("history_retention_days", 30);
      config.recent_event_buffer = json_config.value("recent_event_buffer", 200);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  harvest_core::WorkerCommand worker_command() const {
    harvest_core::WorkerCommand command;
    command.executable = worker_executable;
    command.args = worker_args;
    command.working_directory = worker_working_directory;
    command.environment = worker_environment;
    command.validation_timeout = std::chrono::seconds(validation_timeout_seconds);
    command.stop_grace_period = std::chrono::milliseconds(stop_grace_period_ms);
    return command;
  }

  // host and port halves of api_base_url
  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon + 1 >= api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (db_pool_size < 2) {
      throw std::runtime_error("db_pool_size must be at least 2");
    }
    if (worker_executable.empty()) {
      throw std::runtime_error("worker_executable cannot be empty");
    }
    if (validation_timeout_seconds < 1) {
      throw std::runtime_error("validation_timeout_seconds must be at least 1 second");
    }
    if (stop_grace_period_ms < 0) {
      throw std::runtime_error("stop_grace_period_ms cannot be negative");
    }
    if (settle_delay_ms < 0) {
      throw std::runtime_error("settle_delay_ms cannot be negative");
    }
    if (stuck_task_threshold_minutes < 1) {
      throw std::runtime_error("stuck_task_threshold_minutes must be at least 1 minute");
    }
    if (history_retention_days < 1) {
      throw std::runtime_error("history_retention_days must be at least 1 day");
    }
    if (recent_event_buffer < 0) {
      throw std::runtime_error("recent_event_buffer cannot be negative");
    }
  }
};
