#include "harvest_core/types/job_description.hpp"

#include <stdexcept>

namespace harvest_core {

namespace {
const char* const kSecretConfigKeys[] = {"cookie"};
}

nlohmann::json JobDescription::to_json() const {
  nlohmann::json json;
  json["taskType"] = kind;
  json["params"] = params;
  json["config"] = config;
  return json;
}

JobDescription JobDescription::from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("Job description must be a JSON object");
  }
  auto type_it = json.find("taskType");
  if (type_it == json.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
    throw std::invalid_argument("Job description requires a non-empty string 'taskType'");
  }

  JobDescription job;
  job.kind = type_it->get<std::string>();
  if (json.contains("params") && !json.at("params").is_null()) {
    job.params = json.at("params");
  }
  if (json.contains("config") && !json.at("config").is_null()) {
    if (!json.at("config").is_object()) {
      throw std::invalid_argument("Job description 'config' must be an object");
    }
    job.config = json.at("config");
  }
  return job;
}

nlohmann::json JobDescription::config_snapshot() const {
  nlohmann::json snapshot = config.is_object() ? config : nlohmann::json::object();
  for (const char* key : kSecretConfigKeys) {
    snapshot.erase(key);
  }
  return snapshot;
}

std::string JobDescription::to_worker_argument() const {
  nlohmann::json argument = config.is_object() ? config : nlohmann::json::object();
  argument["taskType"] = kind;
  argument["params"] = params;
  return argument.dump();
}

}  // namespace harvest_core
