#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace harvest_core {

enum class WorkerEventType { Log, Progress, Media, Done, Error, ValidationResult, Exit };

std::string to_string(WorkerEventType type);
std::optional<WorkerEventType> worker_event_type_from_string(const std::string& str);

// Replaces every ill-formed UTF-8 sequence in `bytes` with U+FFFD. Raw worker
// output must pass through this before it reaches a JSON value.
std::string to_valid_utf8(const std::string& bytes);

// Thrown for a frame that is valid JSON but not a worker record.
class WorkerProtocolError : public std::exception {
 public:
  explicit WorkerProtocolError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct UserInfo {
  std::string user_id;
  std::string nickname;
  std::string red_id;
  std::string avatar;
};

/**
 * @struct WorkerEvent
 * @brief One record of the worker line protocol, or a synthetic record built
 * by the bridge (stderr text, process exit).
 *
 * Only the fields belonging to `type` are populated:
 *  - log: level, message
 *  - progress: current, total, title
 *  - media: note_id, action, file, progress, success
 *  - done: count, files, api_success, api_message
 *  - error: message, code
 *  - validation_result: valid, message, user_info
 *  - exit (synthetic): exit_code, success, outcome, message
 */
struct WorkerEvent {
  WorkerEventType type = WorkerEventType::Log;
  std::optional<std::string> level;
  std::string message;

  std::optional<long long> current;
  std::optional<long long> total;
  std::optional<std::string> title;

  std::optional<std::string> note_id;
  std::optional<std::string> action;
  std::optional<std::string> file;
  std::optional<double> progress;
  std::optional<bool> success;

  std::optional<long long> count;
  std::vector<std::string> files;
  std::optional<bool> api_success;
  std::optional<std::string> api_message;

  std::optional<std::string> code;

  std::optional<bool> valid;
  std::optional<UserInfo> user_info;

  std::optional<int> exit_code;
  std::optional<std::string> outcome;

  static WorkerEvent parse_line(const std::string& line);
  static WorkerEvent from_json(const nlohmann::json& json);
  nlohmann::json to_json() const;

  // Metadata column stored next to the log row, null when the type carries none.
  nlohmann::json metadata() const;

  bool is_terminal() const {
    return type == WorkerEventType::Exit;
  }

  static WorkerEvent make_error(const std::string& message, const std::string& code = "");
  static WorkerEvent make_log(const std::string& level, const std::string& message);
};

}  // namespace harvest_core
