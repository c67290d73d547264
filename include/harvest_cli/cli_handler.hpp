#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace harvest_cli {

enum class Command {
  Enqueue,
  List,
  Stats,
  Status,
  Start,
  Stop,
  Remove,
  Priority,
  Clear,
  Tasks,
  Task,
  Logs,
  DeleteTask,
  Events,
  Validate,
  Help
};

struct CliOptions {
  Command command = Command::Help;
  std::string task_type;
  nlohmann::json params = nlohmann::json::object();
  nlohmann::json config = nlohmann::json::object();
  nlohmann::json payload;
  int priority = 0;
  std::string id;  // queue item or task id; "current" for task
  std::string status_filter;
  int limit = 0;
  bool raw = false;  // print the full JSON envelope
};

// Usage mistakes and transport failures; main() prints what() and exits 1.
class CliError : public std::runtime_error {
 public:
  explicit CliError(const std::string& message) : std::runtime_error(message) {}
};

// Thin REST client over a single reusable curl easy handle.
class CliHandler {
 public:
  explicit CliHandler(const std::string& api_base_url);
  ~CliHandler();

  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  CliOptions parse_arguments(int argc, char* argv[]);
  void execute_command(const CliOptions& options);

  std::string get_api_base_url() const;

 private:
  void handle_enqueue_command(const CliOptions& options);
  void handle_list_command(const CliOptions& options);
  void handle_status_command(const CliOptions& options);
  void handle_tasks_command(const CliOptions& options);
  void handle_task_command(const CliOptions& options);
  void handle_logs_command(const CliOptions& options);
  void handle_validate_command(const CliOptions& options);

  nlohmann::json make_get_request(const std::string& endpoint);
  nlohmann::json make_post_request(const std::string& endpoint, const nlohmann::json& data);
  nlohmann::json make_delete_request(const std::string& endpoint);
  // Sends the request and returns the decoded envelope; non-2xx answers throw CliError.
  nlohmann::json perform_request(const std::string& method, const std::string& endpoint,
                                 const std::optional<nlohmann::json>& body);

  void setup_curl_handle();
  static std::size_t write_callback(void* contents, std::size_t size, std::size_t nmemb,
                                    std::string* userp);
  static nlohmann::json parse_json_argument(const std::string& flag, const std::string& value);
  void print_json_response(const nlohmann::json& response);
  void print_message(const nlohmann::json& response);
  void print_help();
  std::string build_url(const std::string& endpoint);

  std::string api_base_url_;
  CURL* curl_handle_ = nullptr;
};

}  // namespace harvest_cli
