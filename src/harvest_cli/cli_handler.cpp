#include "harvest_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>

namespace harvest_cli {

namespace {

std::string value_or_dash(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return "-";
    }
    return json[key].is_string() ? json[key].get<std::string>() : json[key].dump();
}

void require_id(const CliOptions& options, const std::string& usage) {
    if (options.id.empty()) {
        throw CliError("Missing --id. Usage: " + usage);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json CliHandler::parse_json_argument(const std::string& flag, const std::string& value) {
    nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
        throw CliError(flag + " expects a JSON value, got: " + value);
    }
    return parsed;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "enqueue" || command == "add") {
        options.command = Command::Enqueue;
    } else if (command == "list" || command == "ls") {
        options.command = Command::List;
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "status") {
        options.command = Command::Status;
    } else if (command == "start") {
        options.command = Command::Start;
    } else if (command == "stop") {
        options.command = Command::Stop;
    } else if (command == "remove" || command == "rm") {
        options.command = Command::Remove;
    } else if (command == "priority") {
        options.command = Command::Priority;
    } else if (command == "clear") {
        options.command = Command::Clear;
    } else if (command == "tasks") {
        options.command = Command::Tasks;
    } else if (command == "task") {
        options.command = Command::Task;
    } else if (command == "logs") {
        options.command = Command::Logs;
    } else if (command == "delete-task") {
        options.command = Command::DeleteTask;
    } else if (command == "events") {
        options.command = Command::Events;
    } else if (command == "validate") {
        options.command = Command::Validate;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'help' for usage.");
    }

    bool priority_given = false;
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--raw") {
            options.raw = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--type" || flag == "-t") {
            options.task_type = value;
        } else if (flag == "--params") {
            options.params = parse_json_argument(flag, value);
        } else if (flag == "--config") {
            options.config = parse_json_argument(flag, value);
        } else if (flag == "--payload") {
            options.payload = parse_json_argument(flag, value);
        } else if (flag == "--priority" || flag == "-p" || flag == "--value") {
            options.priority = std::stoi(value);
            priority_given = true;
        } else if (flag == "--id") {
            options.id = value;
        } else if (flag == "--status" || flag == "-s") {
            options.status_filter = value;
        } else if (flag == "--limit" || flag == "-n") {
            options.limit = std::stoi(value);
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    switch (options.command) {
        case Command::Enqueue:
            if (options.task_type.empty()) {
                throw CliError("Usage: enqueue --type <kind> [--params <json>] [--config <json>] [--priority <n>]");
            }
            break;
        case Command::Remove:
            require_id(options, "remove --id <queue_id>");
            break;
        case Command::Priority:
            require_id(options, "priority --id <queue_id> --value <n>");
            if (!priority_given) {
                throw CliError("Missing --value. Usage: priority --id <queue_id> --value <n>");
            }
            break;
        case Command::Task:
            require_id(options, "task --id <task_id|current>");
            break;
        case Command::Logs:
            require_id(options, "logs --id <task_id>");
            break;
        case Command::DeleteTask:
            require_id(options, "delete-task --id <task_id>");
            break;
        case Command::Validate:
            if (options.payload.is_null()) {
                throw CliError("Usage: validate --payload <json>");
            }
            break;
        default:
            break;
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Enqueue:
            handle_enqueue_command(options);
            break;
        case Command::List:
            handle_list_command(options);
            break;
        case Command::Stats: {
            nlohmann::json response = make_get_request("/queue/stats");
            if (options.raw) {
                print_json_response(response);
                break;
            }
            const auto& data = response["data"];
            std::cout << "pending: " << data.value("pending", 0) << "  running: " << data.value("running", 0)
                      << "  completed: " << data.value("completed", 0) << "  failed: " << data.value("failed", 0)
                      << "  total: " << data.value("total", 0) << std::endl;
            break;
        }
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Start:
            print_message(make_post_request("/queue/start", nlohmann::json::object()));
            break;
        case Command::Stop:
            print_message(make_post_request("/queue/stop", nlohmann::json::object()));
            break;
        case Command::Remove:
            print_message(make_delete_request("/queue/" + options.id));
            break;
        case Command::Priority:
            print_message(make_post_request("/queue/" + options.id + "/priority",
                                            {{"priority", options.priority}}));
            break;
        case Command::Clear: {
            nlohmann::json response = make_post_request("/queue/clear", nlohmann::json::object());
            std::cout << "Removed " << response["data"].value("removed", 0) << " finished item(s)" << std::endl;
            break;
        }
        case Command::Tasks:
            handle_tasks_command(options);
            break;
        case Command::Task:
            handle_task_command(options);
            break;
        case Command::Logs:
            handle_logs_command(options);
            break;
        case Command::DeleteTask:
            print_message(make_delete_request("/tasks/" + options.id));
            break;
        case Command::Events: {
            std::string endpoint = "/events";
            if (options.limit > 0) {
                endpoint += "?limit=" + std::to_string(options.limit);
            }
            nlohmann::json response = make_get_request(endpoint);
            for (const auto& event : response["data"]["events"]) {
                std::cout << event.dump() << std::endl;
            }
            break;
        }
        case Command::Validate:
            handle_validate_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_enqueue_command(const CliOptions& options) {
    nlohmann::json body = {{"taskType", options.task_type},
                           {"params", options.params},
                           {"config", options.config},
                           {"priority", options.priority}};
    nlohmann::json response = make_post_request("/queue", body);
    std::cout << "Queued item " << response["data"]["id"].get<long long>() << " (" << options.task_type
              << ", priority " << options.priority << ")" << std::endl;
}

void CliHandler::handle_list_command(const CliOptions& options) {
    std::string endpoint = "/queue";
    if (!options.status_filter.empty()) {
        endpoint += "?status=" + options.status_filter;
    }
    nlohmann::json response = make_get_request(endpoint);
    if (options.raw) {
        print_json_response(response);
        return;
    }

    const auto& items = response["data"]["items"];
    if (items.empty()) {
        std::cout << "Queue is empty." << std::endl;
        return;
    }
    std::cout << std::left << std::setw(6) << "ID" << std::setw(10) << "PRIORITY" << std::setw(11) << "STATUS"
              << std::setw(12) << "TYPE" << std::setw(8) << "TASK" << "CREATED" << std::endl;
    for (const auto& item : items) {
        std::cout << std::left << std::setw(6) << item["id"].get<long long>() << std::setw(10)
                  << item["priority"].get<int>() << std::setw(11) << item["status"].get<std::string>()
                  << std::setw(12) << value_or_dash(item["task_config"], "taskType") << std::setw(8)
                  << value_or_dash(item, "task_id") << value_or_dash(item, "created_at") << std::endl;
        if (item.contains("error_message") && !item["error_message"].is_null()) {
            std::cout << "      error: " << item["error_message"].get<std::string>() << std::endl;
        }
    }
}

void CliHandler::handle_status_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/queue/status");
    if (options.raw) {
        print_json_response(response);
        return;
    }
    const auto& data = response["data"];
    std::cout << "Queue: " << data.value("status", std::string("unknown")) << std::endl;
    if (!data["current_item"].is_null()) {
        const auto& item = data["current_item"];
        std::cout << "Running item " << item["id"].get<long long>() << " ("
                  << value_or_dash(item["task_config"], "taskType") << "), task "
                  << value_or_dash(item, "task_id") << std::endl;
    }
    const auto& stats = data["stats"];
    std::cout << "pending: " << stats.value("pending", 0) << "  running: " << stats.value("running", 0)
              << "  completed: " << stats.value("completed", 0) << "  failed: " << stats.value("failed", 0)
              << std::endl;
}

void CliHandler::handle_tasks_command(const CliOptions& options) {
    std::string endpoint = "/tasks";
    if (options.limit > 0) {
        endpoint += "?limit=" + std::to_string(options.limit);
    }
    nlohmann::json response = make_get_request(endpoint);
    if (options.raw) {
        print_json_response(response);
        return;
    }
    for (const auto& task : response["data"]["tasks"]) {
        std::cout << std::left << std::setw(6) << task["id"].get<long long>() << std::setw(11)
                  << task["status"].get<std::string>() << std::setw(12) << task["task_type"].get<std::string>()
                  << std::setw(8) << task["result_count"].get<long long>() << task["started_at"].get<std::string>();
        if (!task["error_message"].is_null()) {
            std::cout << "  " << task["error_message"].get<std::string>();
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_task_command(const CliOptions& options) {
    print_json_response(make_get_request("/tasks/" + options.id)["data"]);
}

void CliHandler::handle_logs_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/tasks/" + options.id + "/logs");
    if (options.raw) {
        print_json_response(response);
        return;
    }
    for (const auto& log : response["data"]["logs"]) {
        std::cout << log["timestamp"].get<std::string>() << " [" << log["type"].get<std::string>();
        if (!log["level"].is_null()) {
            std::cout << "/" << log["level"].get<std::string>();
        }
        std::cout << "] " << log["message"].get<std::string>();
        if (!log["metadata"].is_null()) {
            std::cout << " " << log["metadata"].dump();
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_validate_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/validate", {{"payload", options.payload}});
    const auto& data = response["data"];
    bool valid = data.value("valid", false);
    std::cout << (valid ? "Valid" : "Invalid") << ": " << data.value("message", std::string()) << std::endl;
    if (data.contains("userInfo")) {
        std::cout << "User: " << value_or_dash(data["userInfo"], "nickname") << " ("
                  << value_or_dash(data["userInfo"], "userId") << ")" << std::endl;
    }
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base = api_base_url_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    return perform_request("GET", endpoint, std::nullopt);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    return perform_request("POST", endpoint, data);
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    return perform_request("DELETE", endpoint, std::nullopt);
}

nlohmann::json CliHandler::perform_request(const std::string& method, const std::string& endpoint,
                                           const std::optional<nlohmann::json>& body) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = body ? body->dump() : "";
    std::string response_buffer;
    struct curl_slist* headers = nullptr;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    } else if (method != "GET") {
        curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code < 200 || http_code >= 300) {
        if (!response.is_discarded() && response.contains("error")) {
            throw CliError(response["error"].get<std::string>() + " (HTTP " + std::to_string(http_code) + ")");
        }
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }
    if (response.is_discarded()) {
        throw CliError("Server returned a non-JSON response");
    }
    return response;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_message(const nlohmann::json& response) {
    std::cout << response.value("message", std::string("OK")) << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Harvest CLI - control the harvest job queue\n\n"
              << "Usage: harvest_cli <command> [options]\n\n"
              << "Queue:\n"
              << "  enqueue --type <kind> [--params <json>] [--config <json>] [--priority <n>]\n"
              << "  list [--status pending|running|completed|failed]\n"
              << "  stats                       Item counts by status\n"
              << "  status                      Queue state and the running item\n"
              << "  start                       Start draining the queue\n"
              << "  stop                        Pause; the running item returns to pending\n"
              << "  remove --id <queue_id>\n"
              << "  priority --id <queue_id> --value <n>\n"
              << "  clear                       Delete completed and failed items\n\n"
              << "History:\n"
              << "  tasks [--limit <n>]\n"
              << "  task --id <task_id|current>\n"
              << "  logs --id <task_id>\n"
              << "  delete-task --id <task_id>\n"
              << "  events [--limit <n>]        Recent worker events\n\n"
              << "Other:\n"
              << "  validate --payload <json>   Run the worker's validation mode\n"
              << "  help\n\n"
              << "Add --raw to print the full JSON response.\n"
              << "The server address is read from HARVEST_API_URL (default http://127.0.0.1:3040)."
              << std::endl;
}

}  // namespace harvest_cli
