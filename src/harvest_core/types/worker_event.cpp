#include "harvest_core/types/worker_event.hpp"

#include <cmath>
#include <limits>

namespace harvest_core {

namespace {

template <typename T>
std::optional<T> optional_field(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::optional<long long> optional_integer(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_number()) {
    return std::nullopt;
  }
  if (it->is_number_float()) {
    // 2^63 is exactly representable; anything at or above it overflows long long.
    const double value = it->get<double>();
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value >= kLimit || value < -kLimit) {
      throw WorkerProtocolError(std::string("field '") + key + "' is out of range");
    }
    return static_cast<long long>(value);
  }
  if (it->is_number_unsigned() &&
      it->get<unsigned long long>() >
          static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
    throw WorkerProtocolError(std::string("field '") + key + "' is out of range");
  }
  return it->get<long long>();
}

const char* const kReplacementCharacter = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0.
std::size_t utf8_sequence_length(const std::string& s, std::size_t pos) {
  const auto byte = [&](std::size_t i) { return static_cast<unsigned char>(s[i]); };
  const unsigned char lead = byte(pos);
  if (lead < 0x80) {
    return 1;
  }
  std::size_t length = 0;
  unsigned char lower = 0x80;
  unsigned char upper = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) lower = 0xA0;  // overlong
    if (lead == 0xED) upper = 0x9F;  // surrogates
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) lower = 0x90;  // overlong
    if (lead == 0xF4) upper = 0x8F;  // above U+10FFFF
  } else {
    return 0;
  }
  if (pos + length > s.size()) {
    return 0;
  }
  if (byte(pos + 1) < lower || byte(pos + 1) > upper) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) {
      return 0;
    }
  }
  return length;
}

std::string string_or_empty(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

}  // namespace

std::string to_valid_utf8(const std::string& bytes) {
  std::string result;
  result.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t length = utf8_sequence_length(bytes, pos);
    if (length == 0) {
      result += kReplacementCharacter;
      ++pos;
    } else {
      result.append(bytes, pos, length);
      pos += length;
    }
  }
  return result;
}

std::string to_string(WorkerEventType type) {
  switch (type) {
    case WorkerEventType::Log: return "log";
    case WorkerEventType::Progress: return "progress";
    case WorkerEventType::Media: return "media";
    case WorkerEventType::Done: return "done";
    case WorkerEventType::Error: return "error";
    case WorkerEventType::ValidationResult: return "validation_result";
    case WorkerEventType::Exit: return "exit";
  }
  return "unknown";
}

std::optional<WorkerEventType> worker_event_type_from_string(const std::string& str) {
  if (str == "log") return WorkerEventType::Log;
  if (str == "progress") return WorkerEventType::Progress;
  if (str == "media") return WorkerEventType::Media;
  if (str == "done") return WorkerEventType::Done;
  if (str == "error") return WorkerEventType::Error;
  if (str == "validation_result") return WorkerEventType::ValidationResult;
  if (str == "exit") return WorkerEventType::Exit;
  return std::nullopt;
}

WorkerEvent WorkerEvent::parse_line(const std::string& line) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& e) {
    throw WorkerProtocolError(std::string("malformed JSON: ") + e.what());
  }
  return from_json(json);
}

WorkerEvent WorkerEvent::from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw WorkerProtocolError("record is not a JSON object");
  }
  auto type_it = json.find("type");
  if (type_it == json.end() || !type_it->is_string()) {
    throw WorkerProtocolError("record has no string 'type' field");
  }
  auto type = worker_event_type_from_string(type_it->get<std::string>());
  // exit is reserved for the bridge; a worker cannot forge its own termination.
  if (!type || *type == WorkerEventType::Exit) {
    throw WorkerProtocolError("unknown record type '" + type_it->get<std::string>() + "'");
  }

  WorkerEvent event;
  event.type = *type;
  try {
    event.level = optional_field<std::string>(json, "level");
    event.message = string_or_empty(json, "message");
    switch (event.type) {
      case WorkerEventType::Progress:
        event.current = optional_integer(json, "current");
        event.total = optional_integer(json, "total");
        event.title = optional_field<std::string>(json, "title");
        break;
      case WorkerEventType::Media:
        event.note_id = optional_field<std::string>(json, "noteId");
        event.action = optional_field<std::string>(json, "action");
        event.file = optional_field<std::string>(json, "file");
        event.progress = optional_field<double>(json, "progress");
        event.success = optional_field<bool>(json, "success");
        break;
      case WorkerEventType::Done:
        event.count = optional_integer(json, "count");
        if (json.contains("files") && json.at("files").is_array()) {
          for (const auto& f : json.at("files")) {
            if (f.is_string()) {
              event.files.push_back(f.get<std::string>());
            }
          }
        }
        event.api_success = optional_field<bool>(json, "api_success");
        event.api_message = optional_field<std::string>(json, "api_message");
        break;
      case WorkerEventType::Error:
        if (json.contains("code") && !json.at("code").is_null()) {
          event.code = string_or_empty(json, "code");
        }
        break;
      case WorkerEventType::ValidationResult:
        event.valid = optional_field<bool>(json, "valid");
        if (json.contains("userInfo") && json.at("userInfo").is_object()) {
          const auto& info = json.at("userInfo");
          UserInfo user;
          user.user_id = string_or_empty(info, "userId");
          user.nickname = string_or_empty(info, "nickname");
          user.red_id = string_or_empty(info, "redId");
          user.avatar = string_or_empty(info, "avatar");
          event.user_info = user;
        }
        break;
      default:
        break;
    }
  } catch (const nlohmann::json::type_error& e) {
    throw WorkerProtocolError(std::string("field has the wrong type: ") + e.what());
  }
  return event;
}

nlohmann::json WorkerEvent::to_json() const {
  nlohmann::json json;
  json["type"] = to_string(type);
  if (level) json["level"] = *level;
  json["message"] = message;
  if (current) json["current"] = *current;
  if (total) json["total"] = *total;
  if (title) json["title"] = *title;
  if (note_id) json["noteId"] = *note_id;
  if (action) json["action"] = *action;
  if (file) json["file"] = *file;
  if (progress) json["progress"] = *progress;
  if (success) json["success"] = *success;
  if (count) json["count"] = *count;
  if (!files.empty()) json["files"] = files;
  if (api_success) json["api_success"] = *api_success;
  if (api_message) json["api_message"] = *api_message;
  if (code) json["code"] = *code;
  if (valid) json["valid"] = *valid;
  if (user_info) {
    json["userInfo"] = {{"userId", user_info->user_id},
                        {"nickname", user_info->nickname},
                        {"redId", user_info->red_id},
                        {"avatar", user_info->avatar}};
  }
  if (exit_code) json["exitCode"] = *exit_code;
  if (outcome) json["outcome"] = *outcome;
  return json;
}

nlohmann::json WorkerEvent::metadata() const {
  nlohmann::json meta = nlohmann::json::object();
  switch (type) {
    case WorkerEventType::Progress:
      if (current) meta["current"] = *current;
      if (total) meta["total"] = *total;
      if (title) meta["title"] = *title;
      break;
    case WorkerEventType::Media:
      if (note_id) meta["noteId"] = *note_id;
      if (action) meta["action"] = *action;
      if (file) meta["file"] = *file;
      if (progress) meta["progress"] = *progress;
      if (success) meta["success"] = *success;
      break;
    case WorkerEventType::Done:
      if (count) meta["count"] = *count;
      if (!files.empty()) meta["files"] = files;
      break;
    case WorkerEventType::Error:
      if (code) meta["code"] = *code;
      break;
    case WorkerEventType::Exit:
      if (exit_code) meta["exitCode"] = *exit_code;
      if (outcome) meta["outcome"] = *outcome;
      break;
    default:
      break;
  }
  if (meta.empty()) {
    return nullptr;
  }
  return meta;
}

WorkerEvent WorkerEvent::make_error(const std::string& message, const std::string& code) {
  WorkerEvent event;
  event.type = WorkerEventType::Error;
  event.message = message;
  if (!code.empty()) {
    event.code = code;
  }
  return event;
}

WorkerEvent WorkerEvent::make_log(const std::string& level, const std::string& message) {
  WorkerEvent event;
  event.type = WorkerEventType::Log;
  event.level = level;
  event.message = message;
  return event;
}

}  // namespace harvest_core
