#pragma once

#include <exception>
#include <string>

namespace harvest_core {

enum class ErrorKind {
  AlreadyRunning,
  QueueNotRunning,
  ItemNotRemovable,
  ProcessSpawnError,
  ProcessExitError,
  ValidationFailure,
  Storage
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AlreadyRunning: return "already_running";
    case ErrorKind::QueueNotRunning: return "queue_not_running";
    case ErrorKind::ItemNotRemovable: return "item_not_removable";
    case ErrorKind::ProcessSpawnError: return "process_spawn_error";
    case ErrorKind::ProcessExitError: return "process_exit_error";
    case ErrorKind::ValidationFailure: return "validation_failure";
    case ErrorKind::Storage: return "storage";
  }
  return "unknown";
}

// Base for every error the engine raises; carries the taxonomy kind so
// callers (HTTP layer, CLI) can map it without string matching.
class HarvestError : public std::exception {
 public:
  HarvestError(ErrorKind kind, const std::string& message) : kind_(kind), message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

}  // namespace harvest_core
