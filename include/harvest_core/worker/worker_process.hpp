#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "harvest_core/errors.hpp"

namespace harvest_core {

// How to launch the worker executable. Job and validation arguments are
// appended after `args`.
struct WorkerCommand {
  std::string executable;
  std::vector<std::string> args;
  std::string working_directory;
  std::map<std::string, std::string> environment;
  std::chrono::seconds validation_timeout{60};
  std::chrono::milliseconds stop_grace_period{3000};
};

struct ExitStatus {
  std::optional<int> exit_code;
  std::optional<int> term_signal;

  bool success() const {
    return exit_code && *exit_code == 0;
  }
  static ExitStatus from_wait_status(int status);
};

// Raised when the worker executable cannot be launched.
class WorkerProcessError : public HarvestError {
 public:
  explicit WorkerProcessError(const std::string& message)
      : HarvestError(ErrorKind::ProcessSpawnError, message) {}
};

/**
 * @class WorkerProcess
 * @brief Owns one child process and the read ends of its stdout/stderr pipes.
 *
 * The child runs in its own process group so signals reach anything it
 * spawned. stdin is /dev/null. If the object is destroyed while the child is
 * still alive the group is killed and reaped, so no zombie outlives it.
 */
class WorkerProcess {
 public:
  /**
   * @brief Forks and execs `command.executable command.args... extra_args...`.
   * @throws WorkerProcessError if the executable is not found, a pipe or fork
   * fails, or exec fails in the child.
   */
  static std::unique_ptr<WorkerProcess> spawn(const WorkerCommand& command,
                                              const std::vector<std::string>& extra_args);

  ~WorkerProcess();

  pid_t pid() const {
    return pid_;
  }
  // Non-blocking read ends; -1 once closed.
  int stdout_fd() const {
    return stdout_fd_;
  }
  int stderr_fd() const {
    return stderr_fd_;
  }
  void close_stdout();
  void close_stderr();

  // Sends `sig` to the child's process group. False if already reaped.
  bool signal(int sig);

  std::optional<ExitStatus> try_wait();
  ExitStatus wait();
  bool has_exited() const {
    return exit_status_.has_value();
  }

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

 private:
  WorkerProcess(pid_t pid, int stdout_fd, int stderr_fd);

  pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;
  std::optional<ExitStatus> exit_status_;
};

// Finds `name` on PATH (or checks it directly when it contains a '/').
std::optional<std::string> resolve_executable(const std::string& name);

}  // namespace harvest_core
