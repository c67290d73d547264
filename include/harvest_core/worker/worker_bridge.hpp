#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "harvest_core/errors.hpp"
#include "harvest_core/types/job_description.hpp"
#include "harvest_core/types/worker_event.hpp"
#include "harvest_core/worker/event_channel.hpp"
#include "harvest_core/worker/worker_process.hpp"

namespace harvest_core {

class TaskStore;

class WorkerBridgeError : public HarvestError {
 public:
  WorkerBridgeError(ErrorKind kind,
                    const std::string& message,
                    std::optional<long long> task_id = std::nullopt)
      : HarvestError(kind, message), task_id_(task_id) {}

  // The Task recorded for the failed start, when one was created.
  std::optional<long long> task_id() const {
    return task_id_;
  }

 private:
  std::optional<long long> task_id_;
};

struct ValidationResult {
  bool valid = false;
  std::string message;
  std::optional<UserInfo> user_info;

  nlohmann::json to_json() const;
};

/**
 * @class IWorkerBridge
 * @brief Runs at most one worker process at a time and streams its events.
 */
class IWorkerBridge {
 public:
  virtual ~IWorkerBridge() = default;

  /**
   * @brief Creates the Task for `job` and launches the worker for it.
   *
   * Every event the worker produces is stored as a log of the new task and
   * pushed onto `channel`. The run ends with a single `exit` event, after
   * which the channel is closed.
   *
   * @return The id of the task bound to this run.
   * @throws WorkerBridgeError AlreadyRunning if a process is active,
   * ProcessSpawnError if the worker could not be launched (the task is then
   * already finalized as failed).
   */
  virtual long long start(const JobDescription& job, EventChannelPtr channel) = 0;

  /**
   * @brief Terminates the active worker without waiting for it.
   *
   * The bound task is finalized as `stopped` and the channel is closed with
   * no `exit` event. Anything the process prints while dying is discarded.
   * No-op when nothing is running.
   */
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
  virtual std::optional<long long> current_task_id() const = 0;

  // Synchronous validation run; creates no task and no logs.
  virtual ValidationResult validate(const nlohmann::json& payload) = 0;
};

class WorkerBridge : public IWorkerBridge {
 public:
  WorkerBridge(TaskStore& store, WorkerCommand command);
  ~WorkerBridge() override;

  long long start(const JobDescription& job, EventChannelPtr channel) override;
  void stop() override;
  bool is_running() const override;
  std::optional<long long> current_task_id() const override;
  ValidationResult validate(const nlohmann::json& payload) override;

  // Stops any active run and waits for every supervisor thread to finish.
  void shutdown();

  WorkerBridge(const WorkerBridge&) = delete;
  WorkerBridge& operator=(const WorkerBridge&) = delete;

 private:
  struct Session;

  void supervise(std::shared_ptr<Session> session);
  void handle_stdout_frame(Session& session, const std::string& frame);
  void handle_stderr_line(Session& session, const std::string& line);
  // Persists and forwards one event. Caller holds mutex_.
  void emit_locked(Session& session, const WorkerEvent& event);
  void finalize(Session& session, const ExitStatus& status);
  void stop_locked();
  void join_finished_sessions();

  TaskStore& store_;
  WorkerCommand command_;

  mutable std::mutex mutex_;
  std::shared_ptr<Session> active_;
  std::vector<std::shared_ptr<Session>> sessions_;
};

}  // namespace harvest_core
