#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "harvest_core/db/database_manager.hpp"
#include "harvest_core/db/models/log_dto.hpp"
#include "harvest_core/db/models/queue_item_dto.hpp"
#include "harvest_core/db/models/task_dto.hpp"
#include "harvest_core/db/storage_error.hpp"
#include "harvest_core/errors.hpp"
#include "harvest_core/types/job_description.hpp"
#include "harvest_core/types/worker_event.hpp"

namespace harvest_core {

/**
 * @class TaskStore
 * @brief Durable storage for tasks, their logs and the job queue.
 *
 * Pure data access: every call is synchronous, borrows a pooled connection
 * for its duration and throws TaskStoreError on any SQLite failure. Business
 * rules (single flight, removal guards) live in Scheduler and WorkerBridge.
 */
class TaskStore {
 public:
  explicit TaskStore(DatabaseManager& db_manager);

  // ---- tasks ----
  long long create_task(const std::string& task_type,
                        const nlohmann::json& params,
                        const nlohmann::json& config_snapshot = nullptr);

  // completed_at is stamped for every status other than RUNNING. result_count
  // is only written when provided.
  void update_task(long long task_id,
                   TaskStatus status,
                   const std::optional<std::string>& error_message = std::nullopt,
                   std::optional<long long> result_count = std::nullopt);

  void add_log(long long task_id, const WorkerEvent& event);

  std::optional<TaskDTO> get_task(long long task_id);
  std::vector<LogDTO> get_task_logs(long long task_id);
  std::vector<TaskDTO> get_recent_tasks(int limit = 50);

  // Newest running task, or the newest task of any status.
  std::optional<TaskDTO> get_current_task();

  // Removes the task and its logs in one transaction.
  void delete_task(long long task_id);

  // Running tasks older than the threshold were abandoned by a previous
  // process; they become STOPPED with error "interrupted".
  int fix_stuck_tasks(std::chrono::seconds stale_threshold = std::chrono::minutes(10));

  // Deletes finished tasks (and their logs) started before now - horizon.
  int purge_history(std::chrono::hours horizon = std::chrono::hours(24 * 30));

  // ---- queue ----
  long long enqueue(const JobDescription& job, int priority = 0);
  std::optional<QueueItemDTO> next_pending();
  std::optional<QueueItemDTO> get_queue_item(long long queue_id);
  void set_queue_status(long long queue_id, QueueItemStatus status, const QueueUpdate& update = {});
  // Returns false when nothing was deleted (unknown id or a RUNNING item).
  bool remove_queue_item(long long queue_id);
  void set_priority(long long queue_id, int priority);
  int clear_terminal();
  std::vector<QueueItemDTO> list_queue_items(std::optional<QueueItemStatus> status = std::nullopt);
  QueueStats queue_stats();

  // Queue items left RUNNING by a crash go back to PENDING with their task cleared.
  int recover_orphaned_queue_items();

  // Millisecond precision, lexicographically ordered ("YYYY-MM-DD HH:MM:SS.mmm", UTC).
  static std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace harvest_core
