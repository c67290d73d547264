#include "harvest_core/db/task_store.hpp"

#include <sqlite_modern_cpp.h>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "harvest_core/db/pooled_connection.hpp"
#include "harvest_core/db/transaction.hpp"

namespace harvest_core {

namespace {

const char* const kTaskColumns =
    "id, task_type, params, status, started_at, completed_at, error_message, result_count, config";
const char* const kQueueColumns =
    "id, task_config, priority, status, created_at, started_at, completed_at, task_id, "
    "error_message";
const char* const kStuckTaskMessage = "interrupted";

nlohmann::json parse_stored_json(const std::optional<std::string>& text) {
  if (!text) {
    return nullptr;
  }
  nlohmann::json parsed = nlohmann::json::parse(*text, nullptr, false);
  if (parsed.is_discarded()) {
    return *text;
  }
  return parsed;
}

std::optional<std::chrono::system_clock::time_point> optional_time(
    const std::optional<std::string>& text) {
  if (!text) {
    return std::nullopt;
  }
  return TaskStore::string_to_time_point(*text);
}

TaskDTO make_task(long long id, const std::string& task_type, const std::string& params,
                  const std::string& status, const std::string& started_at,
                  const std::optional<std::string>& completed_at,
                  const std::optional<std::string>& error_message, long long result_count,
                  const std::optional<std::string>& config) {
  TaskDTO task;
  task.id = id;
  task.task_type = task_type;
  task.params = parse_stored_json(params);
  task.status = task_status_from_string(status);
  task.started_at = TaskStore::string_to_time_point(started_at);
  task.completed_at = optional_time(completed_at);
  task.error_message = error_message;
  task.result_count = result_count;
  task.config = parse_stored_json(config);
  return task;
}

QueueItemDTO make_queue_item(long long id, const std::string& task_config, int priority,
                             const std::string& status, const std::string& created_at,
                             const std::optional<std::string>& started_at,
                             const std::optional<std::string>& completed_at,
                             std::optional<long long> task_id,
                             const std::optional<std::string>& error_message) {
  QueueItemDTO item;
  item.id = id;
  try {
    item.job = JobDescription::from_json(nlohmann::json::parse(task_config));
  } catch (const std::exception& e) {
    throw TaskStoreError("queue item " + std::to_string(id) + " has a corrupt task_config: " +
                         e.what());
  }
  item.priority = priority;
  item.status = queue_item_status_from_string(status);
  item.created_at = TaskStore::string_to_time_point(created_at);
  item.started_at = optional_time(started_at);
  item.completed_at = optional_time(completed_at);
  item.task_id = task_id;
  item.error_message = error_message;
  return item;
}

}  // namespace

TaskStore::TaskStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::string TaskStore::time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << millis;
  return ss.str();
}

std::chrono::system_clock::time_point TaskStore::string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm_struct));
  int millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    ss >> millis;
  }
  return tp + std::chrono::milliseconds(millis);
}

// ============================================================================
// Tasks
// ============================================================================

long long TaskStore::create_task(const std::string& task_type,
                                 const nlohmann::json& params,
                                 const nlohmann::json& config_snapshot) {
  try {
    PooledConnection conn(db_manager_);
    std::string started_at = time_point_to_string(std::chrono::system_clock::now());
    std::optional<std::string> config;
    if (!config_snapshot.is_null()) {
      config = config_snapshot.dump();
    }
    *conn << "INSERT INTO tasks (task_type, params, status, started_at, config) VALUES "
             "(?,?,?,?,?)"
          << task_type << params.dump() << to_string(TaskStatus::RUNNING) << started_at << config;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("create_task", e);
  }
}

void TaskStore::update_task(long long task_id,
                            TaskStatus status,
                            const std::optional<std::string>& error_message,
                            std::optional<long long> result_count) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<std::string> completed_at;
    if (status != TaskStatus::RUNNING) {
      completed_at = time_point_to_string(std::chrono::system_clock::now());
    }
    *conn << "UPDATE tasks SET status = ?, completed_at = ?, error_message = ?, "
             "result_count = COALESCE(?, result_count) WHERE id = ?"
          << to_string(status) << completed_at << error_message << result_count << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("update_task", e);
  }
}

void TaskStore::add_log(long long task_id, const WorkerEvent& event) {
  try {
    PooledConnection conn(db_manager_);
    std::string timestamp = time_point_to_string(std::chrono::system_clock::now());
    std::optional<std::string> metadata;
    nlohmann::json meta = event.metadata();
    if (!meta.is_null()) {
      metadata = meta.dump();
    }
    *conn << "INSERT INTO logs (task_id, type, level, message, timestamp, metadata) VALUES "
             "(?,?,?,?,?,?)"
          << task_id << to_string(event.type) << event.level << event.message << timestamp
          << metadata;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("add_log", e);
  }
}

std::optional<TaskDTO> TaskStore::get_task(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<TaskDTO> result;
    *conn << std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?" << task_id >>
        [&](long long id, std::string task_type, std::string params, std::string status,
            std::string started_at, std::optional<std::string> completed_at,
            std::optional<std::string> error_message, long long result_count,
            std::optional<std::string> config) {
          result = make_task(id, task_type, params, status, started_at, completed_at,
                             error_message, result_count, config);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("get_task", e);
  }
}

std::vector<LogDTO> TaskStore::get_task_logs(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<LogDTO> logs;
    *conn << "SELECT id, task_id, type, level, message, timestamp, metadata FROM logs "
             "WHERE task_id = ? ORDER BY timestamp ASC, id ASC"
          << task_id >>
        [&](long long id, long long owner_id, std::string type, std::optional<std::string> level,
            std::string message, std::string timestamp, std::optional<std::string> metadata) {
          LogDTO log;
          log.id = id;
          log.task_id = owner_id;
          log.type = type;
          log.level = level;
          log.message = message;
          log.timestamp = string_to_time_point(timestamp);
          log.metadata = parse_stored_json(metadata);
          logs.push_back(std::move(log));
        };
    return logs;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("get_task_logs", e);
  }
}

std::vector<TaskDTO> TaskStore::get_recent_tasks(int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<TaskDTO> tasks;
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM tasks ORDER BY started_at DESC, id DESC LIMIT ?"
          << limit >>
        [&](long long id, std::string task_type, std::string params, std::string status,
            std::string started_at, std::optional<std::string> completed_at,
            std::optional<std::string> error_message, long long result_count,
            std::optional<std::string> config) {
          tasks.push_back(make_task(id, task_type, params, status, started_at, completed_at,
                                    error_message, result_count, config));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("get_recent_tasks", e);
  }
}

std::optional<TaskDTO> TaskStore::get_current_task() {
  try {
    PooledConnection conn(db_manager_);
    std::optional<TaskDTO> result;
    auto collect = [&](long long id, std::string task_type, std::string params,
                       std::string status, std::string started_at,
                       std::optional<std::string> completed_at,
                       std::optional<std::string> error_message, long long result_count,
                       std::optional<std::string> config) {
      result = make_task(id, task_type, params, status, started_at, completed_at, error_message,
                         result_count, config);
    };
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM tasks WHERE status = ? ORDER BY started_at DESC, id DESC LIMIT 1"
          << to_string(TaskStatus::RUNNING) >>
        collect;
    if (!result) {
      *conn << std::string("SELECT ") + kTaskColumns +
                   " FROM tasks ORDER BY started_at DESC, id DESC LIMIT 1" >>
          collect;
    }
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("get_current_task", e);
  }
}

void TaskStore::delete_task(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    *conn << "DELETE FROM logs WHERE task_id = ?" << task_id;
    *conn << "DELETE FROM tasks WHERE id = ?" << task_id;
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("delete_task", e);
  }
}

int TaskStore::fix_stuck_tasks(std::chrono::seconds stale_threshold) {
  try {
    PooledConnection conn(db_manager_);
    auto now = std::chrono::system_clock::now();
    std::string now_str = time_point_to_string(now);
    std::string cutoff_str = time_point_to_string(now - stale_threshold);
    *conn << "UPDATE tasks SET status = ?, completed_at = ?, error_message = ? "
             "WHERE status = ? AND started_at < ?"
          << to_string(TaskStatus::STOPPED) << now_str << std::string(kStuckTaskMessage)
          << to_string(TaskStatus::RUNNING) << cutoff_str;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("fix_stuck_tasks", e);
  }
}

int TaskStore::purge_history(std::chrono::hours horizon) {
  int removed = 0;
  try {
    PooledConnection conn(db_manager_);
    std::string cutoff_str = time_point_to_string(std::chrono::system_clock::now() - horizon);
    std::string running = to_string(TaskStatus::RUNNING);
    {
      WriteTransaction tx(*conn);
      *conn << "DELETE FROM logs WHERE task_id IN "
               "(SELECT id FROM tasks WHERE started_at < ? AND status != ?)"
            << cutoff_str << running;
      *conn << "DELETE FROM tasks WHERE started_at < ? AND status != ?" << cutoff_str << running;
      removed = conn->rows_modified();
      tx.commit();
    }
    // VACUUM cannot run inside a transaction.
    if (removed > 0) {
      *conn << "VACUUM;";
    }
    return removed;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("purge_history", e);
  }
}

// ============================================================================
// Queue
// ============================================================================

long long TaskStore::enqueue(const JobDescription& job, int priority) {
  try {
    PooledConnection conn(db_manager_);
    std::string created_at = time_point_to_string(std::chrono::system_clock::now());
    *conn << "INSERT INTO task_queue (task_config, priority, status, created_at) VALUES "
             "(?,?,?,?)"
          << job.to_json().dump() << priority << to_string(QueueItemStatus::PENDING)
          << created_at;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("enqueue", e);
  }
}

std::optional<QueueItemDTO> TaskStore::next_pending() {
  try {
    PooledConnection conn(db_manager_);
    std::optional<QueueItemDTO> result;
    *conn << std::string("SELECT ") + kQueueColumns +
                 " FROM task_queue WHERE status = ? "
                 "ORDER BY priority DESC, created_at ASC, id ASC LIMIT 1"
          << to_string(QueueItemStatus::PENDING) >>
        [&](long long id, std::string task_config, int priority, std::string status,
            std::string created_at, std::optional<std::string> started_at,
            std::optional<std::string> completed_at, std::optional<long long> task_id,
            std::optional<std::string> error_message) {
          result = make_queue_item(id, task_config, priority, status, created_at, started_at,
                                   completed_at, task_id, error_message);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("next_pending", e);
  }
}

std::optional<QueueItemDTO> TaskStore::get_queue_item(long long queue_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<QueueItemDTO> result;
    *conn << std::string("SELECT ") + kQueueColumns + " FROM task_queue WHERE id = ?"
          << queue_id >>
        [&](long long id, std::string task_config, int priority, std::string status,
            std::string created_at, std::optional<std::string> started_at,
            std::optional<std::string> completed_at, std::optional<long long> task_id,
            std::optional<std::string> error_message) {
          result = make_queue_item(id, task_config, priority, status, created_at, started_at,
                                   completed_at, task_id, error_message);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("get_queue_item", e);
  }
}

void TaskStore::set_queue_status(long long queue_id,
                                 QueueItemStatus status,
                                 const QueueUpdate& update) {
  try {
    PooledConnection conn(db_manager_);
    std::string now_str = time_point_to_string(std::chrono::system_clock::now());

    std::string sql = "UPDATE task_queue SET status = ?";
    if (status == QueueItemStatus::RUNNING) {
      // Re-marking a running item (to bind its task) keeps the original start time.
      sql += ", started_at = CASE WHEN status = 'running' THEN started_at ELSE ? END";
    } else if (status == QueueItemStatus::COMPLETED || status == QueueItemStatus::FAILED) {
      sql += ", completed_at = ?";
    } else {
      sql += ", started_at = NULL, completed_at = NULL";
    }
    if (update.clear_task) {
      sql += ", task_id = NULL, error_message = NULL";
    } else {
      if (update.task_id) {
        sql += ", task_id = ?";
      }
      if (update.error_message) {
        sql += ", error_message = ?";
      }
    }
    sql += " WHERE id = ?";

    auto stmt = (*conn << sql);
    stmt << to_string(status);
    if (status != QueueItemStatus::PENDING) {
      stmt << now_str;
    }
    if (!update.clear_task) {
      if (update.task_id) {
        stmt << *update.task_id;
      }
      if (update.error_message) {
        stmt << *update.error_message;
      }
    }
    stmt << queue_id;
    stmt.execute();
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("set_queue_status", e);
  }
}

bool TaskStore::remove_queue_item(long long queue_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM task_queue WHERE id = ? AND status != ?" << queue_id
          << to_string(QueueItemStatus::RUNNING);
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("remove_queue_item", e);
  }
}

void TaskStore::set_priority(long long queue_id, int priority) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE task_queue SET priority = ? WHERE id = ?" << priority << queue_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("set_priority", e);
  }
}

int TaskStore::clear_terminal() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM task_queue WHERE status IN (?, ?)"
          << to_string(QueueItemStatus::COMPLETED) << to_string(QueueItemStatus::FAILED);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("clear_terminal", e);
  }
}

std::vector<QueueItemDTO> TaskStore::list_queue_items(std::optional<QueueItemStatus> status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<QueueItemDTO> items;
    auto collect = [&](long long id, std::string task_config, int priority, std::string row_status,
                       std::string created_at, std::optional<std::string> started_at,
                       std::optional<std::string> completed_at, std::optional<long long> task_id,
                       std::optional<std::string> error_message) {
      items.push_back(make_queue_item(id, task_config, priority, row_status, created_at,
                                      started_at, completed_at, task_id, error_message));
    };
    const std::string order = " ORDER BY priority DESC, created_at ASC, id ASC";
    if (status) {
      *conn << std::string("SELECT ") + kQueueColumns + " FROM task_queue WHERE status = ?" +
                   order
            << to_string(*status) >>
          collect;
    } else {
      *conn << std::string("SELECT ") + kQueueColumns + " FROM task_queue" + order >> collect;
    }
    return items;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("list_queue_items", e);
  }
}

QueueStats TaskStore::queue_stats() {
  try {
    PooledConnection conn(db_manager_);
    QueueStats stats;
    *conn << "SELECT status, COUNT(*) FROM task_queue GROUP BY status" >>
        [&](std::string status, long long count) {
          switch (queue_item_status_from_string(status)) {
            case QueueItemStatus::PENDING: stats.pending = count; break;
            case QueueItemStatus::RUNNING: stats.running = count; break;
            case QueueItemStatus::COMPLETED: stats.completed = count; break;
            case QueueItemStatus::FAILED: stats.failed = count; break;
          }
          stats.total += count;
        };
    return stats;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("queue_stats", e);
  }
}

int TaskStore::recover_orphaned_queue_items() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE task_queue SET status = ?, started_at = NULL, task_id = NULL, "
             "error_message = NULL WHERE status = ?"
          << to_string(QueueItemStatus::PENDING) << to_string(QueueItemStatus::RUNNING);
    int recovered = conn->rows_modified();
    if (recovered > 0) {
      std::cout << "TaskStore: returned " << recovered << " orphaned queue item(s) to pending"
                << std::endl;
    }
    return recovered;
  } catch (const sqlite::sqlite_exception& e) {
    throw storage_error("recover_orphaned_queue_items", e);
  }
}

}  // namespace harvest_core
