#include "utilities_test.hpp"

#include <atomic>
#include <thread>
#include <unistd.h>

#include "harvest_core/db/pooled_connection.hpp"

namespace harvest_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  static std::atomic<int> counter{0};
  auto temp_dir = std::filesystem::temp_directory_path() / "harvest_tests";
  std::filesystem::create_directories(temp_dir);

  // Generate unique filename using pid, timestamp and a counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  return temp_dir / ("test_" + std::to_string(getpid()) + "_" + std::to_string(timestamp) + "_" +
                     std::to_string(counter++) + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  for (const std::string suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(db_path.string() + suffix, ec);
  }

  // Also cleanup the parent directory if it's empty
  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

harvest_core::JobDescription TestUtilities::create_test_job(const std::string& kind,
                                                            const nlohmann::json& params,
                                                            const nlohmann::json& config) {
  harvest_core::JobDescription job;
  job.kind = kind;
  job.params = params;
  job.config = config;
  return job;
}

harvest_core::WorkerCommand TestUtilities::shell_worker(
    const std::string& script, std::chrono::milliseconds stop_grace_period) {
  harvest_core::WorkerCommand command;
  command.executable = "/bin/sh";
  command.args = {"-c", script, "worker"};
  command.validation_timeout = std::chrono::seconds(5);
  command.stop_grace_period = stop_grace_period;
  return command;
}

void TestUtilities::set_task_started_at(harvest_core::DatabaseManager& db,
                                        long long task_id,
                                        std::chrono::system_clock::time_point started_at) {
  harvest_core::PooledConnection conn(db);
  *conn << "UPDATE tasks SET started_at = ? WHERE id = ?"
        << harvest_core::TaskStore::time_point_to_string(started_at) << task_id;
}

void TestUtilities::set_queue_created_at(harvest_core::DatabaseManager& db,
                                         long long queue_id,
                                         std::chrono::system_clock::time_point created_at) {
  harvest_core::PooledConnection conn(db);
  *conn << "UPDATE task_queue SET created_at = ? WHERE id = ?"
        << harvest_core::TaskStore::time_point_to_string(created_at) << queue_id;
}

void TestUtilities::force_queue_status(harvest_core::DatabaseManager& db,
                                       long long queue_id,
                                       const std::string& status) {
  harvest_core::PooledConnection conn(db);
  *conn << "UPDATE task_queue SET status = ? WHERE id = ?" << status << queue_id;
}

bool TestUtilities::wait_for(const std::function<bool()>& condition,
                             std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

}  // namespace harvest_tests
