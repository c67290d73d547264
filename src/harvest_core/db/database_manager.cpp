#include "harvest_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace harvest_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema setup runs once on a private connection before the pool exists.
  setup_schema(db_path, db_key);

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
  std::cout << "DatabaseManager: opened " << db_path << " with " << pool_size
            << " pooled connections" << (db_key.empty() ? " (unencrypted)" : "") << std::endl;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->acquire();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->release(std::move(conn));
}

std::size_t DatabaseManager::available_connections() const {
  return is_initialized_ ? pool_->available() : 0;
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  auto db_ptr = ConnectionPool::open_connection(db_path.string(), db_key);
  sqlite::database& db = *db_ptr;

  db << R"(
      CREATE TABLE IF NOT EXISTS tasks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_type TEXT NOT NULL,
          params TEXT NOT NULL,
          status TEXT NOT NULL,
          started_at TEXT NOT NULL,
          completed_at TEXT,
          error_message TEXT,
          result_count INTEGER DEFAULT 0,
          config TEXT
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS logs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_id INTEGER NOT NULL,
          type TEXT NOT NULL,
          level TEXT,
          message TEXT NOT NULL,
          timestamp TEXT NOT NULL,
          metadata TEXT,
          FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_queue (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_config TEXT NOT NULL,
          priority INTEGER DEFAULT 0,
          status TEXT NOT NULL DEFAULT 'pending',
          created_at TEXT NOT NULL,
          started_at TEXT,
          completed_at TEXT,
          task_id INTEGER,
          error_message TEXT,
          FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE SET NULL
      )
    )";

  db << "CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status)";
  db << "CREATE INDEX IF NOT EXISTS idx_tasks_started_at ON tasks(started_at)";
  db << "CREATE INDEX IF NOT EXISTS idx_logs_task_id ON logs(task_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_logs_timestamp ON logs(timestamp)";
  db << "CREATE INDEX IF NOT EXISTS idx_queue_status ON task_queue(status)";
  db << "CREATE INDEX IF NOT EXISTS idx_queue_priority ON task_queue(priority DESC, created_at ASC)";
}

}  // namespace harvest_core
