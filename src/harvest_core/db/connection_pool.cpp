#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "harvest_core/db/connection_pool.hpp"

#include <stdexcept>

namespace harvest_core {

namespace {
constexpr int kBusyTimeoutMs = 5000;
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string& db_path,
                                                                  const std::string& db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native handle for " + db_path);
  }

  if (!db_key.empty() &&
      sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.size())) != SQLITE_OK) {
    throw std::runtime_error("Failed to key database " + db_path + ": " +
                             std::string(sqlite3_errmsg(handle)));
  }

  // First read after keying; a wrong key fails here with "file is not a database".
  *db << "SELECT count(*) FROM sqlite_master;";

  sqlite3_busy_timeout(handle, kBusyTimeoutMs);
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("ConnectionPool requires at least one connection.");
  }
  idle_.reserve(static_cast<std::size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_connection(db_path_, db_key_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_cv_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw std::runtime_error("Connection pool for " + db_path_ + " is shut down");
  }
  auto conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::release(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  available_cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.clear();
  }
  available_cv_.notify_all();
}

std::size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace harvest_core
