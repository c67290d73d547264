#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite_modern_cpp.h>

namespace harvest_core {

/**
 * @class ConnectionPool
 * @brief Fixed set of open SQLite connections shared by the scheduler loop,
 * the bridge supervisor threads and the HTTP handlers.
 *
 * Every connection is keyed (when a key is given), has foreign keys enabled,
 * runs in WAL mode and waits on busy locks instead of failing at once.
 */
class ConnectionPool {
 public:
  // An empty db_key opens plain (unencrypted) connections.
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  // Blocks until a connection is free. Throws std::runtime_error after shutdown().
  std::unique_ptr<sqlite::database> acquire();

  // Connections handed back after shutdown() are closed instead of pooled.
  void release(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  // Connections currently idle in the pool.
  std::size_t available() const;

  static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path,
                                                           const std::string& db_key);

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

 private:
  std::string db_path_;
  std::string db_key_;

  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  bool closed_ = false;
};

}  // namespace harvest_core
