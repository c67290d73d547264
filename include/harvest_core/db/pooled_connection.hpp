#pragma once

#include <memory>
#include <stdexcept>

#include <sqlite_modern_cpp.h>

#include "harvest_core/db/database_manager.hpp"

namespace harvest_core {

// Borrows one connection for the lifetime of the guard. Blocks while every
// pooled connection is in use.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("Database connection pool returned no connection");
    }
  }

  ~PooledConnection() {
    manager_.return_connection(std::move(conn_));
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const {
    return *conn_;
  }
  sqlite::database* operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace harvest_core
