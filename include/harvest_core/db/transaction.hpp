#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace harvest_core {

/**
 * @class WriteTransaction
 * @brief BEGIN IMMEDIATE scope on a pooled connection.
 *
 * The write lock is taken up front so a multi-statement delete cannot fail
 * half way with SQLITE_BUSY. Anything not committed is rolled back when the
 * guard leaves scope, including when a statement threw.
 */
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database& db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
  }

  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  ~WriteTransaction() {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "TaskStore: rollback failed: " << e.what() << std::endl;
    }
  }

  void commit() {
    db_ << "COMMIT;";
    committed_ = true;
  }

 private:
  sqlite::database& db_;
  bool committed_ = false;
};

}  // namespace harvest_core
