#pragma once

#include <string>

#include <sqlite_modern_cpp.h>

#include "harvest_core/errors.hpp"

namespace harvest_core {

// Coarse SQLite failure class carried by TaskStoreError for diagnostics.
enum class DbErrorKind { BusyOrLocked, Constraint, Io, NotADatabase, Generic };

inline std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::NotADatabase: return "notadb";
    case DbErrorKind::Generic: return "generic";
  }
  return "generic";
}

class TaskStoreError : public HarvestError {
 public:
  explicit TaskStoreError(const std::string& message, DbErrorKind db_kind = DbErrorKind::Generic)
      : HarvestError(ErrorKind::Storage, message), db_kind_(db_kind) {}

  DbErrorKind db_kind() const {
    return db_kind_;
  }

 private:
  DbErrorKind db_kind_;
};

// Wraps a sqlite_modern_cpp exception raised while running `operation`.
// A missing task behind a log or queue row shows up as Constraint; a wrong
// SQLCipher key as NotADatabase.
inline TaskStoreError storage_error(const std::string& operation,
                                    const sqlite::sqlite_exception& e) {
  DbErrorKind kind = DbErrorKind::Generic;
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      kind = DbErrorKind::BusyOrLocked;
      break;
    case SQLITE_CONSTRAINT:
      kind = DbErrorKind::Constraint;
      break;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      kind = DbErrorKind::Io;
      break;
    case SQLITE_NOTADB:
      kind = DbErrorKind::NotADatabase;
      break;
    default:
      break;
  }
  return TaskStoreError("TaskStore::" + operation + " failed (" + to_string(kind) + "): " +
                            e.what() + " [sql: " + e.get_sql() + "]",
                        kind);
}

}  // namespace harvest_core
