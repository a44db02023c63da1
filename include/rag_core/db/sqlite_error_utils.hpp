#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include "rag_core/errors.hpp"

namespace rag_core {

// What a failed statement means for the corpus store
enum class DbFailure {
  // Another connection holds the write lock
  Busy,
  // A unique key or the single-active-version index rejected the row
  Duplicate,
  Storage
};

inline DbFailure classify_db_failure(const sqlite::sqlite_exception& e) {
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbFailure::Busy;
    case SQLITE_CONSTRAINT:
      return DbFailure::Duplicate;
    default:
      return DbFailure::Storage;
  }
}

// "<operation> failed: <message> (database busy) [code=.., xcode=..]"
inline std::string describe_db_failure(const std::string& operation,
                                       const sqlite::sqlite_exception& e) {
  std::string msg = operation + " failed: " + e.errstr();
  switch (classify_db_failure(e)) {
    case DbFailure::Busy:
      msg += " (database busy)";
      break;
    case DbFailure::Duplicate:
      msg += " (duplicate key)";
      break;
    case DbFailure::Storage:
      break;
  }
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

// Writing artifacts, switching the active version and taking the publish lock
inline IndexPublishError publish_failure(const std::string& operation,
                                         const sqlite::sqlite_exception& e) {
  return IndexPublishError(describe_db_failure(operation, e));
}

// Reads and run bookkeeping
inline RepositoryError repository_failure(const std::string& operation,
                                          const sqlite::sqlite_exception& e) {
  return RepositoryError(describe_db_failure(operation, e));
}

}  // namespace rag_core
