#pragma once

#include <string>

namespace audit::db {

/*
  Outcome of a repository write.

  Backends map their native errors (sqlite3 extended codes, SQLSTATE) onto
  ErrorCode; the store layer turns codes into typed exceptions. Nothing above
  db/ sees sqlite or pqxx error types.
*/
enum class ErrorCode {
  OK = 0,

  // row-level outcomes the store reports to callers
  NotFound,
  AlreadyExists,
  ForeignKeyViolation, // parent_event_id does not resolve
  RestrictViolation,   // event still has children
  LegalHold,
  PartitionMissing,    // no partition covers the event timestamp
  ConstraintViolation,

  // backend trouble; the gateway queues the event for replay
  Busy,
  SerializationFailure,
  Unavailable,
  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool Is(ErrorCode c) const {
    return code == c;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace audit::db
