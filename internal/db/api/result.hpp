#pragma once

#include <string>

namespace storygraph::db {

/*
  Outcome of a single repository call.

  SQLite and pqxx failures are translated into these codes inside the
  backend; graph, branch and lifecycle code only sees ErrorCode.
  Busy and SerializationFailure mean the transaction lost a race and the
  operation can be retried from the start.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace storygraph::db
