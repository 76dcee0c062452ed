#pragma once

#include <stdexcept>
#include <string>

namespace storygraph::util {

/*
  Central error types.

  NotFound and StructuralViolation are distinct so callers can render
  "missing" and "not allowed" differently. Corruption is never thrown;
  it is reported as a validation result.

  TransactionConflict means nothing was written and the whole operation
  may be retried.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StructuralViolation : public std::runtime_error {
 public:
  explicit StructuralViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace storygraph::util
