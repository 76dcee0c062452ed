#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace storygraph::db {

// Maps a failed repository Result onto the central error types.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace storygraph::db
