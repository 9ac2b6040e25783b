#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace cashgraph::db {

// Translates a failed repository Result into the typed util:: exceptions.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + (result.message.empty() ? ErrorCodeName(result.code) : result.message);
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace cashgraph::db
