#pragma once

#include <string>

namespace cashgraph::db {

// Outcome of one repository call. Backends translate their own failures
// (sqlite return codes, pqxx exceptions) into these; ThrowIfDbError lifts
// them into util:: exceptions for the engine.
enum class ErrorCode {
  OK = 0,

  // lookups by id or natural key
  NotFound,
  // unique natural key, fingerprint, link or ledger row already present
  AlreadyExists,

  // lost a write race; the unit of work may be replayed
  Busy,
  SerializationFailure,

  // foreign key or check constraint, e.g. an edge to an unknown identity
  ConstraintViolation,

  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace cashgraph::db
