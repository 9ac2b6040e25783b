#pragma once

#include <stdexcept>
#include <string>

namespace cashgraph::util {

// Failures the engine reports to callers. The RPC layer maps each kind to a
// status code; anything not derived from Error is an internal failure.
class Error : public std::runtime_error {
 public:
  enum class Kind { NotFound, AlreadyExists, InvalidState, InvalidArgument, TransactionConflict };

  Error(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

// Unknown exception, identity or provenance root.
class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(Kind::NotFound, msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(Kind::AlreadyExists, msg) {
  }
};

// The record exists but cannot move that way, e.g. resolving a resolved exception.
class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(Kind::InvalidState, msg) {
  }
};

// Malformed request or raw event; rejected per record at ingestion.
class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error(Kind::InvalidArgument, msg) {
  }
};

// A concurrent unit of work committed first; this one may be replayed.
class TransactionConflict : public Error {
 public:
  explicit TransactionConflict(const std::string& msg) : Error(Kind::TransactionConflict, msg) {
  }
};

} // namespace cashgraph::util
