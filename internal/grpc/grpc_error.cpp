#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cashgraph::grpc {

namespace {

::grpc::StatusCode CodeFor(util::Error::Kind kind) {
  switch (kind) {
    case util::Error::Kind::InvalidArgument:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case util::Error::Kind::NotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case util::Error::Kind::AlreadyExists:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case util::Error::Kind::InvalidState:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case util::Error::Kind::TransactionConflict:
      return ::grpc::StatusCode::ABORTED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::Error*>(&e)) {
    return {CodeFor(error->kind()), e.what()};
  }

  CASHGRAPH_LOG_ERROR("ledger call failed", {observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace cashgraph::grpc
