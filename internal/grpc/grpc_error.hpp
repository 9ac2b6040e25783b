#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace cashgraph::grpc {

// Status for a failed ledger call. Unclassified exceptions become INTERNAL
// and are logged, since the caller only sees the message.
::grpc::Status ToStatus(const std::exception& e);

} // namespace cashgraph::grpc
