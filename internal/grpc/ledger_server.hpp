#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "cashgraph/services/v1/ledger_service.grpc.pb.h"
#include "internal/service/ledger_service.hpp"

namespace cashgraph::grpc {

class LedgerServer final : public cashgraph::services::v1::LedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<cashgraph::service::LedgerService> svc);

  ::grpc::Status Ingest(::grpc::ServerContext*,
                      const cashgraph::services::v1::IngestRequest*,
                      cashgraph::services::v1::IngestResponse*) override;

  ::grpc::Status ListPayouts(::grpc::ServerContext*,
                           const cashgraph::services::v1::ListPayoutsRequest*,
                           cashgraph::services::v1::ListPayoutsResponse*) override;

  ::grpc::Status ListExceptions(::grpc::ServerContext*,
                              const cashgraph::services::v1::ListExceptionsRequest*,
                              cashgraph::services::v1::ListExceptionsResponse*) override;

  ::grpc::Status GetProvenance(::grpc::ServerContext*,
                             const cashgraph::services::v1::GetProvenanceRequest*,
                             cashgraph::services::v1::GetProvenanceResponse*) override;

  ::grpc::Status ListLedger(::grpc::ServerContext*,
                          const cashgraph::services::v1::ListLedgerRequest*,
                          cashgraph::services::v1::ListLedgerResponse*) override;

  ::grpc::Status ResolveException(::grpc::ServerContext*,
                                const cashgraph::services::v1::ResolveExceptionRequest*,
                                cashgraph::services::v1::ResolveExceptionResponse*) override;

  ::grpc::Status Consolidate(::grpc::ServerContext*,
                           const cashgraph::services::v1::ConsolidateRequest*,
                           cashgraph::services::v1::ConsolidateResponse*) override;

private:
  std::shared_ptr<cashgraph::service::LedgerService> service_;
};

} // namespace cashgraph::grpc
