#pragma once

#include "cashgraph/v1.hpp"
#include "service_context.hpp"

namespace cashgraph::service {

/*
  Request/response boundary of the engine. Validates wire fields, converts
  timestamps and logs every call; transport-agnostic (the gRPC server and
  the tests both drive it).
*/
class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  cashgraph::v1::IngestResponse Ingest(const cashgraph::v1::IngestRequest& req);

  cashgraph::v1::ListPayoutsResponse ListPayouts(const cashgraph::v1::ListPayoutsRequest& req);

  cashgraph::v1::ListExceptionsResponse ListExceptions(const cashgraph::v1::ListExceptionsRequest& req);

  cashgraph::v1::GetProvenanceResponse GetProvenance(const cashgraph::v1::GetProvenanceRequest& req);

  cashgraph::v1::ListLedgerResponse ListLedger(const cashgraph::v1::ListLedgerRequest& req);

  cashgraph::v1::ResolveExceptionResponse ResolveException(const cashgraph::v1::ResolveExceptionRequest& req);

  cashgraph::v1::ConsolidateResponse Consolidate(const cashgraph::v1::ConsolidateRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace cashgraph::service
