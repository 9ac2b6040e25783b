#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "cashgraph/v1.hpp"
#include "internal/core/reconciliation_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace cashgraph::v1;
using cashgraph::testing::Date;
namespace t = cashgraph::testing;

cashgraph::grpc::LedgerServer BuildServer() {
  cashgraph::service::ServiceContext ctx;
  ctx.engine = std::make_shared<cashgraph::core::ReconciliationEngine>(std::make_shared<cashgraph::db::memory::MemoryRepository>(),
                                                                       cashgraph::matching::MatchingConfig{});
  return cashgraph::grpc::LedgerServer(std::make_shared<cashgraph::service::LedgerService>(ctx));
}

void TestResolveWithoutEdgesOrNoteReturnsInvalidArgument() {
  auto server = BuildServer();

  ResolveExceptionRequest  req;
  ResolveExceptionResponse resp;
  req.set_exception_id("exception-id");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ResolveException(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestProvenanceOfMissingIdentityReturnsNotFound() {
  auto server = BuildServer();

  GetProvenanceRequest  req;
  GetProvenanceResponse resp;
  req.set_identity_id("missing-identity");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetProvenance(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestResolvingTwiceReturnsFailedPrecondition() {
  auto server = BuildServer();

  IngestRequest ingest;
  *ingest.add_events() = t::Payout("po_1", Date(2024, 3, 1), 95000, Date(2024, 3, 4));
  *ingest.add_events() = t::BankTxn("b-1", Date(2024, 3, 3), 95000, "ACME");
  *ingest.add_events() = t::BankTxn("b-2", Date(2024, 3, 5), 95000, "GLOBEX");
  IngestResponse ingested;
  ::grpc::ServerContext ingest_ctx;
  assert(server.Ingest(&ingest_ctx, &ingest, &ingested).ok());
  assert(ingested.stored() == 3);

  ConsolidateRequest consolidate;
  consolidate.set_tenant_id(t::kTenant);
  *consolidate.mutable_as_of() = cashgraph::util::MillisToProto(Date(2024, 3, 6));
  ConsolidateResponse consolidated;
  ::grpc::ServerContext consolidate_ctx;
  assert(server.Consolidate(&consolidate_ctx, &consolidate, &consolidated).ok());
  assert(consolidated.exceptions_size() == 1);

  ResolveExceptionRequest req;
  req.set_exception_id(consolidated.exceptions(0).id());
  req.set_note("not ours");

  ResolveExceptionResponse first;
  ::grpc::ServerContext    first_ctx;
  assert(server.ResolveException(&first_ctx, &req, &first).ok());

  ResolveExceptionResponse second;
  ::grpc::ServerContext    second_ctx;
  const auto               status = server.ResolveException(&second_ctx, &req, &second);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestErrorMapping() {
  using cashgraph::grpc::ToStatus;

  assert(ToStatus(cashgraph::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(cashgraph::util::TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(cashgraph::util::NotFound("gone")).error_message() == "gone");
}

} // namespace

int main() {
  TestResolveWithoutEdgesOrNoteReturnsInvalidArgument();
  TestProvenanceOfMissingIdentityReturnsNotFound();
  TestResolvingTwiceReturnsFailedPrecondition();
  TestErrorMapping();

  std::cout << "cashgraph_unit_grpc_status: pass\n";
  return 0;
}
