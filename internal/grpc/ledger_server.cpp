#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace cashgraph::grpc {

using namespace cashgraph::services::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

LedgerServer::LedgerServer(std::shared_ptr<cashgraph::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::Ingest(::grpc::ServerContext*, const IngestRequest* req, IngestResponse* resp) {
  return Handle([&] { *resp = service_->Ingest(*req); });
}

::grpc::Status LedgerServer::ListPayouts(::grpc::ServerContext*, const ListPayoutsRequest* req, ListPayoutsResponse* resp) {
  return Handle([&] { *resp = service_->ListPayouts(*req); });
}

::grpc::Status LedgerServer::ListExceptions(::grpc::ServerContext*, const ListExceptionsRequest* req, ListExceptionsResponse* resp) {
  return Handle([&] { *resp = service_->ListExceptions(*req); });
}

::grpc::Status LedgerServer::GetProvenance(::grpc::ServerContext*, const GetProvenanceRequest* req, GetProvenanceResponse* resp) {
  return Handle([&] { *resp = service_->GetProvenance(*req); });
}

::grpc::Status LedgerServer::ListLedger(::grpc::ServerContext*, const ListLedgerRequest* req, ListLedgerResponse* resp) {
  return Handle([&] { *resp = service_->ListLedger(*req); });
}

::grpc::Status LedgerServer::ResolveException(::grpc::ServerContext*, const ResolveExceptionRequest* req, ResolveExceptionResponse* resp) {
  return Handle([&] { *resp = service_->ResolveException(*req); });
}

::grpc::Status LedgerServer::Consolidate(::grpc::ServerContext*, const ConsolidateRequest* req, ConsolidateResponse* resp) {
  return Handle([&] { *resp = service_->Consolidate(*req); });
}

} // namespace cashgraph::grpc
