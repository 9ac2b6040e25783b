#include "ledger_service.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

#include "internal/core/reconciliation_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cashgraph::service {

using namespace cashgraph::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      CASHGRAPH_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      CASHGRAPH_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    CASHGRAPH_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                       observability::StringField("error", ex.what()), observability::DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

int64_t MillisOrZero(bool present, const google::protobuf::Timestamp& ts) {
  return present ? util::ProtoToMillis(ts) : 0;
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IngestResponse LedgerService::Ingest(const IngestRequest& req) {
  return ObserveRpc("LedgerService.Ingest", "", [&] { return ctx_.engine->Ingest(req.events()); });
}

ListPayoutsResponse LedgerService::ListPayouts(const ListPayoutsRequest& req) {
  return ObserveRpc("LedgerService.ListPayouts", req.tenant_id(), [&] {
    ListPayoutsResponse resp;
    for (auto& view : ctx_.engine->ListPayouts(req.tenant_id(), MillisOrZero(req.has_from(), req.from()), MillisOrZero(req.has_to(), req.to()))) {
      *resp.add_payouts() = std::move(view);
    }
    return resp;
  });
}

ListExceptionsResponse LedgerService::ListExceptions(const ListExceptionsRequest& req) {
  return ObserveRpc("LedgerService.ListExceptions", req.tenant_id(), [&] {
    ListExceptionsResponse resp;
    for (auto& exception : ctx_.engine->ListExceptions(req.tenant_id(), req.kind(), req.status())) {
      *resp.add_exceptions() = std::move(exception);
    }
    return resp;
  });
}

GetProvenanceResponse LedgerService::GetProvenance(const GetProvenanceRequest& req) {
  return ObserveRpc("LedgerService.GetProvenance", req.identity_id(), [&] { return ctx_.engine->GetProvenance(req.identity_id(), req.max_depth()); });
}

ListLedgerResponse LedgerService::ListLedger(const ListLedgerRequest& req) {
  return ObserveRpc("LedgerService.ListLedger", req.tenant_id(), [&] {
    ListLedgerResponse resp;
    for (auto& entry : ctx_.engine->ListLedger(req.tenant_id(), MillisOrZero(req.has_from(), req.from()), MillisOrZero(req.has_to(), req.to()))) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

ResolveExceptionResponse LedgerService::ResolveException(const ResolveExceptionRequest& req) {
  return ObserveRpc("LedgerService.ResolveException", req.exception_id(), [&] {
    if (req.edges_size() == 0 && req.note().empty()) {
      throw util::InvalidArgument("resolve exception: provide chosen edges or a note explaining the dismissal");
    }
    const std::vector<ChosenEdge> edges(req.edges().begin(), req.edges().end());
    return ctx_.engine->ResolveException(req.exception_id(), edges, req.note());
  });
}

ConsolidateResponse LedgerService::Consolidate(const ConsolidateRequest& req) {
  return ObserveRpc("LedgerService.Consolidate", req.tenant_id(), [&] {
    const auto since = MillisOrZero(req.has_since(), req.since());
    if (since < 0) throw util::InvalidArgument("consolidate: since must not precede the epoch");

    std::optional<int64_t> as_of;
    if (req.has_as_of()) as_of = util::ProtoToMillis(req.as_of());
    return ctx_.engine->Consolidate(req.tenant_id(), static_cast<uint64_t>(since), as_of);
  });
}

} // namespace cashgraph::service
