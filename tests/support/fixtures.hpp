#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cashgraph/v1.hpp"
#include "internal/core/record_convert.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/exceptions/exception_manager.hpp"
#include "internal/graph/identity_graph.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/matching/matcher.hpp"
#include "internal/matching/matching_config.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cashgraph::testing {

inline constexpr const char* kTenant = "tenant-a";

// Epoch milliseconds of a UTC calendar date at `hour`:00.
inline int64_t Date(int y, unsigned m, unsigned d, int hour = 12) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const int64_t  days = era * 146097 + static_cast<int64_t>(doe) - 719468;
  return days * util::kMillisPerDay + hour * util::kMillisPerHour;
}

inline cashgraph::v1::RawEvent Base(const std::string& source, cashgraph::v1::EventKind kind, const std::string& external_id, int64_t occurred_ms,
                                    int64_t amount_minor) {
  cashgraph::v1::RawEvent event;
  event.set_tenant_id(kTenant);
  event.set_source(source);
  event.set_kind(kind);
  event.set_external_id(external_id);
  *event.mutable_occurred_at() = util::MillisToProto(occurred_ms);
  event.mutable_amount()->set_amount_minor(amount_minor);
  event.mutable_amount()->set_currency("USD");
  return event;
}

inline cashgraph::v1::RawEvent BankTxn(const std::string& external_id, int64_t occurred_ms, int64_t amount_minor, const std::string& counterparty,
                                       const std::string& source = "PLAID", const std::string& account = "acct-checking") {
  auto event = Base(source, cashgraph::v1::EVENT_KIND_BANK_TXN, external_id, occurred_ms, amount_minor);
  event.set_account_ref(account);
  event.set_counterparty(counterparty);
  event.mutable_payload()->mutable_bank()->set_pending(false);
  return event;
}

inline cashgraph::v1::RawEvent Payout(const std::string& payout_id, int64_t occurred_ms, int64_t net_minor, int64_t arrival_ms,
                                      int64_t gross_minor = 0, const std::string& provider = "stripe") {
  auto event   = Base("STRIPE", cashgraph::v1::EVENT_KIND_PAYOUT, payout_id, occurred_ms, net_minor);
  auto* detail = event.mutable_payload()->mutable_payout();
  detail->set_provider(provider);
  *detail->mutable_arrival_date() = util::MillisToProto(arrival_ms);
  detail->set_gross_amount_minor(gross_minor);
  detail->set_status("in_transit");
  return event;
}

inline cashgraph::v1::RawEvent BalanceTxn(const std::string& external_id, const std::string& sub_type, int64_t occurred_ms, int64_t amount_minor,
                                          const std::string& payout_id = "", const std::string& provider = "stripe") {
  auto event   = Base("STRIPE", cashgraph::v1::EVENT_KIND_BALANCE_TXN, external_id, occurred_ms, amount_minor);
  auto* detail = event.mutable_payload()->mutable_balance();
  detail->set_sub_type(sub_type);
  detail->set_provider(provider);
  detail->set_source_payout_id(payout_id);
  return event;
}

inline cashgraph::v1::RawEvent OpsPayment(const std::string& external_id, int64_t occurred_ms, int64_t amount_minor, const std::string& status,
                                          const std::string& customer, const std::string& charge_reference = "",
                                          const std::string& invoice_reference = "") {
  auto event   = Base("JOBBER", cashgraph::v1::EVENT_KIND_OPS_PAYMENT, external_id, occurred_ms, amount_minor);
  auto* detail = event.mutable_payload()->mutable_ops();
  detail->set_provider("jobber");
  detail->set_status(status);
  detail->set_customer_name(customer);
  detail->set_charge_reference(charge_reference);
  detail->set_invoice_reference(invoice_reference);
  return event;
}

inline cashgraph::v1::RawEvent OpsInvoice(const std::string& external_id, int64_t occurred_ms, int64_t amount_minor, const std::string& status,
                                          const std::string& customer) {
  auto event   = Base("JOBBER", cashgraph::v1::EVENT_KIND_OPS_INVOICE, external_id, occurred_ms, amount_minor);
  auto* detail = event.mutable_payload()->mutable_ops();
  detail->set_provider("jobber");
  detail->set_status(status);
  detail->set_customer_name(customer);
  return event;
}

/*
  In-memory graph with the collaborators a matcher needs. Seed() runs the
  ingestion write path for one event; Run() executes a matcher in its own
  transaction.
*/
struct GraphHarness {
  std::shared_ptr<db::memory::MemoryRepository>  repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<graph::IdentityGraph>          graph      = std::make_shared<graph::IdentityGraph>(repository);
  std::shared_ptr<exceptions::ExceptionManager>  exceptions = std::make_shared<exceptions::ExceptionManager>(repository, graph);
  identity::IdentityResolver                     resolver{repository};
  matching::MatchingConfig                       config;

  db::model::IdentityRecord Seed(const cashgraph::v1::RawEvent& event) {
    auto record           = core::ToRecord(event);
    record.id             = util::NewId();
    record.ingested_at_ms = util::NowMillis();

    auto tx = repository->Begin();
    db::ThrowIfDbError(repository->InsertRawEvent(*tx, record), "seed raw event");
    auto resolution = resolver.Resolve(*tx, record, event.payload(), record.ingested_at_ms);
    tx->Commit();
    return resolution.identity;
  }

  matching::MatchOutcome Run(matching::Matcher& matcher, int64_t as_of_ms) {
    auto                   tx = repository->Begin();
    matching::MatchContext ctx{*tx, kTenant, util::NowMillis(), as_of_ms, config, *graph, *exceptions};
    auto                   outcome = matcher.Run(ctx);
    tx->Commit();
    return outcome;
  }

  std::vector<db::model::IdentityEdgeRecord> Outgoing(const std::string& id, cashgraph::v1::EdgeKind kind) {
    auto tx    = repository->Begin();
    auto edges = graph->Outgoing(*tx, id, kind);
    tx->Rollback();
    return edges;
  }

  std::vector<db::model::IdentityEdgeRecord> Incoming(const std::string& id, cashgraph::v1::EdgeKind kind) {
    auto tx    = repository->Begin();
    auto edges = graph->Incoming(*tx, id, kind);
    tx->Rollback();
    return edges;
  }

  std::vector<db::model::ExceptionRecord> Exceptions(cashgraph::v1::ExceptionKind kind) {
    db::model::ExceptionFilter filter;
    filter.tenant_id = kTenant;
    filter.kind      = kind;

    auto tx      = repository->Begin();
    auto records = repository->ListExceptions(*tx, filter);
    tx->Rollback();
    return records;
  }

  cashgraph::v1::ExceptionContext Context(const db::model::ExceptionRecord& record) {
    cashgraph::v1::ExceptionContext context;
    util::FromJson(record.context_json, &context);
    return context;
  }
};

} // namespace cashgraph::testing
