#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cashgraph/v1.hpp"
#include "internal/consolidation/consolidator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/exceptions/exception_manager.hpp"
#include "internal/graph/identity_graph.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/matching/matcher.hpp"
#include "internal/matching/matching_config.hpp"

namespace cashgraph::core {

struct EngineOptions {
  // attempts per unit of work on util::TransactionConflict
  uint32_t max_transaction_retries = 5;
  // Consolidate rescans this far behind `since`. An ingest that stamped
  // its identities before a pass began but committed after it is still
  // seen by the next pass as long as it committed within the lookback.
  int64_t watermark_lookback_ms = 10 * 60 * 1000;
};

/*
  ReconciliationEngine

  Owns the pipeline

    raw event -> fingerprint -> identity -> matchers add edges
              -> consolidator books ledger rows

  and exposes it in wire types. Ingestion runs one transaction per record
  and needs no locking; matching and consolidation are serialised per
  tenant and may run concurrently across tenants.
*/
class ReconciliationEngine {
 public:
  ReconciliationEngine(std::shared_ptr<db::Repository> repository, matching::MatchingConfig config, EngineOptions options = {});

  // Malformed records land in `rejected`; the rest of the batch goes on.
  cashgraph::v1::IngestResponse Ingest(const google::protobuf::RepeatedPtrField<cashgraph::v1::RawEvent>& events);

  // Runs every matcher, then books what the graph now supports.
  // `as_of_ms` drives the aging rules; unset means now.
  cashgraph::v1::ConsolidateResponse Consolidate(const std::string& tenant_id, uint64_t since_ms, std::optional<int64_t> as_of_ms = std::nullopt);

  // Matchers only, without booking.
  matching::MatchOutcome RunMatchers(const std::string& tenant_id, std::optional<int64_t> as_of_ms = std::nullopt);

  // Payouts whose occurred-at falls in [from_ms, to_ms); to_ms 0 = open ended.
  std::vector<cashgraph::v1::PayoutView> ListPayouts(const std::string& tenant_id, int64_t from_ms, int64_t to_ms);

  std::vector<cashgraph::v1::ReconException> ListExceptions(const std::string& tenant_id, cashgraph::v1::ExceptionKind kind,
                                                            cashgraph::v1::ExceptionStatus status);

  cashgraph::v1::GetProvenanceResponse GetProvenance(const std::string& identity_id, uint32_t max_depth);

  std::vector<cashgraph::v1::CashLedgerEntry> ListLedger(const std::string& tenant_id, int64_t from_ms, int64_t to_ms);

  cashgraph::v1::ResolveExceptionResponse ResolveException(const std::string& exception_id, const std::vector<cashgraph::v1::ChosenEdge>& edges,
                                                           const std::string& note);

  const matching::MatchingConfig& config() const {
    return config_;
  }

 private:
  matching::MatchOutcome RunMatchersLocked(const std::string& tenant_id, int64_t as_of_ms, uint64_t now_ms);

  std::shared_ptr<std::mutex> TenantMutex(const std::string& tenant_id);

  std::shared_ptr<db::Repository>               repository_;
  matching::MatchingConfig                      config_;
  EngineOptions                                 options_;
  std::shared_ptr<graph::IdentityGraph>         graph_;
  std::shared_ptr<exceptions::ExceptionManager> exceptions_;
  identity::IdentityResolver                    resolver_;
  consolidation::Consolidator                   consolidator_;

  // settlement -> composition -> ops payment -> ghost
  std::vector<std::unique_ptr<matching::Matcher>> matchers_;

  // One mutex per tenant ever matched or consolidated, never evicted. The
  // map is bounded by the tenants this process serves; handing out
  // shared_ptr copies keeps a lock alive while a pass holds it.
  std::mutex                                                    tenant_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> tenant_mutexes_;
};

} // namespace cashgraph::core
