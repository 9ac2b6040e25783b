#include "reconciliation_engine.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

#include "internal/db/api/result_check.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/matching/composition_matcher.hpp"
#include "internal/matching/ghost_detector.hpp"
#include "internal/matching/ops_payment_matcher.hpp"
#include "internal/matching/settlement_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "record_convert.hpp"

namespace cashgraph::core {

using namespace cashgraph::v1;

namespace {

int64_t UpperBound(int64_t to_ms) {
  return to_ms > 0 ? to_ms : std::numeric_limits<int64_t>::max();
}

} // namespace

ReconciliationEngine::ReconciliationEngine(std::shared_ptr<db::Repository> repository, matching::MatchingConfig config, EngineOptions options)
    : repository_(std::move(repository)),
      config_(config),
      options_(options),
      graph_(std::make_shared<graph::IdentityGraph>(repository_)),
      exceptions_(std::make_shared<exceptions::ExceptionManager>(repository_, graph_)),
      resolver_(repository_),
      consolidator_(repository_, graph_, exceptions_, options.max_transaction_retries) {
  matchers_.push_back(std::make_unique<matching::SettlementMatcher>());
  matchers_.push_back(std::make_unique<matching::CompositionMatcher>());
  matchers_.push_back(std::make_unique<matching::OpsPaymentMatcher>());
  matchers_.push_back(std::make_unique<matching::GhostDetector>());
}

std::shared_ptr<std::mutex> ReconciliationEngine::TenantMutex(const std::string& tenant_id) {
  std::lock_guard lock(tenant_mutexes_guard_);
  auto& mutex = tenant_mutexes_[tenant_id];
  if (!mutex) mutex = std::make_shared<std::mutex>();
  return mutex;
}

// ------------------------------------------------------------------
// Ingestion
// ------------------------------------------------------------------

IngestResponse ReconciliationEngine::Ingest(const google::protobuf::RepeatedPtrField<RawEvent>& events) {
  IngestResponse response;

  for (const auto& event : events) {
    try {
      auto record = ToRecord(event);
      record.id   = util::NewId();

      const bool stored = db::RunInTransaction(*repository_, options_.max_transaction_retries, "ingest", [&](db::Transaction& tx) {
        record.ingested_at_ms = util::NowMillis();
        auto inserted = repository_->InsertRawEvent(tx, record);
        if (!inserted && inserted.code == db::ErrorCode::AlreadyExists) return false;
        db::ThrowIfDbError(inserted, "insert raw event");

        resolver_.Resolve(tx, record, event.payload(), record.ingested_at_ms);
        return true;
      });

      if (stored) {
        response.set_stored(response.stored() + 1);
      } else {
        response.set_deduplicated(response.deduplicated() + 1);
      }
    } catch (const util::InvalidArgument& e) {
      auto* rejected = response.add_rejected();
      rejected->set_source(event.source());
      rejected->set_external_id(event.external_id());
      rejected->set_error(e.what());
    } catch (const util::InvalidState& e) {
      auto* rejected = response.add_rejected();
      rejected->set_source(event.source());
      rejected->set_external_id(event.external_id());
      rejected->set_error(e.what());
    }
  }

  for (const auto& rejected : response.rejected()) {
    CASHGRAPH_LOG_WARN("raw event rejected", {observability::StringField("source", rejected.source()),
                                              observability::StringField("external_id", rejected.external_id()),
                                              observability::StringField("error", rejected.error())});
  }
  CASHGRAPH_LOG_INFO("ingest batch", {observability::IntField("received", events.size()), observability::IntField("stored", static_cast<int64_t>(response.stored())),
                                      observability::IntField("deduplicated", static_cast<int64_t>(response.deduplicated())),
                                      observability::IntField("rejected", response.rejected_size())});
  return response;
}

// ------------------------------------------------------------------
// Matching and consolidation
// ------------------------------------------------------------------

matching::MatchOutcome ReconciliationEngine::RunMatchersLocked(const std::string& tenant_id, int64_t as_of_ms, uint64_t now_ms) {
  return db::RunInTransaction(*repository_, options_.max_transaction_retries, "match", [&](db::Transaction& tx) {
    matching::MatchContext ctx{tx, tenant_id, now_ms, as_of_ms, config_, *graph_, *exceptions_};

    matching::MatchOutcome outcome;
    for (const auto& matcher : matchers_) {
      auto step = matcher->Run(ctx);
      CASHGRAPH_LOG_DEBUG("matcher finished", {observability::StringField("matcher", matcher->Name()), observability::TenantField(tenant_id),
                                               observability::IntField("edges", static_cast<int64_t>(step.edges.size())),
                                               observability::IntField("exceptions", static_cast<int64_t>(step.exceptions.size()))});
      outcome.Merge(std::move(step));
    }

    auto escalated = exceptions_->EscalateStale(tx, tenant_id, as_of_ms, config_.timing_escalation_ms, now_ms);
    outcome.exceptions.insert(outcome.exceptions.end(), escalated.begin(), escalated.end());
    return outcome;
  });
}

matching::MatchOutcome ReconciliationEngine::RunMatchers(const std::string& tenant_id, std::optional<int64_t> as_of_ms) {
  if (tenant_id.empty()) throw util::InvalidArgument("run matchers: tenant_id is required");

  auto            mutex = TenantMutex(tenant_id);
  std::lock_guard lock(*mutex);

  const auto now = util::NowMillis();
  return RunMatchersLocked(tenant_id, as_of_ms.value_or(static_cast<int64_t>(now)), now);
}

ConsolidateResponse ReconciliationEngine::Consolidate(const std::string& tenant_id, uint64_t since_ms, std::optional<int64_t> as_of_ms) {
  if (tenant_id.empty()) throw util::InvalidArgument("consolidate: tenant_id is required");

  auto            mutex = TenantMutex(tenant_id);
  std::lock_guard lock(*mutex);

  // identities touched from here on are picked up by the next pass
  const auto watermark = util::NowMillis();

  // Ingestion takes no tenant lock, so a unit stamped just before an
  // earlier watermark may have committed after that pass read the graph.
  // Booking is keyed on identity, so rescanning the margin is harmless.
  const auto lookback  = static_cast<uint64_t>(std::max<int64_t>(options_.watermark_lookback_ms, 0));
  const auto scan_from = since_ms > lookback ? since_ms - lookback : 0;

  auto matched = RunMatchersLocked(tenant_id, as_of_ms.value_or(static_cast<int64_t>(watermark)), watermark);
  auto booked  = consolidator_.Consolidate(tenant_id, scan_from, watermark);

  ConsolidateResponse response;
  for (const auto& entry : booked.entries) *response.add_entries() = ToProto(entry);

  std::unordered_set<std::string> reported;
  for (const auto* list : {&matched.exceptions, &booked.exceptions}) {
    for (const auto& exception : *list) {
      if (reported.insert(exception.id).second) *response.add_exceptions() = ToProto(exception);
    }
  }
  *response.mutable_watermark() = util::MillisToProto(static_cast<int64_t>(watermark));

  CASHGRAPH_LOG_INFO("consolidated", {observability::TenantField(tenant_id), observability::TimestampField("since", static_cast<int64_t>(since_ms)),
                                      observability::IntField("edges", static_cast<int64_t>(matched.edges.size())),
                                      observability::IntField("entries", response.entries_size()), observability::IntField("exceptions", response.exceptions_size())});
  return response;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<PayoutView> ReconciliationEngine::ListPayouts(const std::string& tenant_id, int64_t from_ms, int64_t to_ms) {
  if (tenant_id.empty()) throw util::InvalidArgument("list payouts: tenant_id is required");

  auto tx = repository_->Begin();

  db::model::ExceptionFilter filter;
  filter.tenant_id = tenant_id;
  filter.status    = EXCEPTION_STATUS_OPEN;
  std::unordered_map<std::string, std::vector<db::model::ExceptionRecord>> open_by_subject;
  for (auto& record : repository_->ListExceptions(*tx, filter)) open_by_subject[record.subject_identity_id].push_back(std::move(record));

  std::vector<PayoutView> out;
  for (const auto& payout : graph_->LoadAll(*tx, tenant_id, CANONICAL_KIND_PAYOUT)) {
    if (payout.occurred_at_ms() < from_ms || payout.occurred_at_ms() >= UpperBound(to_ms)) continue;

    PayoutView view;
    *view.mutable_payout() = ToProto(payout.identity);
    view.mutable_amount()->set_amount_minor(payout.amount_minor());
    view.mutable_amount()->set_currency(payout.primary.currency);
    *view.mutable_expected_arrival() = util::MillisToProto(payout.expected_arrival_ms());

    bool ambiguous = false;
    bool drifting  = false;
    if (auto it = open_by_subject.find(payout.id()); it != open_by_subject.end()) {
      for (const auto& exception : it->second) {
        view.add_open_exception_ids(exception.id);
        ambiguous = ambiguous || exception.kind == EXCEPTION_KIND_AMBIGUOUS_MATCH;
        drifting  = drifting || exception.kind == EXCEPTION_KIND_TIMING_DRIFT;
      }
    }

    const auto settles = graph_->Outgoing(*tx, payout.id(), EDGE_KIND_SETTLES);
    if (!settles.empty()) {
      view.set_status(PAYOUT_STATUS_SETTLED);
      view.set_settlement_identity_id(settles.front().to_identity_id);
    } else if (ambiguous) {
      view.set_status(PAYOUT_STATUS_AMBIGUOUS);
    } else if (drifting) {
      view.set_status(PAYOUT_STATUS_TIMING_DRIFT);
    } else {
      view.set_status(PAYOUT_STATUS_IN_TRANSIT);
    }
    out.push_back(std::move(view));
  }

  tx->Rollback();
  return out;
}

std::vector<ReconException> ReconciliationEngine::ListExceptions(const std::string& tenant_id, ExceptionKind kind, ExceptionStatus status) {
  if (tenant_id.empty()) throw util::InvalidArgument("list exceptions: tenant_id is required");

  db::model::ExceptionFilter filter;
  filter.tenant_id = tenant_id;
  if (kind != EXCEPTION_KIND_UNSPECIFIED) filter.kind = kind;
  if (status != EXCEPTION_STATUS_UNSPECIFIED) filter.status = status;

  auto tx      = repository_->Begin();
  auto records = repository_->ListExceptions(*tx, filter);
  tx->Rollback();

  std::vector<ReconException> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(ToProto(record));
  return out;
}

GetProvenanceResponse ReconciliationEngine::GetProvenance(const std::string& identity_id, uint32_t max_depth) {
  if (identity_id.empty()) throw util::InvalidArgument("get provenance: identity_id is required");

  auto tx   = repository_->Begin();
  auto root = graph_->Load(*tx, identity_id);
  if (!root) throw util::NotFound("get provenance: identity not found: " + identity_id);

  GetProvenanceResponse response;
  *response.mutable_identity() = ToProto(root->identity);
  for (const auto& link : root->links) *response.add_links() = ToProto(link);
  for (const auto& raw : root->raw_events) *response.add_raw_events() = ToProto(raw);

  const auto walk = graph_->Traverse(*tx, identity_id, max_depth);
  for (const auto& identity : walk.identities) *response.add_related() = ToProto(identity);
  for (const auto& edge : walk.edges) *response.add_edges() = ToProto(edge);

  // a settlement claimed by a payout is booked under the payout
  auto entry = repository_->GetLedgerEntryForIdentity(*tx, root->identity.tenant_id, identity_id);
  if (!entry && root->kind() == CANONICAL_KIND_SETTLEMENT) {
    for (const auto& edge : graph_->Incoming(*tx, identity_id, EDGE_KIND_SETTLES)) {
      entry = repository_->GetLedgerEntryForIdentity(*tx, root->identity.tenant_id, edge.from_identity_id);
      if (entry) break;
    }
  }
  if (entry) *response.mutable_ledger_entry() = ToProto(*entry);

  tx->Rollback();
  return response;
}

std::vector<CashLedgerEntry> ReconciliationEngine::ListLedger(const std::string& tenant_id, int64_t from_ms, int64_t to_ms) {
  if (tenant_id.empty()) throw util::InvalidArgument("list ledger: tenant_id is required");

  auto tx      = repository_->Begin();
  auto records = repository_->ListLedgerEntries(*tx, tenant_id, from_ms, UpperBound(to_ms));
  tx->Rollback();

  std::vector<CashLedgerEntry> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(ToProto(record));
  return out;
}

// ------------------------------------------------------------------
// Review
// ------------------------------------------------------------------

ResolveExceptionResponse ReconciliationEngine::ResolveException(const std::string& exception_id, const std::vector<ChosenEdge>& edges,
                                                                const std::string& note) {
  if (exception_id.empty()) throw util::InvalidArgument("resolve exception: exception_id is required");

  std::string tenant_id;
  {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetException(*tx, exception_id);
    tx->Rollback();
    if (!existing) throw util::NotFound("resolve exception: exception not found: " + exception_id);
    tenant_id = existing->tenant_id;
  }

  // review edges race matchers for the same identities
  auto            mutex = TenantMutex(tenant_id);
  std::lock_guard lock(*mutex);

  auto resolution = db::RunInTransaction(*repository_, options_.max_transaction_retries, "resolve exception",
                                         [&](db::Transaction& tx) { return exceptions_->Resolve(tx, exception_id, edges, note, util::NowMillis()); });

  ResolveExceptionResponse response;
  *response.mutable_exception() = ToProto(resolution.exception);
  for (const auto& edge : resolution.written_edges) *response.add_written_edges() = ToProto(edge);
  return response;
}

} // namespace cashgraph::core
