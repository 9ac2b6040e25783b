#include "consolidator.hpp"

#include <algorithm>

#include "internal/db/api/result_check.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cashgraph::consolidation {

using namespace cashgraph::v1;

namespace {

constexpr uint32_t kProvenanceSchemaVersion = 1;

void AddEdge(Provenance& provenance, const db::model::IdentityEdgeRecord& edge) {
  auto* out = provenance.add_edges();
  out->set_id(edge.id);
  out->set_tenant_id(edge.tenant_id);
  out->set_from_identity_id(edge.from_identity_id);
  out->set_to_identity_id(edge.to_identity_id);
  out->set_kind(edge.kind);
  out->set_weight(edge.weight);
  out->set_matcher(edge.matcher);
  out->set_reason(edge.reason);
  *out->mutable_created_at() = util::MillisToProto(static_cast<int64_t>(edge.created_at_ms));
  if (!edge.reason.empty()) provenance.add_reasons(edge.matcher + ": " + edge.reason);
}

db::model::LedgerEntryRecord NewEntry(const graph::IdentityView& booked, const graph::IdentityView& settlement, double confidence,
                                      const Provenance& provenance, uint64_t now_ms) {
  db::model::LedgerEntryRecord entry;
  entry.id              = util::NewId();
  entry.tenant_id       = booked.identity.tenant_id;
  entry.identity_id     = booked.id();
  entry.posted_at_ms    = settlement.occurred_at_ms();
  entry.amount_minor    = settlement.amount_minor();
  entry.direction       = settlement.amount_minor() < 0 ? DIRECTION_OUTFLOW : DIRECTION_INFLOW;
  entry.currency        = settlement.primary.currency;
  entry.confidence      = std::clamp(confidence, 0.0, 1.0);
  entry.provenance_json = util::ToJson(provenance);
  entry.created_at_ms   = now_ms;
  return entry;
}

} // namespace

Consolidator::Consolidator(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::IdentityGraph> graph,
                           std::shared_ptr<exceptions::ExceptionManager> exceptions, uint32_t max_attempts)
    : repository_(std::move(repository)), graph_(std::move(graph)), exceptions_(std::move(exceptions)), max_attempts_(max_attempts) {
}

ConsolidationResult Consolidator::Consolidate(const std::string& tenant_id, uint64_t since_ms, uint64_t now_ms) {
  std::vector<db::model::IdentityRecord> touched;
  std::unordered_set<std::string>        deferred;
  {
    auto tx = repository_->Begin();
    for (auto& identity : repository_->ListIdentitiesTouchedSince(*tx, tenant_id, since_ms)) {
      if (identity.kind == CANONICAL_KIND_PAYOUT || identity.kind == CANONICAL_KIND_SETTLEMENT) touched.push_back(std::move(identity));
    }
    deferred = exceptions_->OpenPayoutCandidateIds(*tx, tenant_id);
    tx->Rollback();
  }

  ConsolidationResult result;
  for (const auto& identity : touched) {
    try {
      auto entry = db::RunInTransaction(*repository_, max_attempts_, "consolidate", [&](db::Transaction& tx) {
        auto view = graph_->Load(tx, identity.id);
        if (!view) throw util::NotFound("identity vanished: " + identity.id);
        return identity.kind == CANONICAL_KIND_PAYOUT ? BookPayout(tx, *view, now_ms) : BookSettlement(tx, *view, deferred, now_ms);
      });
      if (entry) {
        CASHGRAPH_LOG_DEBUG("ledger entry booked", {observability::TenantField(tenant_id), observability::StringField("identity", entry->identity_id),
                                                    observability::MoneyField("amount", entry->amount_minor),
                                                    observability::TimestampField("posted_at", entry->posted_at_ms)});
        result.entries.push_back(std::move(*entry));
      }
    } catch (const std::exception& e) {
      CASHGRAPH_LOG_ERROR("consolidation failed for identity", {observability::TenantField(tenant_id),
                                                                 observability::StringField("identity", identity.id),
                                                                 observability::StringField("error", e.what())});
      ExceptionContext context;
      context.set_subject_identity_id(identity.id);
      context.set_reason("consolidation failed");
      context.mutable_failure()->set_stage("consolidate");
      context.mutable_failure()->set_error(e.what());
      result.exceptions.push_back(db::RunInTransaction(*repository_, max_attempts_, "raise processing failure", [&](db::Transaction& tx) {
        return exceptions_->Raise(tx, tenant_id, EXCEPTION_KIND_PROCESSING_FAILURE, SEVERITY_WARNING, context, now_ms);
      }));
    }
  }

  CASHGRAPH_LOG_INFO("consolidation pass finished", {observability::TenantField(tenant_id), observability::IntField("visited", static_cast<int64_t>(touched.size())),
                                                     observability::IntField("entries", static_cast<int64_t>(result.entries.size())),
                                                     observability::IntField("failures", static_cast<int64_t>(result.exceptions.size()))});
  return result;
}

std::optional<db::model::LedgerEntryRecord> Consolidator::BookPayout(db::Transaction& tx, const graph::IdentityView& payout, uint64_t now_ms) {
  const auto settles = graph_->Outgoing(tx, payout.id(), EDGE_KIND_SETTLES);
  if (settles.empty()) return std::nullopt; // in transit

  const auto& tenant_id = payout.identity.tenant_id;
  if (repository_->GetLedgerEntryForIdentity(tx, tenant_id, payout.id())) return std::nullopt;

  const auto& edge       = settles.front();
  auto        settlement = graph_->Load(tx, edge.to_identity_id);
  if (!settlement) throw util::InvalidState("payout " + payout.id() + " settles into a missing identity " + edge.to_identity_id);

  if (auto direct = repository_->GetLedgerEntryForIdentity(tx, tenant_id, settlement->id())) {
    CASHGRAPH_LOG_INFO("settlement already booked directly; payout not booked again",
                       {observability::StringField("payout", payout.id()), observability::StringField("settlement", settlement->id()),
                        observability::StringField("entry", direct->id)});
    return std::nullopt;
  }

  Provenance provenance;
  provenance.set_schema_version(kProvenanceSchemaVersion);
  provenance.set_settlement_identity_id(settlement->id());
  provenance.set_bank_amount_minor(settlement->amount_minor());
  AddEdge(provenance, edge);

  int64_t composed = 0;
  for (const auto& component : graph_->Incoming(tx, payout.id(), EDGE_KIND_COMPOSED_OF)) {
    AddEdge(provenance, component);
    if (auto part = graph_->Load(tx, component.from_identity_id)) composed += part->amount_minor();
  }
  provenance.set_composed_amount_minor(composed);

  const double confidence = std::min({edge.weight, payout.confidence(), settlement->confidence()});
  auto         entry      = NewEntry(payout, *settlement, confidence, provenance, now_ms);
  if (!Write(tx, entry)) return std::nullopt;

  CASHGRAPH_LOG_INFO("payout booked", {observability::StringField("payout", payout.id()), observability::StringField("settlement", settlement->id()),
                                       observability::IntField("amount_minor", entry.amount_minor), observability::IntField("composed_minor", composed)});
  return entry;
}

std::optional<db::model::LedgerEntryRecord> Consolidator::BookSettlement(db::Transaction& tx, const graph::IdentityView& settlement,
                                                                         const std::unordered_set<std::string>& deferred, uint64_t now_ms) {
  // booked through its payout
  if (!graph_->Incoming(tx, settlement.id(), EDGE_KIND_SETTLES).empty()) return std::nullopt;

  if (deferred.contains(settlement.id())) {
    CASHGRAPH_LOG_DEBUG("settlement deferred by open payout exception", {observability::StringField("settlement", settlement.id())});
    return std::nullopt;
  }
  if (settlement.payload.has_bank() && settlement.payload.bank().pending()) {
    CASHGRAPH_LOG_DEBUG("pending bank record not booked", {observability::StringField("settlement", settlement.id())});
    return std::nullopt;
  }
  if (repository_->GetLedgerEntryForIdentity(tx, settlement.identity.tenant_id, settlement.id())) return std::nullopt;

  Provenance provenance;
  provenance.set_schema_version(kProvenanceSchemaVersion);
  provenance.set_settlement_identity_id(settlement.id());
  provenance.set_bank_amount_minor(settlement.amount_minor());
  for (const auto& applied : graph_->Incoming(tx, settlement.id(), EDGE_KIND_APPLIES_TO)) AddEdge(provenance, applied);
  provenance.add_reasons("direct bank record");

  auto entry = NewEntry(settlement, settlement, settlement.confidence(), provenance, now_ms);
  if (!Write(tx, entry)) return std::nullopt;

  CASHGRAPH_LOG_INFO("settlement booked directly", {observability::StringField("settlement", settlement.id()), observability::IntField("amount_minor", entry.amount_minor)});
  return entry;
}

bool Consolidator::Write(db::Transaction& tx, const db::model::LedgerEntryRecord& entry) {
  auto inserted = repository_->InsertLedgerEntry(tx, entry);
  if (!inserted && inserted.code == db::ErrorCode::AlreadyExists) return false;
  db::ThrowIfDbError(inserted, "insert ledger entry");
  return true;
}

} // namespace cashgraph::consolidation
