#include "exception_manager.hpp"

#include <algorithm>

#include "internal/db/api/result_check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cashgraph::exceptions {

using namespace cashgraph::v1;

namespace {

constexpr uint32_t kContextSchemaVersion = 1;

bool IsComponentKind(CanonicalKind kind) {
  return kind == CANONICAL_KIND_CHARGE || kind == CANONICAL_KIND_FEE || kind == CANONICAL_KIND_REFUND;
}

} // namespace

ExceptionManager::ExceptionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::IdentityGraph> graph)
    : repository_(std::move(repository)), graph_(std::move(graph)) {
}

std::string ExceptionManager::DedupKey(ExceptionKind kind, const ExceptionContext& context) {
  // settlement and composition ambiguity about one payout are separate questions
  const char* question = "";
  switch (context.detail_case()) {
    case ExceptionContext::kMatch:
      question = "match";
      break;
    case ExceptionContext::kSubsets:
      question = "subsets";
      break;
    case ExceptionContext::kGhost:
      question = "ghost";
      break;
    case ExceptionContext::kTiming:
      question = "timing";
      break;
    case ExceptionContext::kFailure:
      question = "failure";
      break;
    case ExceptionContext::DETAIL_NOT_SET:
      break;
  }
  return ExceptionKind_Name(kind) + ":" + question + ":" + context.subject_identity_id();
}

std::vector<std::string> ExceptionManager::MentionedIdentities(const ExceptionContext& context) {
  std::vector<std::string> ids;
  if (!context.subject_identity_id().empty()) ids.push_back(context.subject_identity_id());

  switch (context.detail_case()) {
    case ExceptionContext::kMatch:
      for (const auto& c : context.match().candidates()) ids.push_back(c.identity_id());
      break;
    case ExceptionContext::kSubsets:
      for (const auto& id : context.subsets().pool_identity_ids()) ids.push_back(id);
      for (const auto& subset : context.subsets().subsets())
        for (const auto& id : subset.identity_ids()) ids.push_back(id);
      break;
    case ExceptionContext::kTiming:
      for (const auto& c : context.timing().candidates()) ids.push_back(c.identity_id());
      break;
    default:
      break;
  }

  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

db::model::ExceptionRecord ExceptionManager::Raise(db::Transaction& tx, const std::string& tenant_id, ExceptionKind kind, Severity severity,
                                                   const ExceptionContext& context, uint64_t now_ms) {
  ExceptionContext stored_context = context;
  stored_context.set_schema_version(kContextSchemaVersion);

  const auto key = DedupKey(kind, context);

  if (auto existing = repository_->FindOpenException(tx, tenant_id, key)) {
    existing->context_json  = util::ToJson(stored_context);
    existing->severity      = std::max(existing->severity, severity);
    existing->updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateException(tx, *existing), "refresh exception");
    return *existing;
  }

  db::model::ExceptionRecord record;
  record.id                  = util::NewId();
  record.tenant_id           = tenant_id;
  record.kind                = kind;
  record.status              = EXCEPTION_STATUS_OPEN;
  record.severity            = severity;
  record.subject_identity_id = context.subject_identity_id();
  record.dedup_key           = key;
  record.context_json        = util::ToJson(stored_context);
  record.created_at_ms       = now_ms;
  record.updated_at_ms       = now_ms;

  db::ThrowIfDbError(repository_->InsertException(tx, record), "insert exception");

  CASHGRAPH_LOG_INFO("exception raised", {observability::TenantField(tenant_id), observability::StringField("kind", ExceptionKind_Name(kind)),
                                          observability::StringField("severity", Severity_Name(severity)),
                                          observability::StringField("subject", record.subject_identity_id),
                                          observability::StringField("reason", context.reason())});
  return record;
}

void ExceptionManager::ValidateEdge(db::Transaction& tx, const ChosenEdge& edge, const std::string& tenant_id) {
  auto from = repository_->GetIdentity(tx, edge.from_identity_id());
  auto to   = repository_->GetIdentity(tx, edge.to_identity_id());
  if (!from) throw util::NotFound("resolve exception: identity not found: " + edge.from_identity_id());
  if (!to) throw util::NotFound("resolve exception: identity not found: " + edge.to_identity_id());
  if (from->tenant_id != tenant_id || to->tenant_id != tenant_id) {
    throw util::InvalidArgument("resolve exception: edge crosses tenants");
  }

  switch (edge.kind()) {
    case EDGE_KIND_SETTLES:
      if (from->kind != CANONICAL_KIND_PAYOUT || to->kind != CANONICAL_KIND_SETTLEMENT) {
        throw util::InvalidArgument("resolve exception: SETTLES must point from a payout to a settlement");
      }
      if (!graph_->Outgoing(tx, from->id, EDGE_KIND_SETTLES).empty()) {
        throw util::InvalidState("resolve exception: payout " + from->id + " is already settled");
      }
      if (!graph_->Incoming(tx, to->id, EDGE_KIND_SETTLES).empty()) {
        throw util::InvalidState("resolve exception: settlement " + to->id + " is already claimed by a payout");
      }
      break;
    case EDGE_KIND_COMPOSED_OF:
      if (!IsComponentKind(from->kind) || to->kind != CANONICAL_KIND_PAYOUT) {
        throw util::InvalidArgument("resolve exception: COMPOSED_OF must point from a charge, fee or refund to a payout");
      }
      if (!graph_->Outgoing(tx, from->id, EDGE_KIND_COMPOSED_OF).empty()) {
        throw util::InvalidState("resolve exception: " + from->id + " is already composed into a payout");
      }
      break;
    case EDGE_KIND_APPLIES_TO:
      if (from->kind != CANONICAL_KIND_PAYMENT || (to->kind != CANONICAL_KIND_CHARGE && to->kind != CANONICAL_KIND_SETTLEMENT)) {
        throw util::InvalidArgument("resolve exception: APPLIES_TO must point from an ops payment to a charge or settlement");
      }
      break;
    default:
      throw util::InvalidArgument("resolve exception: edge kind is unspecified");
  }
}

Resolution ExceptionManager::Resolve(db::Transaction& tx, const std::string& exception_id, const std::vector<ChosenEdge>& edges,
                                     const std::string& note, uint64_t now_ms) {
  auto record = repository_->GetException(tx, exception_id);
  if (!record) throw util::NotFound("resolve exception: exception not found: " + exception_id);
  if (record->status != EXCEPTION_STATUS_OPEN) {
    throw util::InvalidState("resolve exception: exception " + exception_id + " is not open");
  }

  Resolution resolution;
  for (const auto& edge : edges) {
    ValidateEdge(tx, edge, record->tenant_id);
    const double weight = edge.weight() > 0.0 ? std::min(edge.weight(), 1.0) : 1.0;
    resolution.written_edges.push_back(graph_->AddEdge(tx, record->tenant_id, edge.from_identity_id(), edge.to_identity_id(), edge.kind(), weight,
                                                       "review", note.empty() ? "resolved exception " + exception_id : note, now_ms));
  }

  ExceptionContext context;
  util::FromJson(record->context_json, &context);
  for (const auto& id : MentionedIdentities(context)) {
    auto touched = repository_->TouchIdentity(tx, id, now_ms);
    if (!touched && touched.code != db::ErrorCode::NotFound) db::ThrowIfDbError(touched, "touch identity");
  }

  record->status          = EXCEPTION_STATUS_RESOLVED;
  record->resolved_at_ms  = now_ms;
  record->updated_at_ms   = now_ms;
  record->resolution_note = note;
  db::ThrowIfDbError(repository_->UpdateException(tx, *record), "resolve exception");

  CASHGRAPH_LOG_INFO("exception resolved", {observability::StringField("id", exception_id), observability::StringField("kind", ExceptionKind_Name(record->kind)),
                                            observability::IntField("edges", static_cast<int64_t>(resolution.written_edges.size()))});

  resolution.exception = std::move(*record);
  return resolution;
}

std::vector<db::model::ExceptionRecord> ExceptionManager::EscalateStale(db::Transaction& tx, const std::string& tenant_id, int64_t as_of_ms,
                                                                        int64_t escalation_ms, uint64_t now_ms) {
  db::model::ExceptionFilter filter;
  filter.tenant_id = tenant_id;
  filter.kind      = EXCEPTION_KIND_TIMING_DRIFT;
  filter.status    = EXCEPTION_STATUS_OPEN;

  std::vector<db::model::ExceptionRecord> escalated;
  for (auto& record : repository_->ListExceptions(tx, filter)) {
    if (record.severity != SEVERITY_INFO) continue;

    // age is measured from the expected arrival when known
    ExceptionContext context;
    util::FromJson(record.context_json, &context);
    const int64_t since = context.has_timing() && context.timing().has_expected_at() ? util::ProtoToMillis(context.timing().expected_at())
                                                                                     : static_cast<int64_t>(record.created_at_ms);
    if (as_of_ms - since < escalation_ms) continue;

    record.severity      = SEVERITY_WARNING;
    record.updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateException(tx, record), "escalate exception");

    CASHGRAPH_LOG_WARN("timing drift escalated", {observability::StringField("id", record.id), observability::StringField("subject", record.subject_identity_id)});
    escalated.push_back(std::move(record));
  }
  return escalated;
}

std::unordered_set<std::string> ExceptionManager::OpenPayoutCandidateIds(db::Transaction& tx, const std::string& tenant_id) {
  db::model::ExceptionFilter filter;
  filter.tenant_id = tenant_id;
  filter.status    = EXCEPTION_STATUS_OPEN;

  std::unordered_set<std::string> ids;
  for (const auto& record : repository_->ListExceptions(tx, filter)) {
    if (record.kind != EXCEPTION_KIND_AMBIGUOUS_MATCH && record.kind != EXCEPTION_KIND_TIMING_DRIFT) continue;

    // only payout-side questions hold settlements back
    auto subject = repository_->GetIdentity(tx, record.subject_identity_id);
    if (!subject || subject->kind != CANONICAL_KIND_PAYOUT) continue;

    ExceptionContext context;
    util::FromJson(record.context_json, &context);
    for (auto& id : MentionedIdentities(context)) ids.insert(std::move(id));
  }
  return ids;
}

} // namespace cashgraph::exceptions
