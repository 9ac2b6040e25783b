#include "identity_graph.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

#include "internal/db/api/result_check.hpp"
#include "internal/fingerprint/fingerprint_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cashgraph::graph {

using namespace cashgraph::v1;

namespace {

EventKind NativeEventKind(CanonicalKind kind) {
  switch (kind) {
    case CANONICAL_KIND_SETTLEMENT:
      return EVENT_KIND_BANK_TXN;
    case CANONICAL_KIND_PAYOUT:
      return EVENT_KIND_PAYOUT;
    case CANONICAL_KIND_CHARGE:
    case CANONICAL_KIND_FEE:
    case CANONICAL_KIND_REFUND:
      return EVENT_KIND_BALANCE_TXN;
    case CANONICAL_KIND_INVOICE:
      return EVENT_KIND_OPS_INVOICE;
    case CANONICAL_KIND_PAYMENT:
      return EVENT_KIND_OPS_PAYMENT;
    default:
      return EVENT_KIND_UNSPECIFIED;
  }
}

std::vector<db::model::IdentityEdgeRecord> OfKind(std::vector<db::model::IdentityEdgeRecord> edges, EdgeKind kind) {
  edges.erase(std::remove_if(edges.begin(), edges.end(), [kind](const auto& e) { return e.kind != kind; }), edges.end());
  return edges;
}

} // namespace

// ------------------------------------------------------------------
// IdentityView
// ------------------------------------------------------------------

std::string IdentityView::provider() const {
  std::string raw;
  switch (payload.detail_case()) {
    case RawPayload::kPayout:
      raw = payload.payout().provider();
      break;
    case RawPayload::kBalance:
      raw = payload.balance().provider();
      break;
    case RawPayload::kOps:
      raw = payload.ops().provider();
      break;
    default:
      break;
  }
  return fingerprint::FingerprintEngine::NormalizeProvider(raw.empty() ? primary.source : raw);
}

int64_t IdentityView::expected_arrival_ms() const {
  if (payload.has_payout() && payload.payout().has_arrival_date()) {
    return util::ProtoToMillis(payload.payout().arrival_date());
  }
  return primary.occurred_at_ms;
}

int64_t IdentityView::gross_amount_minor() const {
  return payload.has_payout() ? payload.payout().gross_amount_minor() : 0;
}

double IdentityView::confidence() const {
  double lowest = 1.0;
  for (const auto& link : links) lowest = std::min(lowest, link.confidence);
  return lowest;
}

// ------------------------------------------------------------------
// IdentityGraph
// ------------------------------------------------------------------

IdentityGraph::IdentityGraph(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::IdentityEdgeRecord IdentityGraph::AddEdge(db::Transaction& tx, const std::string& tenant_id, const std::string& from_id,
                                                     const std::string& to_id, EdgeKind kind, double weight, const std::string& matcher,
                                                     const std::string& reason, uint64_t now_ms) {
  if (from_id == to_id) throw util::InvalidArgument("edge endpoints must differ");

  auto from = repository_->GetIdentity(tx, from_id);
  auto to   = repository_->GetIdentity(tx, to_id);
  if (!from) throw util::NotFound("edge source identity not found: " + from_id);
  if (!to) throw util::NotFound("edge target identity not found: " + to_id);
  if (from->tenant_id != tenant_id || to->tenant_id != tenant_id) {
    throw util::InvalidArgument("edge endpoints belong to another tenant");
  }

  db::model::IdentityEdgeRecord edge;
  edge.id               = util::NewId();
  edge.tenant_id        = tenant_id;
  edge.from_identity_id = from_id;
  edge.to_identity_id   = to_id;
  edge.kind             = kind;
  edge.weight           = weight;
  edge.matcher          = matcher;
  edge.reason           = reason;
  edge.created_at_ms    = now_ms;

  db::ThrowIfDbError(repository_->InsertEdge(tx, edge), "insert edge");
  db::ThrowIfDbError(repository_->TouchIdentity(tx, from_id, now_ms), "touch identity");
  db::ThrowIfDbError(repository_->TouchIdentity(tx, to_id, now_ms), "touch identity");

  CASHGRAPH_LOG_DEBUG("edge written", {observability::StringField("kind", EdgeKind_Name(kind)), observability::StringField("from", from_id),
                                       observability::StringField("to", to_id), observability::DoubleField("weight", weight),
                                       observability::StringField("matcher", matcher)});
  return edge;
}

std::vector<db::model::IdentityEdgeRecord> IdentityGraph::Outgoing(db::Transaction& tx, const std::string& identity_id, EdgeKind kind) {
  return OfKind(repository_->GetOutgoingEdges(tx, identity_id), kind);
}

std::vector<db::model::IdentityEdgeRecord> IdentityGraph::Incoming(db::Transaction& tx, const std::string& identity_id, EdgeKind kind) {
  return OfKind(repository_->GetIncomingEdges(tx, identity_id), kind);
}

IdentityView IdentityGraph::BuildView(db::Transaction& tx, db::model::IdentityRecord identity) {
  IdentityView view;
  view.identity = std::move(identity);
  view.links    = repository_->GetLinks(tx, view.identity.id);

  for (const auto& link : view.links) {
    auto raw = repository_->GetRawEvent(tx, link.raw_event_id);
    if (!raw) throw util::InvalidState("identity link references missing raw event " + link.raw_event_id);
    view.raw_events.push_back(std::move(*raw));
  }

  if (!view.raw_events.empty()) {
    const auto native = NativeEventKind(view.identity.kind);
    auto       it     = std::find_if(view.raw_events.begin(), view.raw_events.end(), [native](const auto& r) { return r.kind == native; });
    view.primary      = it != view.raw_events.end() ? *it : view.raw_events.front();
    util::FromJson(view.primary.payload_json, &view.payload);
  }
  return view;
}

std::optional<IdentityView> IdentityGraph::Load(db::Transaction& tx, const std::string& identity_id) {
  auto identity = repository_->GetIdentity(tx, identity_id);
  if (!identity) return std::nullopt;
  return BuildView(tx, std::move(*identity));
}

std::vector<IdentityView> IdentityGraph::LoadAll(db::Transaction& tx, const std::string& tenant_id, CanonicalKind kind) {
  std::vector<IdentityView> views;
  for (auto& identity : repository_->ListIdentities(tx, tenant_id, kind)) {
    views.push_back(BuildView(tx, std::move(identity)));
  }
  return views;
}

std::optional<db::model::IdentityRecord> IdentityGraph::IdentityOf(db::Transaction& tx, const db::model::RawEventRecord& raw) {
  RawPayload payload;
  util::FromJson(raw.payload_json, &payload);
  const auto result = fingerprint::FingerprintEngine{}.Fingerprint(raw, payload);
  return repository_->FindIdentityByFingerprint(tx, raw.tenant_id, result.key);
}

ProvenanceGraph IdentityGraph::Traverse(db::Transaction& tx, const std::string& root_id, uint32_t max_depth) {
  ProvenanceGraph graph;

  std::queue<std::pair<std::string, uint32_t>> q;
  std::unordered_set<std::string>              visited;
  std::unordered_set<std::string>              seen_edges;

  q.emplace(root_id, 0);
  visited.insert(root_id);

  while (!q.empty()) {
    const auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth) {
      continue;
    }

    auto edges    = repository_->GetOutgoingEdges(tx, node);
    auto incoming = repository_->GetIncomingEdges(tx, node);
    edges.insert(edges.end(), incoming.begin(), incoming.end());

    for (const auto& edge : edges) {
      if (seen_edges.insert(edge.id).second) {
        graph.edges.push_back(edge);
      }

      const auto& next_id = edge.from_identity_id == node ? edge.to_identity_id : edge.from_identity_id;
      if (visited.insert(next_id).second) {
        if (auto identity = repository_->GetIdentity(tx, next_id)) {
          graph.identities.push_back(std::move(*identity));
        }
        q.emplace(next_id, depth + 1);
      }
    }
  }

  return graph;
}

} // namespace cashgraph::graph
