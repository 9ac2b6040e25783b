#include "composition_matcher.hpp"

#include <algorithm>
#include <bit>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include "internal/fingerprint/fingerprint_engine.hpp"
#include "internal/observability/logging.hpp"

namespace cashgraph::matching {

using namespace cashgraph::v1;

namespace {

constexpr std::size_t kHardPoolLimit = 30;

std::string ParentPayoutId(const graph::IdentityView& component) {
  if (!component.primary.parent_external_id.empty()) return component.primary.parent_external_id;
  if (component.payload.has_balance()) return component.payload.balance().source_payout_id();
  return {};
}

} // namespace

std::vector<std::vector<std::size_t>> CompositionMatcher::FindSubsets(const std::vector<int64_t>& amounts, int64_t target, std::size_t limit,
                                                                      std::size_t* total) {
  const std::size_t n = amounts.size();
  if (n > kHardPoolLimit) throw std::invalid_argument("subset search pool too large");

  std::vector<std::vector<std::size_t>> hits;
  std::size_t                           count = 0;

  // Gray-code walk: each step flips one member, so the running sum is O(1).
  const uint64_t end  = uint64_t{1} << n;
  uint64_t       mask = 0;
  int64_t        sum  = 0;
  for (uint64_t i = 1; i < end; ++i) {
    const auto bit = static_cast<std::size_t>(std::countr_zero(i));
    mask ^= uint64_t{1} << bit;
    sum += (mask >> bit) & 1U ? amounts[bit] : -amounts[bit];

    if (sum != target) continue;
    ++count;
    if (hits.size() < limit) {
      std::vector<std::size_t> members;
      for (std::size_t k = 0; k < n; ++k)
        if ((mask >> k) & 1U) members.push_back(k);
      hits.push_back(std::move(members));
    }
  }

  if (total) *total = count;
  return hits;
}

MatchOutcome CompositionMatcher::Run(MatchContext& ctx) {
  MatchOutcome outcome;
  const auto&  cfg = ctx.config;

  std::vector<graph::IdentityView> components;
  for (auto kind : {CANONICAL_KIND_CHARGE, CANONICAL_KIND_FEE, CANONICAL_KIND_REFUND}) {
    auto views = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, kind);
    components.insert(components.end(), std::make_move_iterator(views.begin()), std::make_move_iterator(views.end()));
  }

  std::unordered_map<std::string, const graph::IdentityView*> by_id;
  std::unordered_set<std::string>                             attached;
  for (const auto& c : components) {
    by_id[c.id()] = &c;
    if (!ctx.graph.Outgoing(ctx.tx, c.id(), EDGE_KIND_COMPOSED_OF).empty()) attached.insert(c.id());
  }

  // 1. explicit parent references
  for (const auto& c : components) {
    if (attached.contains(c.id()) || c.raw_events.empty()) continue;

    const auto parent = ParentPayoutId(c);
    if (parent.empty()) continue;

    auto payout = ctx.graph.repository()->FindIdentityByFingerprint(ctx.tx, ctx.tenant_id, fingerprint::FingerprintEngine::PayoutKey(c.provider(), parent));
    if (!payout) continue; // payout not ingested yet

    outcome.edges.push_back(ctx.graph.AddEdge(ctx.tx, ctx.tenant_id, c.id(), payout->id, EDGE_KIND_COMPOSED_OF, kExplicitWeight, std::string(Name()),
                                              "explicit payout reference " + parent, ctx.now_ms));
    attached.insert(c.id());
  }

  // 2. subset-sum over what is left
  for (const auto& payout : ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_PAYOUT)) {
    if (payout.raw_events.empty()) continue;

    const auto composed = ctx.graph.Incoming(ctx.tx, payout.id(), EDGE_KIND_COMPOSED_OF);
    int64_t    composed_sum = 0;
    for (const auto& edge : composed) {
      auto it = by_id.find(edge.from_identity_id);
      if (it != by_id.end()) composed_sum += it->second->amount_minor();
    }

    const int64_t gross     = payout.gross_amount_minor();
    const int64_t remaining = (gross != 0 ? gross : payout.amount_minor()) - composed_sum;
    if (remaining == 0) continue;

    const auto    provider = payout.provider();
    const int64_t upper    = payout.occurred_at_ms();
    const int64_t lower    = upper - cfg.composition_window_ms;

    std::vector<const graph::IdentityView*> pool;
    for (const auto& c : components) {
      if (attached.contains(c.id()) || c.raw_events.empty()) continue;
      if (c.provider() != provider) continue;
      if (c.occurred_at_ms() < lower || c.occurred_at_ms() > upper) continue;
      pool.push_back(&c);
    }

    if (pool.empty() && composed.empty()) {
      CASHGRAPH_LOG_DEBUG("no components reported for payout", {observability::StringField("payout", payout.id())});
      continue;
    }

    ExceptionContext context;
    context.set_subject_identity_id(payout.id());
    auto* detail = context.mutable_subsets();
    detail->set_target_minor(remaining);
    for (const auto* c : pool) detail->add_pool_identity_ids(c->id());

    if (pool.size() > cfg.max_subset_pool || pool.size() > kHardPoolLimit) {
      context.set_reason(fmt::format("candidate pool exceeds search limit ({} > {})", pool.size(), cfg.max_subset_pool));
      outcome.exceptions.push_back(
          ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_AMBIGUOUS_MATCH, SEVERITY_WARNING, context, ctx.now_ms));
      continue;
    }

    std::vector<int64_t> amounts;
    for (const auto* c : pool) amounts.push_back(c->amount_minor());

    std::size_t total   = 0;
    const auto  subsets = FindSubsets(amounts, remaining, std::max<std::size_t>(cfg.max_reported_subsets, 1), &total);

    if (total == 1) {
      for (auto idx : subsets.front()) {
        const auto* c = pool[idx];
        outcome.edges.push_back(ctx.graph.AddEdge(ctx.tx, ctx.tenant_id, c->id(), payout.id(), EDGE_KIND_COMPOSED_OF, kSubsetWeight, std::string(Name()),
                                                  fmt::format("unique subset of {} summing to {}", subsets.front().size(), remaining), ctx.now_ms));
        attached.insert(c->id());
      }
      continue;
    }

    for (const auto& subset : subsets) {
      auto*   candidate = detail->add_subsets();
      int64_t sum       = 0;
      for (auto idx : subset) {
        candidate->add_identity_ids(pool[idx]->id());
        sum += pool[idx]->amount_minor();
      }
      candidate->set_sum_minor(sum);
    }

    if (total > 1) {
      context.set_reason(fmt::format("{} component subsets sum to {}", total, remaining));
      outcome.exceptions.push_back(
          ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_AMBIGUOUS_MATCH, SEVERITY_WARNING, context, ctx.now_ms));
    } else {
      context.set_reason(fmt::format("no subset of {} components sums to {}", pool.size(), remaining));
      outcome.exceptions.push_back(ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_NO_MATCH, SEVERITY_WARNING, context, ctx.now_ms));
    }
  }

  return outcome;
}

} // namespace cashgraph::matching
