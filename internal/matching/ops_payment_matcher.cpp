#include "ops_payment_matcher.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <unordered_set>

#include <fmt/format.h>

#include "similarity.hpp"

namespace cashgraph::matching {

using namespace cashgraph::v1;

namespace {

struct Candidate {
  const graph::IdentityView* target     = nullptr;
  int64_t                    delta_ms   = 0;
  double                     similarity = 0.0;
};

std::string CustomerName(const graph::IdentityView& payment) {
  if (payment.payload.has_ops() && !payment.payload.ops().customer_name().empty()) return payment.payload.ops().customer_name();
  return payment.primary.counterparty;
}

} // namespace

MatchOutcome OpsPaymentMatcher::Run(MatchContext& ctx) {
  MatchOutcome outcome;
  const auto&  cfg = ctx.config;

  std::vector<graph::IdentityView> targets = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_CHARGE);
  {
    auto settlements = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_SETTLEMENT);
    targets.insert(targets.end(), std::make_move_iterator(settlements.begin()), std::make_move_iterator(settlements.end()));
  }

  std::unordered_set<std::string> applied;
  for (const auto& t : targets) {
    if (!ctx.graph.Incoming(ctx.tx, t.id(), EDGE_KIND_APPLIES_TO).empty()) applied.insert(t.id());
  }

  for (const auto& payment : ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_PAYMENT)) {
    if (payment.raw_events.empty()) continue;
    if (!ctx.graph.Outgoing(ctx.tx, payment.id(), EDGE_KIND_APPLIES_TO).empty()) continue;

    // explicit reference
    const auto& reference = payment.payload.has_ops() ? payment.payload.ops().charge_reference() : std::string{};
    if (!reference.empty()) {
      for (const auto& raw : ctx.graph.repository()->FindRawEventsByExternalId(ctx.tx, ctx.tenant_id, EVENT_KIND_BALANCE_TXN, reference)) {
        auto charge = ctx.graph.IdentityOf(ctx.tx, raw);
        if (!charge || charge->kind != CANONICAL_KIND_CHARGE) continue;

        outcome.edges.push_back(ctx.graph.AddEdge(ctx.tx, ctx.tenant_id, payment.id(), charge->id, EDGE_KIND_APPLIES_TO, kExplicitWeight,
                                                  std::string(Name()), "explicit charge reference " + reference, ctx.now_ms));
        applied.insert(charge->id);
        break;
      }
      // the referenced charge may simply not be ingested yet
      continue;
    }

    const auto customer = CustomerName(payment);

    std::vector<Candidate> candidates;
    for (const auto& t : targets) {
      if (applied.contains(t.id()) || t.raw_events.empty()) continue;
      if (t.amount_minor() != payment.amount_minor()) continue;

      const int64_t delta = t.occurred_at_ms() - payment.occurred_at_ms();
      if (std::llabs(delta) > cfg.ops_match_window_ms) continue;

      candidates.push_back({&t, delta, BigramDice(customer, t.primary.counterparty)});
    }
    if (candidates.empty()) continue;

    double best = 0.0;
    for (const auto& c : candidates) best = std::max(best, c.similarity);

    std::vector<const Candidate*> top;
    for (const auto& c : candidates)
      if (c.similarity == best) top.push_back(&c);

    if (best >= cfg.similarity_threshold && top.size() == 1) {
      const auto* winner = top.front();
      outcome.edges.push_back(ctx.graph.AddEdge(ctx.tx, ctx.tenant_id, payment.id(), winner->target->id(), EDGE_KIND_APPLIES_TO, best, std::string(Name()),
                                                fmt::format("amount match, name similarity {:.2f}", best), ctx.now_ms));
      applied.insert(winner->target->id());
      continue;
    }

    ExceptionContext context;
    context.set_subject_identity_id(payment.id());
    context.set_reason(best >= cfg.similarity_threshold ? fmt::format("{} candidates share the best name similarity {:.2f}", top.size(), best)
                                                        : fmt::format("no candidate name reaches similarity {:.2f}", cfg.similarity_threshold));
    for (const auto& c : candidates) {
      auto* score = context.mutable_match()->add_candidates();
      score->set_identity_id(c.target->id());
      score->set_score(c.similarity);
      score->set_similarity(c.similarity);
      score->set_amount_minor(c.target->amount_minor());
      score->set_delta_seconds(c.delta_ms / 1000);
    }
    outcome.exceptions.push_back(ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_AMBIGUOUS_MATCH, SEVERITY_WARNING, context, ctx.now_ms));
  }

  return outcome;
}

} // namespace cashgraph::matching
