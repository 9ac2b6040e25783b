#include "settlement_matcher.hpp"

#include <algorithm>
#include <cstdlib>
#include <unordered_set>

#include <fmt/format.h>

#include "internal/fingerprint/fingerprint_engine.hpp"
#include "internal/util/time.hpp"
#include "similarity.hpp"

namespace cashgraph::matching {

using namespace cashgraph::v1;

namespace {

struct Candidate {
  const graph::IdentityView* settlement = nullptr;
  int64_t                    delta_ms   = 0; // settlement time - expected arrival
  double                     similarity = 0.0;
};

bool SameSign(int64_t a, int64_t b) {
  return (a > 0 && b > 0) || (a < 0 && b < 0);
}

std::vector<Candidate> CandidatesWithin(const graph::IdentityView& payout, const std::vector<graph::IdentityView>& settlements,
                                        const std::unordered_set<std::string>& claimed, int64_t window_ms, int64_t tolerance) {
  const int64_t net      = payout.amount_minor();
  const int64_t expected = payout.expected_arrival_ms();
  const auto    provider = payout.provider();

  std::vector<Candidate> out;
  for (const auto& s : settlements) {
    if (claimed.contains(s.id())) continue;
    if (!SameSign(s.amount_minor(), net)) continue;
    if (std::llabs(std::llabs(s.amount_minor()) - std::llabs(net)) > tolerance) continue;

    const int64_t delta = s.occurred_at_ms() - expected;
    if (std::llabs(delta) > window_ms) continue;

    Candidate c;
    c.settlement = &s;
    c.delta_ms   = delta;
    c.similarity = BigramDice(fingerprint::FingerprintEngine::NormalizeCounterparty(s.primary.counterparty), provider);
    out.push_back(c);
  }
  return out;
}

CandidateScore ToScore(const Candidate& c, int64_t window_ms) {
  CandidateScore score;
  score.set_identity_id(c.settlement->id());
  score.set_amount_minor(c.settlement->amount_minor());
  score.set_delta_seconds(c.delta_ms / 1000);
  score.set_similarity(c.similarity);
  score.set_score(window_ms > 0 ? std::max(0.0, 1.0 - static_cast<double>(std::llabs(c.delta_ms)) / static_cast<double>(window_ms)) : 0.0);
  return score;
}

} // namespace

MatchOutcome SettlementMatcher::Run(MatchContext& ctx) {
  MatchOutcome outcome;
  const auto&  cfg = ctx.config;

  const auto payouts     = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_PAYOUT);
  const auto settlements = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_SETTLEMENT);

  std::unordered_set<std::string> claimed;
  for (const auto& s : settlements) {
    if (!ctx.graph.Incoming(ctx.tx, s.id(), EDGE_KIND_SETTLES).empty()) claimed.insert(s.id());
  }

  for (const auto& payout : payouts) {
    if (payout.raw_events.empty() || payout.amount_minor() == 0) continue;
    if (!ctx.graph.Outgoing(ctx.tx, payout.id(), EDGE_KIND_SETTLES).empty()) continue;

    auto candidates = CandidatesWithin(payout, settlements, claimed, cfg.settlement_window_ms, cfg.amount_tolerance_minor);

    const Candidate* winner = nullptr;
    double           weight = 0.0;
    std::string      reason;

    if (candidates.size() == 1) {
      winner = &candidates.front();
      weight = kSingleCandidateWeight;
      reason = fmt::format("single settlement candidate, {}h from expected arrival", winner->delta_ms / util::kMillisPerHour);
    } else if (candidates.size() > 1) {
      int64_t nearest = std::llabs(candidates.front().delta_ms);
      for (const auto& c : candidates) nearest = std::min<int64_t>(nearest, std::llabs(c.delta_ms));

      std::vector<const Candidate*> closest;
      for (const auto& c : candidates)
        if (std::llabs(c.delta_ms) == nearest) closest.push_back(&c);

      if (closest.size() == 1) {
        winner = closest.front();
        weight = kDateTieBreakWeight;
        reason = fmt::format("nearest of {} settlement candidates by date", candidates.size());
      } else {
        double best = -1.0;
        for (const auto* c : closest) best = std::max(best, c->similarity);

        std::vector<const Candidate*> most_similar;
        for (const auto* c : closest)
          if (c->similarity == best) most_similar.push_back(c);

        if (most_similar.size() == 1 && best > 0.0) {
          winner = most_similar.front();
          weight = kNameTieBreakWeight;
          reason = fmt::format("date tie between {} candidates broken by counterparty similarity {:.2f}", closest.size(), best);
        }
      }

      if (!winner) {
        ExceptionContext context;
        context.set_subject_identity_id(payout.id());
        context.set_reason(fmt::format("{} settlement candidates cannot be told apart", candidates.size()));
        for (const auto& c : candidates) *context.mutable_match()->add_candidates() = ToScore(c, cfg.settlement_window_ms);
        outcome.exceptions.push_back(
            ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_AMBIGUOUS_MATCH, SEVERITY_WARNING, context, ctx.now_ms));
        continue;
      }
    }

    if (winner) {
      outcome.edges.push_back(ctx.graph.AddEdge(ctx.tx, ctx.tenant_id, payout.id(), winner->settlement->id(), EDGE_KIND_SETTLES, weight,
                                                std::string(Name()), reason, ctx.now_ms));
      claimed.insert(winner->settlement->id());
      continue;
    }

    // In transit. Look wider for a late or early bank credit.
    const auto drift   = CandidatesWithin(payout, settlements, claimed, cfg.drift_window_ms, cfg.amount_tolerance_minor);
    const auto overdue = ctx.as_of_ms - payout.expected_arrival_ms();

    const bool drifted  = drift.size() == 1;
    const bool aged_out = overdue > cfg.in_transit_aging_ms;
    if (!drifted && !aged_out) continue;

    ExceptionContext context;
    context.set_subject_identity_id(payout.id());
    auto* timing = context.mutable_timing();
    *timing->mutable_expected_at() = util::MillisToProto(payout.expected_arrival_ms());
    timing->set_age_seconds(std::max<int64_t>(0, overdue) / 1000);
    for (const auto& c : drift) *timing->add_candidates() = ToScore(c, cfg.drift_window_ms);

    if (aged_out) {
      context.set_reason(fmt::format("payout unsettled {}d after expected arrival", overdue / util::kMillisPerDay));
    } else {
      context.set_reason(fmt::format("only candidate settles {}h from expected arrival, outside the match window",
                                     drift.front().delta_ms / util::kMillisPerHour));
    }

    outcome.exceptions.push_back(ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_TIMING_DRIFT, aged_out ? SEVERITY_WARNING : SEVERITY_INFO,
                                                      context, ctx.now_ms));
  }

  return outcome;
}

} // namespace cashgraph::matching
