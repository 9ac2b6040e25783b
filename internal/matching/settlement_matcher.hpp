#pragma once

#include "matcher.hpp"

namespace cashgraph::matching {

/*
  Payout -> bank settlement.

  Candidates are unclaimed settlements with the payout's sign whose amount
  is within tolerance of the payout net and whose date is within the
  settlement window of the expected arrival.

    one candidate     SETTLES @1.0
    several           nearest date (0.9), then provider name similarity (0.8),
                      otherwise AMBIGUOUS_MATCH listing every candidate
    none              in transit; TIMING_DRIFT (INFO) when exactly one
                      candidate sits in the wider drift window, TIMING_DRIFT
                      (WARNING) once the payout is overdue
*/
class SettlementMatcher final : public Matcher {
 public:
  static constexpr double kSingleCandidateWeight = 1.0;
  static constexpr double kDateTieBreakWeight    = 0.9;
  static constexpr double kNameTieBreakWeight    = 0.8;

  std::string_view Name() const override {
    return "settlement";
  }

  MatchOutcome Run(MatchContext& ctx) override;
};

} // namespace cashgraph::matching
