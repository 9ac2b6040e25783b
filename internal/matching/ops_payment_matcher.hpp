#pragma once

#include "matcher.hpp"

namespace cashgraph::matching {

/*
  Ops payment -> processor charge (or bank settlement for checks and
  direct transfers).

  An explicit charge reference wins (APPLIES_TO @1.0). Otherwise candidates
  must have the same amount and fall within ops_match_window; the best
  customer-name similarity at or above similarity_threshold wins with the
  similarity as weight. Ties at the top, or only weak names, raise
  AMBIGUOUS_MATCH.
*/
class OpsPaymentMatcher final : public Matcher {
 public:
  static constexpr double kExplicitWeight = 1.0;

  std::string_view Name() const override {
    return "ops_payment";
  }

  MatchOutcome Run(MatchContext& ctx) override;
};

} // namespace cashgraph::matching
