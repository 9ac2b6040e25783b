#pragma once

#include <cstdint>
#include <vector>

#include "matcher.hpp"

namespace cashgraph::matching {

/*
  Charge / fee / refund -> payout.

  1. Components that name their payout (parent reference) are attached
     with COMPOSED_OF @1.0.
  2. For the remaining gap (gross, or net when gross is unknown, minus the
     already composed parts) an exact subset-sum is searched over the
     unattached components of the same provider in the window before the
     payout. A unique subset is attached @0.95; several raise
     AMBIGUOUS_MATCH listing them; none raise NO_MATCH.

  Pools above max_subset_pool are not searched (AMBIGUOUS_MATCH).
*/
class CompositionMatcher final : public Matcher {
 public:
  static constexpr double kExplicitWeight = 1.0;
  static constexpr double kSubsetWeight   = 0.95;

  std::string_view Name() const override {
    return "composition";
  }

  MatchOutcome Run(MatchContext& ctx) override;

  // Index sets of `amounts` summing exactly to `target` (non-empty subsets
  // only). At most `limit` sets are returned; `total` receives the full count.
  static std::vector<std::vector<std::size_t>> FindSubsets(const std::vector<int64_t>& amounts, int64_t target, std::size_t limit,
                                                           std::size_t* total = nullptr);
};

} // namespace cashgraph::matching
