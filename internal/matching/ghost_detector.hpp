#pragma once

#include "matcher.hpp"

namespace cashgraph::matching {

/*
  Flags ops records that claim to be paid but have no cash evidence.

  A "paid" ops payment older than ghost_aging with no APPLIES_TO edge, or a
  "paid" invoice none of whose paying ops payments carries one, raises
  GHOST_RECORD. Writes no edges.
*/
class GhostDetector final : public Matcher {
 public:
  std::string_view Name() const override {
    return "ghost";
  }

  MatchOutcome Run(MatchContext& ctx) override;
};

} // namespace cashgraph::matching
