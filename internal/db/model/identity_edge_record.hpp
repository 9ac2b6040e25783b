#pragma once

#include <cstdint>
#include <string>

#include "cashgraph/v1.hpp"

namespace cashgraph::db::model {

/*
  Typed evidence between two identities.

    SETTLES      payout           ---> settlement
    COMPOSED_OF  charge/fee/refund ---> payout
    APPLIES_TO   ops payment      ---> charge | settlement

  Edges are additive. Review actions add new edges; nothing is deleted.
*/

struct IdentityEdgeRecord {
  std::string id;
  std::string tenant_id;
  std::string from_identity_id;
  std::string to_identity_id;

  cashgraph::v1::EdgeKind kind = cashgraph::v1::EDGE_KIND_UNSPECIFIED;

  double weight = 1.0;

  std::string matcher; // "settlement", "composition", "review", ...
  std::string reason;

  uint64_t created_at_ms = 0;
};

} // namespace cashgraph::db::model
