#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/model/exception_record.hpp"
#include "internal/db/model/identity_edge_record.hpp"
#include "internal/exceptions/exception_manager.hpp"
#include "internal/graph/identity_graph.hpp"
#include "matching_config.hpp"

namespace cashgraph::matching {

/*
  Everything a matcher may touch during one run. A run happens inside one
  transaction and never spans tenants.
*/
struct MatchContext {
  db::Transaction&              tx;
  std::string                   tenant_id;
  // wall-clock stamp for written rows
  uint64_t                      now_ms = 0;
  // evaluation time for aging rules
  int64_t                       as_of_ms = 0;
  const MatchingConfig&         config;
  graph::IdentityGraph&         graph;
  exceptions::ExceptionManager& exceptions;
};

struct MatchOutcome {
  std::vector<db::model::IdentityEdgeRecord> edges;
  std::vector<db::model::ExceptionRecord>    exceptions;

  void Merge(MatchOutcome&& other) {
    edges.insert(edges.end(), std::make_move_iterator(other.edges.begin()), std::make_move_iterator(other.edges.end()));
    exceptions.insert(exceptions.end(), std::make_move_iterator(other.exceptions.begin()), std::make_move_iterator(other.exceptions.end()));
  }
};

/*
  A matcher adds typed evidence (edges) to the identity graph, or raises an
  exception when the evidence is inconclusive. Matchers never write ledger
  rows and must be safe to re-run: a decided identity is skipped.
*/
class Matcher {
 public:
  virtual ~Matcher() = default;

  virtual std::string_view Name() const = 0;
  virtual MatchOutcome     Run(MatchContext& ctx) = 0;
};

} // namespace cashgraph::matching
