#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "cashgraph/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/identity_graph.hpp"

namespace cashgraph::exceptions {

struct Resolution {
  db::model::ExceptionRecord                 exception;
  std::vector<db::model::IdentityEdgeRecord> written_edges;
};

/*
  ExceptionManager

  Review queue for everything the engine refuses to decide on its own.

  - Raise() is idempotent per (tenant, kind, subject identity) while the
    row is OPEN: re-raising refreshes context and updated_at, and can only
    raise severity.
  - Resolve() applies the reviewer's edges, closes the row and touches every
    identity the exception mentioned so the next consolidation sees them.
  - Nothing is ever auto-resolved or deleted.
*/
class ExceptionManager {
 public:
  ExceptionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::IdentityGraph> graph);

  db::model::ExceptionRecord Raise(db::Transaction& tx, const std::string& tenant_id, cashgraph::v1::ExceptionKind kind,
                                   cashgraph::v1::Severity severity, const cashgraph::v1::ExceptionContext& context, uint64_t now_ms);

  // Throws util::NotFound for unknown ids, util::InvalidState for non-open rows
  // and util::InvalidArgument for edges that do not fit their endpoints.
  Resolution Resolve(db::Transaction& tx, const std::string& exception_id, const std::vector<cashgraph::v1::ChosenEdge>& edges,
                     const std::string& note, uint64_t now_ms);

  // INFO timing-drift rows whose payout is more than `escalation_ms` past
  // its expected arrival at `as_of_ms` become WARNING.
  std::vector<db::model::ExceptionRecord> EscalateStale(db::Transaction& tx, const std::string& tenant_id, int64_t as_of_ms, int64_t escalation_ms,
                                                        uint64_t now_ms);

  // Identities named by OPEN ambiguity / timing exceptions about a payout.
  std::unordered_set<std::string> OpenPayoutCandidateIds(db::Transaction& tx, const std::string& tenant_id);

  // KIND:question:subject, where the question is the context's detail type.
  static std::string DedupKey(cashgraph::v1::ExceptionKind kind, const cashgraph::v1::ExceptionContext& context);

  // Every identity id mentioned by a context (subject included).
  static std::vector<std::string> MentionedIdentities(const cashgraph::v1::ExceptionContext& context);

 private:
  void ValidateEdge(db::Transaction& tx, const cashgraph::v1::ChosenEdge& edge, const std::string& tenant_id);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<graph::IdentityGraph> graph_;
};

} // namespace cashgraph::exceptions
