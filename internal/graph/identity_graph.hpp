#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cashgraph/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace cashgraph::graph {

/*
  An identity with its linked raw events.

  `primary` is the raw event whose kind is native to the identity (the
  PAYOUT record for a payout, the bank record for a settlement); when none
  is linked the earliest linked event stands in. Derived fields read from it.
*/
struct IdentityView {
  db::model::IdentityRecord                  identity;
  std::vector<db::model::IdentityLinkRecord> links;
  std::vector<db::model::RawEventRecord>     raw_events;

  db::model::RawEventRecord  primary;
  cashgraph::v1::RawPayload  payload;

  const std::string& id() const {
    return identity.id;
  }
  cashgraph::v1::CanonicalKind kind() const {
    return identity.kind;
  }
  int64_t amount_minor() const {
    return primary.amount_minor;
  }
  int64_t occurred_at_ms() const {
    return primary.occurred_at_ms;
  }

  // Normalised processor/provider name ("STRIPE").
  std::string provider() const;

  // Payouts: arrival date when reported, else occurred-at.
  int64_t expected_arrival_ms() const;

  // Payouts: reported gross, 0 when unknown.
  int64_t gross_amount_minor() const;

  // Lowest link confidence; degraded fingerprints pull this below 1.
  double confidence() const;
};

struct ProvenanceGraph {
  std::vector<db::model::IdentityRecord>     identities; // excludes the root
  std::vector<db::model::IdentityEdgeRecord> edges;
};

/*
  IdentityGraph

  Typed-edge view over the repository. All calls run inside the caller's
  transaction. Writing an edge bumps touched_at on both endpoints so the
  consolidator picks them up.
*/
class IdentityGraph {
 public:
  explicit IdentityGraph(std::shared_ptr<db::Repository> repository);

  db::model::IdentityEdgeRecord AddEdge(db::Transaction& tx, const std::string& tenant_id, const std::string& from_id, const std::string& to_id,
                                        cashgraph::v1::EdgeKind kind, double weight, const std::string& matcher, const std::string& reason,
                                        uint64_t now_ms);

  std::vector<db::model::IdentityEdgeRecord> Outgoing(db::Transaction& tx, const std::string& identity_id, cashgraph::v1::EdgeKind kind);
  std::vector<db::model::IdentityEdgeRecord> Incoming(db::Transaction& tx, const std::string& identity_id, cashgraph::v1::EdgeKind kind);

  std::optional<IdentityView> Load(db::Transaction& tx, const std::string& identity_id);
  std::vector<IdentityView>   LoadAll(db::Transaction& tx, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind);

  // Identity a stored raw event resolved to (its fingerprint is recomputed).
  std::optional<db::model::IdentityRecord> IdentityOf(db::Transaction& tx, const db::model::RawEventRecord& raw);

  // Breadth-first walk over edges in both directions. max_depth 0 = unlimited.
  ProvenanceGraph Traverse(db::Transaction& tx, const std::string& root_id, uint32_t max_depth);

  const std::shared_ptr<db::Repository>& repository() const {
    return repository_;
  }

 private:
  IdentityView BuildView(db::Transaction& tx, db::model::IdentityRecord identity);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace cashgraph::graph
