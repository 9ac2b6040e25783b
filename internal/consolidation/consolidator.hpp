#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/exceptions/exception_manager.hpp"
#include "internal/graph/identity_graph.hpp"

namespace cashgraph::consolidation {

struct ConsolidationResult {
  std::vector<db::model::LedgerEntryRecord> entries;
  std::vector<db::model::ExceptionRecord>   exceptions;
};

/*
  Consolidator

  Derives ledger rows from the identity graph. Only two things ever book:

    payout --SETTLES--> settlement   one entry for the payout, timed and
                                     sized by the settlement
    settlement (unclaimed)           one direct entry

  Each identity is handled in its own transaction: the existence check and
  the insert commit together, so a replay or a concurrent run books
  nothing twice. A failure on one identity raises a PROCESSING_FAILURE
  exception and the batch carries on.
*/
class Consolidator {
 public:
  Consolidator(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::IdentityGraph> graph,
               std::shared_ptr<exceptions::ExceptionManager> exceptions, uint32_t max_attempts);

  // Visits PAYOUT and SETTLEMENT identities touched at or after `since_ms`.
  ConsolidationResult Consolidate(const std::string& tenant_id, uint64_t since_ms, uint64_t now_ms);

 private:
  std::optional<db::model::LedgerEntryRecord> BookPayout(db::Transaction& tx, const graph::IdentityView& payout, uint64_t now_ms);
  std::optional<db::model::LedgerEntryRecord> BookSettlement(db::Transaction& tx, const graph::IdentityView& settlement,
                                                             const std::unordered_set<std::string>& deferred, uint64_t now_ms);

  // Insert, or nothing when a concurrent run got there first.
  bool Write(db::Transaction& tx, const db::model::LedgerEntryRecord& entry);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<graph::IdentityGraph>         graph_;
  std::shared_ptr<exceptions::ExceptionManager> exceptions_;
  uint32_t                                      max_attempts_;
};

} // namespace cashgraph::consolidation
