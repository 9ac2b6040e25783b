#include "transaction.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cashgraph::db {

void Transaction::RequireOpen(const char* action) const {
  if (outcome_ != Outcome::Open) {
    throw util::InvalidState(std::string(action) + " on a finished transaction");
  }
}

void Transaction::Commit() {
  RequireOpen("commit");
  try {
    CommitWrites();
  } catch (...) {
    // a failed commit leaves nothing behind in any backend
    outcome_ = Outcome::RolledBack;
    throw;
  }
  outcome_ = Outcome::Committed;
}

void Transaction::Rollback() {
  RequireOpen("rollback");
  outcome_ = Outcome::RolledBack;
  DiscardWrites();
}

void Transaction::AbandonIfOpen(const char* backend) noexcept {
  if (outcome_ != Outcome::Open) return;
  outcome_ = Outcome::RolledBack;
  try {
    DiscardWrites();
  } catch (const std::exception& e) {
    CASHGRAPH_LOG_WARN("abandoned transaction rollback failed",
                       {observability::StringField("backend", backend), observability::StringField("error", e.what())});
  }
}

} // namespace cashgraph::db
