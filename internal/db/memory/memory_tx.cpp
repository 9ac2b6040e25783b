#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace cashgraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  AbandonIfOpen("memory");
}

void MemoryTransaction::CommitWrites() {
  if (!wrote_) return;

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::TransactionConflict("ledger state moved from version " + std::to_string(base_version_) + " to " +
                                    std::to_string(repo_.committed_version_) + " during this unit of work");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

void MemoryTransaction::DiscardWrites() {
  working_ = {};
}

} // namespace cashgraph::db::memory
