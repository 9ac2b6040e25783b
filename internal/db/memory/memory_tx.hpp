#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace cashgraph::db::memory {

// Works on a private copy of the ledger state. The copy replaces the
// repository state at commit unless another writer committed first.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void CommitWrites() override;
  void DiscardWrites() override;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  bool                    wrote_        = false;
};

} // namespace cashgraph::db::memory
