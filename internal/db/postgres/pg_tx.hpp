#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace cashgraph::db::postgres {

// Repeatable read: a consolidation pass sees one snapshot of the graph, and
// two servers booking the same identity surface as a serialization failure
// instead of a lost update.
using LedgerWork = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  LedgerWork& Work() {
    return *work_;
  }

 private:
  void CommitWrites() override;
  void DiscardWrites() override;

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<LedgerWork>       work_;
};

} // namespace cashgraph::db::postgres
