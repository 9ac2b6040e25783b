#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace cashgraph::db::sqlite {

// Holds the shared connection for its whole lifetime and opens with
// BEGIN IMMEDIATE, so the ledger write lock is taken before the first
// natural-key lookup rather than at the first insert.
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::recursive_mutex& connection_mutex);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 private:
  void CommitWrites() override;
  void DiscardWrites() override;

  std::shared_ptr<SqliteDB>              db_;
  std::unique_lock<std::recursive_mutex> lock_;
};

} // namespace cashgraph::db::sqlite
