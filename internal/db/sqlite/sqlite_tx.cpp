#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace cashgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::recursive_mutex& connection_mutex)
    : db_(std::move(db)), lock_(connection_mutex) {
  const int rc = sqlite3_exec(db_->Handle(), "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict(std::string("ledger database is locked: ") + sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("begin failed: ") + sqlite3_errmsg(db_->Handle()));
  }
}

SqliteTransaction::~SqliteTransaction() {
  AbandonIfOpen("sqlite");
}

void SqliteTransaction::CommitWrites() {
  const int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_OK) return;

  const std::string message = sqlite3_errmsg(db_->Handle());
  // COMMIT can fail without ending the transaction
  if (!sqlite3_get_autocommit(db_->Handle())) {
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict("ledger commit lost the write lock: " + message);
  }
  throw std::runtime_error("ledger commit failed: " + message);
}

void SqliteTransaction::DiscardWrites() {
  db_->Exec("ROLLBACK;");
}

} // namespace cashgraph::db::sqlite
