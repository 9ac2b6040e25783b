#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace cashgraph::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<LedgerWork>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  AbandonIfOpen("postgres");
}

void PgTransaction::CommitWrites() {
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(std::string("concurrent ledger update: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(std::string("ledger deadlock: ") + e.what());
  }
}

void PgTransaction::DiscardWrites() {
  work_->abort();
}

} // namespace cashgraph::db::postgres
