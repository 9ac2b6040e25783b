#pragma once

namespace cashgraph::db {

/*
  One unit of ledger work: an ingest batch, a consolidation pass over a
  tenant, or the resolution of a single exception.

  Every backend guarantees:
    - writes stay invisible to other units until Commit()
    - a unit that is destroyed while still open is rolled back
    - Commit() throws util::TransactionConflict when a concurrent unit
      claimed the same rows first; the whole unit is then rolled back
      and may be replayed (see RunInTransaction)
    - Commit()/Rollback() on a finished unit throw util::InvalidState

  Backends implement CommitWrites/DiscardWrites only; the outcome
  bookkeeping lives here.
*/
class Transaction {
 public:
  enum class Outcome { Open, Committed, RolledBack };

  virtual ~Transaction() = default;

  void Commit();
  void Rollback();

  Outcome outcome() const {
    return outcome_;
  }
  bool open() const {
    return outcome_ == Outcome::Open;
  }

 protected:
  virtual void CommitWrites()  = 0;
  virtual void DiscardWrites() = 0;

  // For backend destructors. Never throws; failures are logged.
  void AbandonIfOpen(const char* backend) noexcept;

 private:
  void RequireOpen(const char* action) const;

  Outcome outcome_ = Outcome::Open;
};

} // namespace cashgraph::db
