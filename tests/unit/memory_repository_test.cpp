#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace cashgraph::v1;
using cashgraph::db::ErrorCode;
using cashgraph::db::memory::MemoryRepository;
namespace model = cashgraph::db::model;

model::RawEventRecord MakeRaw(const std::string& id, const std::string& external_id) {
  model::RawEventRecord r;
  r.id             = id;
  r.tenant_id      = "t1";
  r.source         = "PLAID";
  r.kind           = EVENT_KIND_BANK_TXN;
  r.external_id    = external_id;
  r.occurred_at_ms = 1000;
  r.amount_minor   = 500;
  return r;
}

model::IdentityRecord MakeIdentity(const std::string& id, const std::string& fingerprint) {
  model::IdentityRecord r;
  r.id            = id;
  r.tenant_id     = "t1";
  r.fingerprint   = fingerprint;
  r.kind          = CANONICAL_KIND_SETTLEMENT;
  r.created_at_ms = 10;
  r.touched_at_ms = 10;
  return r;
}

void TestRawEventNaturalKey() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  assert(repo.InsertRawEvent(*tx, MakeRaw("r1", "ext-1")));
  auto dup = repo.InsertRawEvent(*tx, MakeRaw("r2", "ext-1"));
  assert(!dup && dup.code == ErrorCode::AlreadyExists);

  auto other_source   = MakeRaw("r3", "ext-1");
  other_source.source = "BANK_CSV";
  assert(repo.InsertRawEvent(*tx, other_source));

  tx->Commit();

  auto read = repo.Begin();
  assert(repo.FindRawEvent(*read, "t1", "PLAID", EVENT_KIND_BANK_TXN, "ext-1")->id == "r1");
  assert(repo.FindRawEventsByExternalId(*read, "t1", EVENT_KIND_BANK_TXN, "ext-1").size() == 2);
}

void TestUncommittedWritesInvisible() {
  MemoryRepository repo;

  auto writer = repo.Begin();
  assert(repo.InsertRawEvent(*writer, MakeRaw("r1", "ext-1")));
  assert(repo.GetRawEvent(*writer, "r1").has_value());

  auto reader = repo.Begin();
  assert(!repo.GetRawEvent(*reader, "r1").has_value());

  writer->Rollback();
  auto after = repo.Begin();
  assert(!repo.GetRawEvent(*after, "r1").has_value());
}

void TestDestructorRollsBack() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertRawEvent(*tx, MakeRaw("r1", "ext-1")));
  }
  auto tx = repo.Begin();
  assert(!repo.GetRawEvent(*tx, "r1").has_value());
}

void TestConcurrentCommitConflicts() {
  MemoryRepository repo;

  auto a = repo.Begin();
  auto b = repo.Begin();
  assert(repo.InsertRawEvent(*a, MakeRaw("r1", "ext-1")));
  assert(repo.InsertRawEvent(*b, MakeRaw("r2", "ext-1")));

  a->Commit();

  bool conflicted = false;
  try {
    b->Commit();
  } catch (const cashgraph::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted && "second writer on a stale snapshot must conflict");

  auto check = repo.Begin();
  assert(repo.FindRawEvent(*check, "t1", "PLAID", EVENT_KIND_BANK_TXN, "ext-1")->id == "r1");
}

void TestReadOnlyNeverConflicts() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  (void)repo.GetRawEvent(*reader, "missing");

  auto writer = repo.Begin();
  assert(repo.InsertRawEvent(*writer, MakeRaw("r1", "ext-1")));
  writer->Commit();

  reader->Commit();
  assert(reader->outcome() == cashgraph::db::Transaction::Outcome::Committed);
}

void TestFinishedTransactionRejectsFurtherUse() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  assert(repo.InsertRawEvent(*tx, MakeRaw("r1", "ext-1")));
  tx->Commit();

  bool threw = false;
  try {
    tx->Rollback();
  } catch (const cashgraph::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(tx->outcome() == cashgraph::db::Transaction::Outcome::Committed);
}

void TestIdentityInsertOrFetch() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  auto first   = MakeIdentity("i1", "fp");
  bool created = false;
  assert(repo.InsertOrFetchIdentity(*tx, first, created));
  assert(created);

  auto second = MakeIdentity("i2", "fp");
  assert(repo.InsertOrFetchIdentity(*tx, second, created));
  assert(!created);
  assert(second.id == "i1");

  assert(repo.TouchIdentity(*tx, "i1", 50));
  assert(repo.TouchIdentity(*tx, "i1", 20));
  assert(repo.GetIdentity(*tx, "i1")->touched_at_ms == 50 && "touched_at only moves forward");

  auto missing = repo.TouchIdentity(*tx, "nope", 60);
  assert(!missing && missing.code == ErrorCode::NotFound);

  assert(repo.ListIdentitiesTouchedSince(*tx, "t1", 50).size() == 1);
  assert(repo.ListIdentitiesTouchedSince(*tx, "t1", 51).empty());
}

void TestLedgerOnePerIdentity() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  model::LedgerEntryRecord entry;
  entry.id           = "l1";
  entry.tenant_id    = "t1";
  entry.identity_id  = "i1";
  entry.posted_at_ms = 300;
  assert(repo.InsertLedgerEntry(*tx, entry));

  entry.id  = "l2";
  auto dup  = repo.InsertLedgerEntry(*tx, entry);
  assert(!dup && dup.code == ErrorCode::AlreadyExists);

  entry.id           = "l3";
  entry.identity_id  = "i2";
  entry.posted_at_ms = 100;
  assert(repo.InsertLedgerEntry(*tx, entry));

  auto all = repo.ListLedgerEntries(*tx, "t1", 0, 1000);
  assert(all.size() == 2);
  assert(all[0].id == "l3" && all[1].id == "l1");

  assert(repo.ListLedgerEntries(*tx, "t1", 100, 300).size() == 1);
  assert(repo.GetLedgerEntryForIdentity(*tx, "t1", "i1")->id == "l1");
  assert(!repo.GetLedgerEntryForIdentity(*tx, "t2", "i1").has_value());
}

void TestOpenExceptionLookup() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  model::ExceptionRecord e;
  e.id        = "e1";
  e.tenant_id = "t1";
  e.kind      = EXCEPTION_KIND_NO_MATCH;
  e.dedup_key = "NO_MATCH:i1";
  assert(repo.InsertException(*tx, e));
  assert(repo.FindOpenException(*tx, "t1", "NO_MATCH:i1").has_value());

  e.status = EXCEPTION_STATUS_RESOLVED;
  assert(repo.UpdateException(*tx, e));
  assert(!repo.FindOpenException(*tx, "t1", "NO_MATCH:i1").has_value());

  model::ExceptionFilter filter;
  filter.tenant_id = "t1";
  filter.status    = EXCEPTION_STATUS_OPEN;
  assert(repo.ListExceptions(*tx, filter).empty());
  filter.status = EXCEPTION_STATUS_RESOLVED;
  assert(repo.ListExceptions(*tx, filter).size() == 1);

  e.id = "missing";
  assert(repo.UpdateException(*tx, e).code == ErrorCode::NotFound);
}

} // namespace

int main() {
  TestRawEventNaturalKey();
  TestUncommittedWritesInvisible();
  TestDestructorRollsBack();
  TestConcurrentCommitConflicts();
  TestReadOnlyNeverConflicts();
  TestFinishedTransactionRejectsFurtherUse();
  TestIdentityInsertOrFetch();
  TestLedgerOnePerIdentity();
  TestOpenExceptionLookup();

  std::cout << "cashgraph_unit_memory_repository: pass\n";
  return 0;
}
