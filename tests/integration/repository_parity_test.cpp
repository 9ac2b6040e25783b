#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using cashgraph::db::ErrorCode;
using cashgraph::db::Repository;
using cashgraph::db::memory::MemoryRepository;
using cashgraph::db::model::ExceptionFilter;
using cashgraph::db::model::ExceptionRecord;
using cashgraph::db::model::IdentityEdgeRecord;
using cashgraph::db::model::IdentityLinkRecord;
using cashgraph::db::model::IdentityRecord;
using cashgraph::db::model::LedgerEntryRecord;
using cashgraph::db::model::RawEventRecord;
using namespace cashgraph::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

RawEventRecord RawEvent(const std::string& tenant, const std::string& id, const std::string& source, EventKind kind, const std::string& external_id) {
  return RawEventRecord{.id                 = id,
                        .tenant_id          = tenant,
                        .source             = source,
                        .kind               = kind,
                        .external_id        = external_id,
                        .occurred_at_ms     = 1'709'294'400'000,
                        .amount_minor       = 95000,
                        .currency           = "USD",
                        .account_ref        = "acct-checking",
                        .counterparty       = "STRIPE",
                        .parent_external_id = "",
                        .mcc                = "",
                        .payload_json       = R"({"schemaVersion":1})",
                        .ingested_at_ms     = NowMs()};
}

IdentityRecord Identity(const std::string& tenant, const std::string& id, const std::string& fingerprint, CanonicalKind kind) {
  return IdentityRecord{.id = id, .tenant_id = tenant, .fingerprint = fingerprint, .kind = kind, .created_at_ms = 1000, .touched_at_ms = 1000};
}

void VerifyRawEventNaturalKey(Repository& repo, const std::string& tenant) {
  auto tx = repo.Begin();

  assert(repo.InsertRawEvent(*tx, RawEvent(tenant, tenant + "-raw-1", "PLAID", EVENT_KIND_BANK_TXN, "b-1")));

  const auto duplicate = repo.InsertRawEvent(*tx, RawEvent(tenant, tenant + "-raw-2", "PLAID", EVENT_KIND_BANK_TXN, "b-1"));
  assert(!duplicate && duplicate.code == ErrorCode::AlreadyExists);

  // same external id from another source is a different observation
  assert(repo.InsertRawEvent(*tx, RawEvent(tenant, tenant + "-raw-3", "MX", EVENT_KIND_BANK_TXN, "b-1")));

  auto child               = RawEvent(tenant, tenant + "-raw-4", "STRIPE", EVENT_KIND_BALANCE_TXN, "fe_1");
  child.parent_external_id = "po_1";
  child.amount_minor       = -2000;
  assert(repo.InsertRawEvent(*tx, child));

  auto found = repo.FindRawEvent(*tx, tenant, "PLAID", EVENT_KIND_BANK_TXN, "b-1");
  assert(found.has_value());
  assert(found->id == tenant + "-raw-1");
  assert(found->amount_minor == 95000);
  assert(found->payload_json.find("schemaVersion") != std::string::npos);

  assert(repo.FindRawEventsByExternalId(*tx, tenant, EVENT_KIND_BANK_TXN, "b-1").size() == 2);
  assert(repo.FindRawEventsByExternalId(*tx, tenant, EVENT_KIND_PAYOUT, "b-1").empty());

  const auto children = repo.FindRawEventsByParent(*tx, tenant, EVENT_KIND_BALANCE_TXN, "po_1");
  assert(children.size() == 1);
  assert(children[0].amount_minor == -2000);

  assert(!repo.GetRawEvent(*tx, "missing").has_value());
  tx->Commit();
}

void VerifyIdentityGraph(Repository& repo, const std::string& tenant) {
  auto tx = repo.Begin();

  auto first   = Identity(tenant, tenant + "-id-1", "fp-settlement", CANONICAL_KIND_SETTLEMENT);
  bool created = false;
  assert(repo.InsertOrFetchIdentity(*tx, first, created));
  assert(created);

  // the losing insert adopts the stored row
  auto racer = Identity(tenant, tenant + "-id-racer", "fp-settlement", CANONICAL_KIND_SETTLEMENT);
  assert(repo.InsertOrFetchIdentity(*tx, racer, created));
  assert(!created);
  assert(racer.id == first.id);

  auto payout = Identity(tenant, tenant + "-id-2", "fp-payout", CANONICAL_KIND_PAYOUT);
  assert(repo.InsertOrFetchIdentity(*tx, payout, created) && created);

  assert(repo.TouchIdentity(*tx, first.id, 5000));
  assert(repo.TouchIdentity(*tx, first.id, 2000));
  assert(repo.GetIdentity(*tx, first.id)->touched_at_ms == 5000);
  assert(repo.TouchIdentity(*tx, "missing", 1).code == ErrorCode::NotFound);

  assert(repo.ListIdentities(*tx, tenant, CANONICAL_KIND_PAYOUT).size() == 1);
  const auto touched = repo.ListIdentitiesTouchedSince(*tx, tenant, 4000);
  assert(touched.size() == 1 && touched[0].id == first.id);
  assert(repo.FindIdentityByFingerprint(*tx, tenant, "fp-payout")->id == payout.id);

  assert(repo.InsertRawEvent(*tx, RawEvent(tenant, tenant + "-graph-raw", "PLAID", EVENT_KIND_BANK_TXN, "graph-b-1")));
  IdentityLinkRecord link{.id            = tenant + "-link-1",
                          .tenant_id     = tenant,
                          .identity_id   = first.id,
                          .raw_event_id  = tenant + "-graph-raw",
                          .confidence    = 0.5,
                          .reason        = "degraded: no account",
                          .created_at_ms = 1000};
  assert(repo.InsertLink(*tx, link));

  // a raw event is linked at most once
  link.id = tenant + "-link-2";
  assert(repo.InsertLink(*tx, link).code == ErrorCode::AlreadyExists);

  const auto links = repo.GetLinks(*tx, first.id);
  assert(links.size() == 1);
  assert(links[0].confidence == 0.5);
  assert(links[0].reason == "degraded: no account");

  IdentityEdgeRecord edge{.id               = tenant + "-edge-1",
                          .tenant_id        = tenant,
                          .from_identity_id = payout.id,
                          .to_identity_id   = first.id,
                          .kind             = EDGE_KIND_SETTLES,
                          .weight           = 0.9,
                          .matcher          = "settlement",
                          .reason           = "nearest date",
                          .created_at_ms    = 1000};
  assert(repo.InsertEdge(*tx, edge));

  const auto out = repo.GetOutgoingEdges(*tx, payout.id);
  assert(out.size() == 1);
  assert(out[0].kind == EDGE_KIND_SETTLES);
  assert(out[0].weight == 0.9);
  assert(out[0].matcher == "settlement");

  const auto in = repo.GetIncomingEdges(*tx, first.id);
  assert(in.size() == 1 && in[0].from_identity_id == payout.id);
  assert(repo.GetIncomingEdges(*tx, payout.id).empty());

  tx->Commit();
}

void VerifyLedger(Repository& repo, const std::string& tenant) {
  auto tx = repo.Begin();

  bool created = false;
  auto early   = Identity(tenant, tenant + "-ledger-id-1", "fp-ledger-1", CANONICAL_KIND_SETTLEMENT);
  auto late    = Identity(tenant, tenant + "-ledger-id-2", "fp-ledger-2", CANONICAL_KIND_SETTLEMENT);
  assert(repo.InsertOrFetchIdentity(*tx, early, created));
  assert(repo.InsertOrFetchIdentity(*tx, late, created));

  LedgerEntryRecord entry{.id                 = tenant + "-entry-late",
                          .tenant_id          = tenant,
                          .identity_id        = late.id,
                          .posted_at_ms       = 3000,
                          .direction          = DIRECTION_OUTFLOW,
                          .amount_minor       = -250000,
                          .currency           = "USD",
                          .classification_key = "",
                          .confidence         = 1.0,
                          .provenance_json    = R"({"schemaVersion":1})",
                          .created_at_ms      = NowMs()};
  assert(repo.InsertLedgerEntry(*tx, entry));

  entry.id          = tenant + "-entry-early";
  entry.identity_id = early.id;
  entry.posted_at_ms = 1000;
  entry.direction    = DIRECTION_INFLOW;
  entry.amount_minor = 95000;
  entry.confidence   = 0.8;
  assert(repo.InsertLedgerEntry(*tx, entry));

  // one entry per identity
  entry.id                = tenant + "-entry-again";
  const auto second_write = repo.InsertLedgerEntry(*tx, entry);
  assert(!second_write && second_write.code == ErrorCode::AlreadyExists);

  const auto all = repo.ListLedgerEntries(*tx, tenant, 0, 10000);
  assert(all.size() == 2);
  assert(all[0].identity_id == early.id && all[1].identity_id == late.id);
  assert(all[1].amount_minor == -250000);
  assert(all[1].direction == DIRECTION_OUTFLOW);

  assert(repo.ListLedgerEntries(*tx, tenant, 1001, 3000).empty());
  assert(repo.GetLedgerEntryForIdentity(*tx, tenant, early.id)->confidence == 0.8);
  assert(!repo.GetLedgerEntryForIdentity(*tx, "other-tenant", early.id).has_value());

  tx->Commit();
}

void VerifyExceptions(Repository& repo, const std::string& tenant) {
  auto tx = repo.Begin();

  ExceptionRecord record{.id                  = tenant + "-exc-1",
                         .tenant_id           = tenant,
                         .kind                = EXCEPTION_KIND_AMBIGUOUS_MATCH,
                         .status              = EXCEPTION_STATUS_OPEN,
                         .severity            = SEVERITY_WARNING,
                         .subject_identity_id = "payout-1",
                         .dedup_key           = "EXCEPTION_KIND_AMBIGUOUS_MATCH:match:payout-1",
                         .context_json        = R"({"schemaVersion":1,"subjectIdentityId":"payout-1"})",
                         .created_at_ms       = 100,
                         .updated_at_ms       = 100,
                         .resolved_at_ms      = 0,
                         .resolution_note     = ""};
  assert(repo.InsertException(*tx, record));

  auto ghost      = record;
  ghost.id        = tenant + "-exc-2";
  ghost.kind      = EXCEPTION_KIND_GHOST_RECORD;
  ghost.dedup_key = "EXCEPTION_KIND_GHOST_RECORD:ghost:invoice-1";
  ghost.created_at_ms = 200;
  assert(repo.InsertException(*tx, ghost));

  auto open = repo.FindOpenException(*tx, tenant, record.dedup_key);
  assert(open.has_value() && open->id == record.id);
  assert(open->context_json.find("payout-1") != std::string::npos);

  record.status          = EXCEPTION_STATUS_RESOLVED;
  record.resolved_at_ms  = 500;
  record.updated_at_ms   = 500;
  record.resolution_note = "confirmed";
  assert(repo.UpdateException(*tx, record));
  assert(!repo.FindOpenException(*tx, tenant, record.dedup_key).has_value());

  auto missing = record;
  missing.id   = "missing";
  assert(repo.UpdateException(*tx, missing).code == ErrorCode::NotFound);

  const auto stored = repo.GetException(*tx, record.id);
  assert(stored->status == EXCEPTION_STATUS_RESOLVED);
  assert(stored->resolved_at_ms == 500);
  assert(stored->resolution_note == "confirmed");

  ExceptionFilter filter{.tenant_id = tenant, .kind = std::nullopt, .status = std::nullopt};
  auto            listed = repo.ListExceptions(*tx, filter);
  assert(listed.size() == 2);
  assert(listed[0].id == record.id && listed[1].id == ghost.id);

  filter.status = EXCEPTION_STATUS_OPEN;
  listed        = repo.ListExceptions(*tx, filter);
  assert(listed.size() == 1 && listed[0].kind == EXCEPTION_KIND_GHOST_RECORD);

  filter.status = std::nullopt;
  filter.kind   = EXCEPTION_KIND_TIMING_DRIFT;
  assert(repo.ListExceptions(*tx, filter).empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& tenant) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRawEvent(*tx, RawEvent(tenant, tenant + "-rolled-back", "PLAID", EVENT_KIND_BANK_TXN, "rollback-1")));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetRawEvent(*check_tx, tenant + "-rolled-back").has_value());
  check_tx->Commit();
}

void VerifyConcurrentInsertOrFetch(Repository& repo, const std::string& tenant, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    // a second Begin() on the same connection from another thread blocks
    // rather than interleaving, so there is nothing to race here
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  bool created1 = false;
  bool created2 = false;
  auto a        = Identity(tenant, tenant + "-race-a", "fp-race", CANONICAL_KIND_CHARGE);
  auto b        = Identity(tenant, tenant + "-race-b", "fp-race", CANONICAL_KIND_CHARGE);

  assert(repo.InsertOrFetchIdentity(*tx1, a, created1) && created1);
  tx1->Commit();

  // the second writer either adopts the stored row or is refused at commit
  try {
    if (repo.InsertOrFetchIdentity(*tx2, b, created2)) {
      tx2->Commit();
      assert(!created2);
      assert(b.id == a.id);
    }
  } catch (const cashgraph::util::TransactionConflict&) {
  }

  auto verify_tx = repo.Begin();
  auto stored    = repo.FindIdentityByFingerprint(*verify_tx, tenant, "fp-race");
  assert(stored.has_value());
  assert(stored->id == a.id);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& tenant) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRawEvent(*tx, RawEvent(tenant, tenant + "-durable-raw", "PLAID", EVENT_KIND_BANK_TXN, "durable-1")));

    bool created  = false;
    auto identity = Identity(tenant, tenant + "-durable-id", "fp-durable", CANONICAL_KIND_SETTLEMENT);
    assert(repo->InsertOrFetchIdentity(*tx, identity, created));

    LedgerEntryRecord entry{.id                 = tenant + "-durable-entry",
                            .tenant_id          = tenant,
                            .identity_id        = identity.id,
                            .posted_at_ms       = 1000,
                            .direction          = DIRECTION_INFLOW,
                            .amount_minor       = 95000,
                            .currency           = "USD",
                            .classification_key = "",
                            .confidence         = 1.0,
                            .provenance_json    = R"({"schemaVersion":1})",
                            .created_at_ms      = NowMs()};
    assert(repo->InsertLedgerEntry(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetRawEvent(*tx, tenant + "-durable-raw").has_value());
  assert(repo->FindIdentityByFingerprint(*tx, tenant, "fp-durable").has_value());

  auto entry = repo->GetLedgerEntryForIdentity(*tx, tenant, tenant + "-durable-id");
  assert(entry.has_value());
  assert(entry->amount_minor == 95000);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if CASHGRAPH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("cashgraph_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    cashgraph::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return cashgraph::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if CASHGRAPH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CASHGRAPH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CASHGRAPH_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    cashgraph::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return cashgraph::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // tenants are unique per run so a shared postgres database can be reused
  const auto tenant = backend.name + "-" + std::to_string(NowMs());

  VerifyRawEventNaturalKey(*repo, tenant);
  VerifyIdentityGraph(*repo, tenant);
  VerifyLedger(*repo, tenant);
  VerifyExceptions(*repo, tenant);
  VerifyRollbackBehavior(*repo, tenant);
  VerifyConcurrentInsertOrFetch(*repo, tenant, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, tenant + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CASHGRAPH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CASHGRAPH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "cashgraph_integration_repository_parity: pass\n";
  return 0;
}
