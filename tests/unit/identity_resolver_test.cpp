#include "internal/identity/identity_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace cashgraph::v1;
using cashgraph::db::memory::MemoryRepository;
using cashgraph::identity::IdentityResolver;
using cashgraph::identity::Resolution;
namespace t  = cashgraph::testing;
namespace db = cashgraph::db;

Resolution Ingest(const std::shared_ptr<MemoryRepository>& repo, IdentityResolver& resolver, const RawEvent& event, uint64_t now_ms) {
  auto record           = cashgraph::core::ToRecord(event);
  record.id             = cashgraph::util::NewId();
  record.ingested_at_ms = now_ms;

  auto tx = repo->Begin();
  db::ThrowIfDbError(repo->InsertRawEvent(*tx, record), "insert");
  auto resolution = resolver.Resolve(*tx, record, event.payload(), now_ms);
  tx->Commit();
  return resolution;
}

void TestTwoFeedsOneIdentity() {
  auto             repo = std::make_shared<MemoryRepository>();
  IdentityResolver resolver(repo);

  const auto day   = t::Date(2024, 3, 5, 9);
  const auto first = Ingest(repo, resolver, t::BankTxn("plaid-1", day, 95000, "STRIPE TRANSFER", "PLAID"), 1000);
  const auto again = Ingest(repo, resolver, t::BankTxn("csv-1", day, 95000, "Stripe", "BANK_CSV"), 2000);

  assert(first.identity_created);
  assert(!again.identity_created);
  assert(first.identity.id == again.identity.id);
  assert(again.identity.touched_at_ms == 2000);

  auto tx    = repo->Begin();
  auto links = repo->GetLinks(*tx, first.identity.id);
  assert(links.size() == 2);

  auto stored = repo->GetIdentity(*tx, first.identity.id);
  assert(stored && stored->touched_at_ms == 2000 && stored->created_at_ms == 1000);
  assert(stored->kind == CANONICAL_KIND_SETTLEMENT);
}

void TestPayoutReferenceJoinsPayout() {
  auto             repo = std::make_shared<MemoryRepository>();
  IdentityResolver resolver(repo);

  const auto day    = t::Date(2024, 3, 4);
  const auto payout = Ingest(repo, resolver, t::Payout("po_9", day, 12000, day), 10);
  const auto ref    = Ingest(repo, resolver, t::BalanceTxn("txn_9", "payout", day, -12000, "po_9"), 20);

  assert(payout.identity.id == ref.identity.id);
  assert(payout.identity.kind == CANONICAL_KIND_PAYOUT);
}

void TestDegradedLinkConfidence() {
  auto             repo = std::make_shared<MemoryRepository>();
  IdentityResolver resolver(repo);

  const auto res = Ingest(repo, resolver, t::BankTxn("b-1", t::Date(2024, 3, 5), 1000, "ACME", "PLAID", ""), 10);
  assert(res.link.confidence == cashgraph::fingerprint::FingerprintEngine::kDegradedConfidence);
  assert(res.link.reason.find("degraded") == 0);
}

void TestKindCollisionIsIntegrityViolation() {
  auto             repo = std::make_shared<MemoryRepository>();
  IdentityResolver resolver(repo);

  // plant an identity of the wrong kind under the payout key
  {
    db::model::IdentityRecord squatter;
    squatter.id          = "squatter";
    squatter.tenant_id   = t::kTenant;
    squatter.fingerprint = cashgraph::fingerprint::FingerprintEngine::PayoutKey("stripe", "po_1");
    squatter.kind        = CANONICAL_KIND_SETTLEMENT;

    bool created = false;
    auto tx      = repo->Begin();
    db::ThrowIfDbError(repo->InsertOrFetchIdentity(*tx, squatter, created), "plant");
    tx->Commit();
    assert(created);
  }

  bool threw = false;
  try {
    const auto day = t::Date(2024, 3, 4);
    (void)Ingest(repo, resolver, t::Payout("po_1", day, 1000, day), 10);
  } catch (const cashgraph::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "a fingerprint owned by another kind must be rejected");
}

void TestTenantsAreIsolated() {
  auto             repo = std::make_shared<MemoryRepository>();
  IdentityResolver resolver(repo);

  const auto day = t::Date(2024, 3, 5);
  auto       a   = t::BankTxn("b-1", day, 1000, "ACME");
  auto       b   = a;
  b.set_tenant_id("tenant-b");

  assert(Ingest(repo, resolver, a, 1).identity.id != Ingest(repo, resolver, b, 2).identity.id);
}

} // namespace

int main() {
  TestTwoFeedsOneIdentity();
  TestPayoutReferenceJoinsPayout();
  TestDegradedLinkConfidence();
  TestKindCollisionIsIntegrityViolation();
  TestTenantsAreIsolated();

  std::cout << "cashgraph_unit_identity_resolver: pass\n";
  return 0;
}
