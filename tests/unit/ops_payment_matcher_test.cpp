#include "internal/matching/ops_payment_matcher.hpp"

#include <cassert>
#include <iostream>

#include "internal/matching/similarity.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace cashgraph::v1;
using cashgraph::matching::OpsPaymentMatcher;
using cashgraph::testing::Date;
namespace t = cashgraph::testing;

void TestBigramDice() {
  using cashgraph::matching::BigramDice;
  assert(BigramDice("Jane Smith", "JANE SMITH") == 1.0);
  assert(BigramDice("", "JANE") == 0.0);
  assert(BigramDice("ACME", "GLOBEX") == 0.0);
  const double partial = BigramDice("Jon Smith", "John Smith");
  assert(partial > 0.6 && partial < 1.0);
}

void TestExplicitChargeReference() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  const auto charge  = h.Seed(t::BalanceTxn("ch_1", "charge", Date(2024, 3, 1), 50000));
  const auto payment = h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4), 50000, "paid", "Jane Smith", "ch_1"));

  auto outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.size() == 1);
  assert(outcome.edges.front().kind == EDGE_KIND_APPLIES_TO);
  assert(outcome.edges.front().from_identity_id == payment.id);
  assert(outcome.edges.front().to_identity_id == charge.id);
  assert(outcome.edges.front().weight == OpsPaymentMatcher::kExplicitWeight);

  outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.empty());
}

void TestExplicitReferenceWaitsForCharge() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  // a same-amount settlement is not a fallback for an unresolved reference
  h.Seed(t::BankTxn("b-1", Date(2024, 3, 4), 50000, "JANE SMITH"));
  const auto payment = h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4), 50000, "paid", "Jane Smith", "ch_later"));

  auto outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.empty() && outcome.exceptions.empty());

  const auto charge = h.Seed(t::BalanceTxn("ch_later", "charge", Date(2024, 3, 4), 50000));
  outcome           = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.size() == 1);
  assert(outcome.edges.front().to_identity_id == charge.id);
  assert(h.Outgoing(payment.id, EDGE_KIND_APPLIES_TO).size() == 1);
}

void TestNameMatchOnSettlement() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  const auto check   = h.Seed(t::BankTxn("b-1", Date(2024, 3, 4, 15), 25000, "JANE SMITH"));
  h.Seed(t::BankTxn("b-2", Date(2024, 3, 4, 15), 25000, "ACME SUPPLY", "PLAID", "acct-savings"));
  const auto payment = h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4, 9), 25000, "paid", "Jane Smith"));

  auto outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.exceptions.empty());
  assert(outcome.edges.size() == 1);
  assert(outcome.edges.front().from_identity_id == payment.id);
  assert(outcome.edges.front().to_identity_id == check.id);
  assert(outcome.edges.front().weight == 1.0);
}

void TestWeakNamesAreAmbiguous() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  h.Seed(t::BankTxn("b-1", Date(2024, 3, 4), 25000, "ACME SUPPLY"));
  const auto payment = h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4), 25000, "paid", "Jane Smith"));

  auto outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.empty());
  assert(outcome.exceptions.size() == 1);
  assert(outcome.exceptions.front().kind == EXCEPTION_KIND_AMBIGUOUS_MATCH);
  assert(outcome.exceptions.front().subject_identity_id == payment.id);
  assert(h.Context(outcome.exceptions.front()).match().candidates_size() == 1);
}

void TestTiedNamesAreAmbiguous() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  h.Seed(t::BankTxn("b-1", Date(2024, 3, 4), 25000, "JANE SMITH", "PLAID", "acct-checking"));
  h.Seed(t::BankTxn("b-2", Date(2024, 3, 4), 25000, "JANE SMITH", "PLAID", "acct-savings"));
  h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4), 25000, "paid", "Jane Smith"));

  auto outcome = h.Run(matcher, Date(2024, 3, 5));
  assert(outcome.edges.empty());
  assert(outcome.exceptions.size() == 1);
  assert(h.Context(outcome.exceptions.front()).match().candidates_size() == 2);
}

void TestOutsideWindowOrAmountIsIgnored() {
  t::GraphHarness   h;
  OpsPaymentMatcher matcher;

  h.Seed(t::BankTxn("b-late", Date(2024, 3, 7), 25000, "JANE SMITH"));
  h.Seed(t::BankTxn("b-off", Date(2024, 3, 4), 25001, "JANE SMITH"));
  h.Seed(t::OpsPayment("pay_1", Date(2024, 3, 4), 25000, "paid", "Jane Smith"));

  auto outcome = h.Run(matcher, Date(2024, 3, 8));
  assert(outcome.edges.empty() && outcome.exceptions.empty());
}

} // namespace

int main() {
  TestBigramDice();
  TestExplicitChargeReference();
  TestExplicitReferenceWaitsForCharge();
  TestNameMatchOnSettlement();
  TestWeakNamesAreAmbiguous();
  TestTiedNamesAreAmbiguous();
  TestOutsideWindowOrAmountIsIgnored();

  std::cout << "cashgraph_unit_ops_payment_matcher: pass\n";
  return 0;
}
