#include "ghost_detector.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <fmt/format.h>

#include "internal/util/time.hpp"

namespace cashgraph::matching {

using namespace cashgraph::v1;

namespace {

std::string SourceStatus(const graph::IdentityView& view) {
  std::string status = view.payload.has_ops() ? view.payload.ops().status() : std::string{};
  std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return status;
}

} // namespace

MatchOutcome GhostDetector::Run(MatchContext& ctx) {
  MatchOutcome outcome;
  const auto&  cfg = ctx.config;

  const auto payments = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_PAYMENT);
  const auto invoices = ctx.graph.LoadAll(ctx.tx, ctx.tenant_id, CANONICAL_KIND_INVOICE);

  std::unordered_map<std::string, bool>        corroborated;     // payment id -> has APPLIES_TO
  std::unordered_map<std::string, std::string> invoice_payments; // invoice external id -> corroborated payment id
  for (const auto& p : payments) {
    const bool applied   = !ctx.graph.Outgoing(ctx.tx, p.id(), EDGE_KIND_APPLIES_TO).empty();
    corroborated[p.id()] = applied;
    if (applied && p.payload.has_ops() && !p.payload.ops().invoice_reference().empty()) {
      invoice_payments[p.payload.ops().invoice_reference()] = p.id();
    }
  }

  auto flag = [&](const graph::IdentityView& view, const std::string& what) {
    ExceptionContext context;
    context.set_subject_identity_id(view.id());
    context.set_reason(fmt::format("{} marked paid {}d ago has no matching cash movement", what,
                                   (ctx.as_of_ms - view.occurred_at_ms()) / util::kMillisPerDay));
    auto* ghost = context.mutable_ghost();
    ghost->set_source_status(SourceStatus(view));
    *ghost->mutable_claimed_at() = util::MillisToProto(view.occurred_at_ms());
    outcome.exceptions.push_back(ctx.exceptions.Raise(ctx.tx, ctx.tenant_id, EXCEPTION_KIND_GHOST_RECORD, SEVERITY_WARNING, context, ctx.now_ms));
  };

  auto aged = [&](const graph::IdentityView& view) {
    return ctx.as_of_ms - view.occurred_at_ms() >= cfg.ghost_aging_ms;
  };

  for (const auto& p : payments) {
    if (p.raw_events.empty() || SourceStatus(p) != "paid" || !aged(p)) continue;
    if (corroborated[p.id()]) continue;
    flag(p, "ops payment " + p.primary.external_id);
  }

  for (const auto& inv : invoices) {
    if (inv.raw_events.empty() || SourceStatus(inv) != "paid" || !aged(inv)) continue;
    if (invoice_payments.contains(inv.primary.external_id)) continue;
    flag(inv, "invoice " + inv.primary.external_id);
  }

  return outcome;
}

} // namespace cashgraph::matching
