#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace cashgraph::db::memory {

namespace {

std::string NaturalKey(const std::string& tenant_id, const std::string& source, cashgraph::v1::EventKind kind, const std::string& external_id) {
  return tenant_id + "#" + source + "#" + std::to_string(static_cast<int>(kind)) + "#" + external_id;
}

std::string TenantKey(const std::string& tenant_id, const std::string& value) {
  return tenant_id + "#" + value;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Event store
// ------------------------------------------------------------------

Result MemoryRepository::InsertRawEvent(Transaction& t, const model::RawEventRecord& r) {
  const auto key = NaturalKey(r.tenant_id, r.source, r.kind, r.external_id);
  if (TX(t).View().raw_event_keys.contains(key)) return Result::Err(ErrorCode::AlreadyExists);

  auto& s = TX(t).Mutable();
  if (s.raw_events.contains(r.id)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate raw event id");
  s.raw_events[r.id]   = r;
  s.raw_event_keys[key] = r.id;
  return Result::Ok();
}

std::optional<model::RawEventRecord> MemoryRepository::GetRawEvent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.raw_events.find(id);
  if (it == s.raw_events.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RawEventRecord> MemoryRepository::FindRawEvent(Transaction& t, const std::string& tenant_id, const std::string& source,
                                                                    cashgraph::v1::EventKind kind, const std::string& external_id) {
  const auto& s  = TX(t).View();
  auto        it = s.raw_event_keys.find(NaturalKey(tenant_id, source, kind, external_id));
  if (it == s.raw_event_keys.end()) return std::nullopt;
  return s.raw_events.at(it->second);
}

std::vector<model::RawEventRecord> MemoryRepository::FindRawEventsByExternalId(Transaction& t, const std::string& tenant_id,
                                                                               cashgraph::v1::EventKind kind, const std::string& external_id) {
  std::vector<model::RawEventRecord> out;
  for (const auto& [_, r] : TX(t).View().raw_events)
    if (r.tenant_id == tenant_id && r.kind == kind && r.external_id == external_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ingested_at_ms < b.ingested_at_ms || (a.ingested_at_ms == b.ingested_at_ms && a.id < b.id); });
  return out;
}

std::vector<model::RawEventRecord> MemoryRepository::FindRawEventsByParent(Transaction& t, const std::string& tenant_id,
                                                                           cashgraph::v1::EventKind kind, const std::string& parent_external_id) {
  std::vector<model::RawEventRecord> out;
  for (const auto& [_, r] : TX(t).View().raw_events)
    if (r.tenant_id == tenant_id && r.kind == kind && r.parent_external_id == parent_external_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ingested_at_ms < b.ingested_at_ms || (a.ingested_at_ms == b.ingested_at_ms && a.id < b.id); });
  return out;
}

// ------------------------------------------------------------------
// Identities
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrFetchIdentity(Transaction& t, model::IdentityRecord& r, bool& created) {
  const auto key = TenantKey(r.tenant_id, r.fingerprint);
  const auto& view = TX(t).View();
  if (auto it = view.identity_fingerprints.find(key); it != view.identity_fingerprints.end()) {
    r       = view.identities.at(it->second);
    created = false;
    return Result::Ok();
  }

  auto& s = TX(t).Mutable();
  s.identities[r.id]           = r;
  s.identity_fingerprints[key] = r.id;
  created                      = true;
  return Result::Ok();
}

std::optional<model::IdentityRecord> MemoryRepository::GetIdentity(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.identities.find(id);
  if (it == s.identities.end()) return std::nullopt;
  return it->second;
}

std::optional<model::IdentityRecord> MemoryRepository::FindIdentityByFingerprint(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& fingerprint) {
  const auto& s  = TX(t).View();
  auto        it = s.identity_fingerprints.find(TenantKey(tenant_id, fingerprint));
  if (it == s.identity_fingerprints.end()) return std::nullopt;
  return s.identities.at(it->second);
}

std::vector<model::IdentityRecord> MemoryRepository::ListIdentities(Transaction& t, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind) {
  std::vector<model::IdentityRecord> out;
  for (const auto& [_, r] : TX(t).View().identities)
    if (r.tenant_id == tenant_id && r.kind == kind) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms || (a.created_at_ms == b.created_at_ms && a.id < b.id); });
  return out;
}

std::vector<model::IdentityRecord> MemoryRepository::ListIdentitiesTouchedSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  std::vector<model::IdentityRecord> out;
  for (const auto& [_, r] : TX(t).View().identities)
    if (r.tenant_id == tenant_id && r.touched_at_ms >= since_ms) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms || (a.created_at_ms == b.created_at_ms && a.id < b.id); });
  return out;
}

Result MemoryRepository::TouchIdentity(Transaction& t, const std::string& id, uint64_t touched_at_ms) {
  if (!TX(t).View().identities.contains(id)) return Result::Err(ErrorCode::NotFound);
  auto& r         = TX(t).Mutable().identities[id];
  r.touched_at_ms = std::max(r.touched_at_ms, touched_at_ms);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Links / edges
// ------------------------------------------------------------------

Result MemoryRepository::InsertLink(Transaction& t, const model::IdentityLinkRecord& r) {
  for (const auto& l : TX(t).View().links)
    if (l.raw_event_id == r.raw_event_id) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().links.push_back(r);
  return Result::Ok();
}

std::vector<model::IdentityLinkRecord> MemoryRepository::GetLinks(Transaction& t, const std::string& identity_id) {
  std::vector<model::IdentityLinkRecord> out;
  for (const auto& l : TX(t).View().links)
    if (l.identity_id == identity_id) out.push_back(l);
  return out;
}

Result MemoryRepository::InsertEdge(Transaction& t, const model::IdentityEdgeRecord& r) {
  TX(t).Mutable().edges.push_back(r);
  return Result::Ok();
}

std::vector<model::IdentityEdgeRecord> MemoryRepository::GetOutgoingEdges(Transaction& t, const std::string& identity_id) {
  std::vector<model::IdentityEdgeRecord> out;
  for (const auto& e : TX(t).View().edges)
    if (e.from_identity_id == identity_id) out.push_back(e);
  return out;
}

std::vector<model::IdentityEdgeRecord> MemoryRepository::GetIncomingEdges(Transaction& t, const std::string& identity_id) {
  std::vector<model::IdentityEdgeRecord> out;
  for (const auto& e : TX(t).View().edges)
    if (e.to_identity_id == identity_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  const auto key = TenantKey(r.tenant_id, r.identity_id);
  if (TX(t).View().ledger_by_identity.contains(key)) return Result::Err(ErrorCode::AlreadyExists);

  auto& s = TX(t).Mutable();
  s.ledger_by_identity[key] = s.ledger.size();
  s.ledger.push_back(r);
  return Result::Ok();
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetLedgerEntryForIdentity(Transaction& t, const std::string& tenant_id,
                                                                                    const std::string& identity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_by_identity.find(TenantKey(tenant_id, identity_id));
  if (it == s.ledger_by_identity.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const std::string& tenant_id, int64_t from_ms, int64_t to_ms) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.tenant_id == tenant_id && e.posted_at_ms >= from_ms && e.posted_at_ms < to_ms) out.push_back(e);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.posted_at_ms < b.posted_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------------

Result MemoryRepository::InsertException(Transaction& t, const model::ExceptionRecord& r) {
  for (const auto& e : TX(t).View().exceptions)
    if (e.id == r.id) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().exceptions.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::UpdateException(Transaction& t, const model::ExceptionRecord& r) {
  auto& s = TX(t).Mutable();
  for (auto& e : s.exceptions) {
    if (e.id == r.id) {
      e = r;
      return Result::Ok();
    }
  }
  return Result::Err(ErrorCode::NotFound);
}

std::optional<model::ExceptionRecord> MemoryRepository::GetException(Transaction& t, const std::string& id) {
  for (const auto& e : TX(t).View().exceptions)
    if (e.id == id) return e;
  return std::nullopt;
}

std::optional<model::ExceptionRecord> MemoryRepository::FindOpenException(Transaction& t, const std::string& tenant_id, const std::string& dedup_key) {
  for (const auto& e : TX(t).View().exceptions)
    if (e.tenant_id == tenant_id && e.dedup_key == dedup_key && e.status == cashgraph::v1::EXCEPTION_STATUS_OPEN) return e;
  return std::nullopt;
}

std::vector<model::ExceptionRecord> MemoryRepository::ListExceptions(Transaction& t, const model::ExceptionFilter& filter) {
  std::vector<model::ExceptionRecord> out;
  for (const auto& e : TX(t).View().exceptions) {
    if (e.tenant_id != filter.tenant_id) continue;
    if (filter.kind.has_value() && e.kind != *filter.kind) continue;
    if (filter.status.has_value() && e.status != *filter.status) continue;
    out.push_back(e);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

} // namespace cashgraph::db::memory
