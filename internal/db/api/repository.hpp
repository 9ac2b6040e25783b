#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/exception_record.hpp"
#include "internal/db/model/identity_edge_record.hpp"
#include "internal/db/model/identity_link_record.hpp"
#include "internal/db/model/identity_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/raw_event_record.hpp"

namespace cashgraph::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Unique constraints are enforced by the backend, never by
    read-then-write sequences in upper layers:
      raw_event    (tenant_id, source, kind, external_id)
      identity     (tenant_id, fingerprint)
      identity_link(raw_event_id)
      cash_ledger  (tenant_id, identity_id)

  The DB is the source of truth for:
    raw events
    the identity graph
    the ledger and the review queue
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Event store
  // ---------------------------------------------------------------------

  // AlreadyExists when the natural key is already stored.
  virtual Result InsertRawEvent(Transaction&, const model::RawEventRecord&) = 0;

  virtual std::optional<model::RawEventRecord> GetRawEvent(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::RawEventRecord> FindRawEvent(Transaction&, const std::string& tenant_id, const std::string& source,
                                                            cashgraph::v1::EventKind kind, const std::string& external_id) = 0;

  // Raw events of one kind carrying the given external id, any source.
  virtual std::vector<model::RawEventRecord> FindRawEventsByExternalId(Transaction&, const std::string& tenant_id, cashgraph::v1::EventKind kind,
                                                                       const std::string& external_id) = 0;

  // Raw events of one kind whose parent_external_id matches.
  virtual std::vector<model::RawEventRecord> FindRawEventsByParent(Transaction&, const std::string& tenant_id, cashgraph::v1::EventKind kind,
                                                                   const std::string& parent_external_id) = 0;

  // ---------------------------------------------------------------------
  // Identities
  // ---------------------------------------------------------------------

  // Atomic insert-or-fetch on (tenant_id, fingerprint). On return `record`
  // holds the stored row; `created` tells which branch was taken.
  virtual Result InsertOrFetchIdentity(Transaction&, model::IdentityRecord& record, bool& created) = 0;

  virtual std::optional<model::IdentityRecord> GetIdentity(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::IdentityRecord> FindIdentityByFingerprint(Transaction&, const std::string& tenant_id,
                                                                         const std::string& fingerprint) = 0;

  virtual std::vector<model::IdentityRecord> ListIdentities(Transaction&, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind) = 0;

  virtual std::vector<model::IdentityRecord> ListIdentitiesTouchedSince(Transaction&, const std::string& tenant_id, uint64_t since_ms) = 0;

  // touched_at_ms only ever moves forward.
  virtual Result TouchIdentity(Transaction&, const std::string& id, uint64_t touched_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  virtual Result InsertLink(Transaction&, const model::IdentityLinkRecord&) = 0;

  virtual std::vector<model::IdentityLinkRecord> GetLinks(Transaction&, const std::string& identity_id) = 0;

  // ---------------------------------------------------------------------
  // Edges
  // ---------------------------------------------------------------------

  virtual Result InsertEdge(Transaction&, const model::IdentityEdgeRecord&) = 0;

  virtual std::vector<model::IdentityEdgeRecord> GetOutgoingEdges(Transaction&, const std::string& identity_id) = 0;

  virtual std::vector<model::IdentityEdgeRecord> GetIncomingEdges(Transaction&, const std::string& identity_id) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  // AlreadyExists when the identity is already booked.
  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetLedgerEntryForIdentity(Transaction&, const std::string& tenant_id,
                                                                            const std::string& identity_id) = 0;

  // posted_at_ms in [from_ms, to_ms), ordered by posted time.
  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& tenant_id, int64_t from_ms, int64_t to_ms) = 0;

  // ---------------------------------------------------------------------
  // Exceptions
  // ---------------------------------------------------------------------

  virtual Result InsertException(Transaction&, const model::ExceptionRecord&) = 0;

  virtual Result UpdateException(Transaction&, const model::ExceptionRecord&) = 0;

  virtual std::optional<model::ExceptionRecord> GetException(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ExceptionRecord> FindOpenException(Transaction&, const std::string& tenant_id, const std::string& dedup_key) = 0;

  // ordered by creation time
  virtual std::vector<model::ExceptionRecord> ListExceptions(Transaction&, const model::ExceptionFilter& filter) = 0;
};

} // namespace cashgraph::db
