#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cashgraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRawEvent(Transaction&, const model::RawEventRecord&) override;
  std::optional<model::RawEventRecord> GetRawEvent(Transaction&, const std::string&) override;
  std::optional<model::RawEventRecord> FindRawEvent(Transaction&, const std::string& tenant_id, const std::string& source,
                                                    cashgraph::v1::EventKind kind, const std::string& external_id) override;
  std::vector<model::RawEventRecord> FindRawEventsByExternalId(Transaction&, const std::string& tenant_id, cashgraph::v1::EventKind kind,
                                                               const std::string& external_id) override;
  std::vector<model::RawEventRecord> FindRawEventsByParent(Transaction&, const std::string& tenant_id, cashgraph::v1::EventKind kind,
                                                           const std::string& parent_external_id) override;

  Result InsertOrFetchIdentity(Transaction&, model::IdentityRecord&, bool& created) override;
  std::optional<model::IdentityRecord> GetIdentity(Transaction&, const std::string&) override;
  std::optional<model::IdentityRecord> FindIdentityByFingerprint(Transaction&, const std::string& tenant_id, const std::string& fingerprint) override;
  std::vector<model::IdentityRecord> ListIdentities(Transaction&, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind) override;
  std::vector<model::IdentityRecord> ListIdentitiesTouchedSince(Transaction&, const std::string& tenant_id, uint64_t since_ms) override;
  Result TouchIdentity(Transaction&, const std::string& id, uint64_t touched_at_ms) override;

  Result InsertLink(Transaction&, const model::IdentityLinkRecord&) override;
  std::vector<model::IdentityLinkRecord> GetLinks(Transaction&, const std::string& identity_id) override;

  Result InsertEdge(Transaction&, const model::IdentityEdgeRecord&) override;
  std::vector<model::IdentityEdgeRecord> GetOutgoingEdges(Transaction&, const std::string& identity_id) override;
  std::vector<model::IdentityEdgeRecord> GetIncomingEdges(Transaction&, const std::string& identity_id) override;

  Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::optional<model::LedgerEntryRecord> GetLedgerEntryForIdentity(Transaction&, const std::string& tenant_id,
                                                                    const std::string& identity_id) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& tenant_id, int64_t from_ms, int64_t to_ms) override;

  Result InsertException(Transaction&, const model::ExceptionRecord&) override;
  Result UpdateException(Transaction&, const model::ExceptionRecord&) override;
  std::optional<model::ExceptionRecord> GetException(Transaction&, const std::string&) override;
  std::optional<model::ExceptionRecord> FindOpenException(Transaction&, const std::string& tenant_id, const std::string& dedup_key) override;
  std::vector<model::ExceptionRecord> ListExceptions(Transaction&, const model::ExceptionFilter&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RawEventRecord> raw_events;
    std::unordered_map<std::string, std::string> raw_event_keys; // natural key -> id

    std::unordered_map<std::string, model::IdentityRecord> identities;
    std::unordered_map<std::string, std::string> identity_fingerprints; // tenant#fp -> id

    std::vector<model::IdentityLinkRecord> links;
    std::vector<model::IdentityEdgeRecord> edges;

    std::vector<model::LedgerEntryRecord> ledger;
    std::unordered_map<std::string, std::size_t> ledger_by_identity; // tenant#identity -> index

    std::vector<model::ExceptionRecord> exceptions;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
