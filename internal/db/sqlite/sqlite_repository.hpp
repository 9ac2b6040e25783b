#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cashgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;
  std::recursive_mutex connection_mutex_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
