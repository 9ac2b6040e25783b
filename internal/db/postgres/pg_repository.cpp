#include "pg_repository.hpp"

#include "cashgraph/v1.hpp"

namespace cashgraph::db::postgres {

namespace {

constexpr const char* kRawEventColumns =
    "id,tenant_id,source,kind,external_id,occurred_at_ms,amount_minor,currency,"
    "account_ref,counterparty,parent_external_id,mcc,payload_json::text,ingested_at_ms";

constexpr const char* kIdentityColumns = "id,tenant_id,fingerprint,kind,created_at_ms,touched_at_ms";

constexpr const char* kLinkColumns = "id,tenant_id,identity_id,raw_event_id,confidence,reason,created_at_ms";

constexpr const char* kEdgeColumns = "id,tenant_id,from_identity_id,to_identity_id,kind,weight,matcher,reason,created_at_ms";

constexpr const char* kLedgerColumns =
    "id,tenant_id,identity_id,posted_at_ms,direction,amount_minor,currency,"
    "classification_key,confidence,provenance_json::text,created_at_ms";

constexpr const char* kExceptionColumns =
    "id,tenant_id,kind,status,severity,subject_identity_id,dedup_key,context_json::text,"
    "created_at_ms,updated_at_ms,resolved_at_ms,resolution_note";

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::RawEventRecord ReadRawEvent(const pqxx::row& row) {
  model::RawEventRecord r;
  r.id                 = Text(row[0]);
  r.tenant_id          = Text(row[1]);
  r.source             = Text(row[2]);
  r.kind               = static_cast<cashgraph::v1::EventKind>(row[3].as<int>());
  r.external_id        = Text(row[4]);
  r.occurred_at_ms     = row[5].as<int64_t>();
  r.amount_minor       = row[6].as<int64_t>();
  r.currency           = Text(row[7]);
  r.account_ref        = Text(row[8]);
  r.counterparty       = Text(row[9]);
  r.parent_external_id = Text(row[10]);
  r.mcc                = Text(row[11]);
  r.payload_json       = Text(row[12]);
  r.ingested_at_ms     = row[13].as<uint64_t>();
  return r;
}

model::IdentityRecord ReadIdentity(const pqxx::row& row) {
  model::IdentityRecord r;
  r.id            = Text(row[0]);
  r.tenant_id     = Text(row[1]);
  r.fingerprint   = Text(row[2]);
  r.kind          = static_cast<cashgraph::v1::CanonicalKind>(row[3].as<int>());
  r.created_at_ms = row[4].as<uint64_t>();
  r.touched_at_ms = row[5].as<uint64_t>();
  return r;
}

model::IdentityLinkRecord ReadLink(const pqxx::row& row) {
  model::IdentityLinkRecord r;
  r.id            = Text(row[0]);
  r.tenant_id     = Text(row[1]);
  r.identity_id   = Text(row[2]);
  r.raw_event_id  = Text(row[3]);
  r.confidence    = row[4].as<double>();
  r.reason        = Text(row[5]);
  r.created_at_ms = row[6].as<uint64_t>();
  return r;
}

model::IdentityEdgeRecord ReadEdge(const pqxx::row& row) {
  model::IdentityEdgeRecord r;
  r.id               = Text(row[0]);
  r.tenant_id        = Text(row[1]);
  r.from_identity_id = Text(row[2]);
  r.to_identity_id   = Text(row[3]);
  r.kind             = static_cast<cashgraph::v1::EdgeKind>(row[4].as<int>());
  r.weight           = row[5].as<double>();
  r.matcher          = Text(row[6]);
  r.reason           = Text(row[7]);
  r.created_at_ms    = row[8].as<uint64_t>();
  return r;
}

model::LedgerEntryRecord ReadLedgerEntry(const pqxx::row& row) {
  model::LedgerEntryRecord r;
  r.id                 = Text(row[0]);
  r.tenant_id          = Text(row[1]);
  r.identity_id        = Text(row[2]);
  r.posted_at_ms       = row[3].as<int64_t>();
  r.direction          = static_cast<cashgraph::v1::Direction>(row[4].as<int>());
  r.amount_minor       = row[5].as<int64_t>();
  r.currency           = Text(row[6]);
  r.classification_key = Text(row[7]);
  r.confidence         = row[8].as<double>();
  r.provenance_json    = Text(row[9]);
  r.created_at_ms      = row[10].as<uint64_t>();
  return r;
}

model::ExceptionRecord ReadException(const pqxx::row& row) {
  model::ExceptionRecord r;
  r.id                  = Text(row[0]);
  r.tenant_id           = Text(row[1]);
  r.kind                = static_cast<cashgraph::v1::ExceptionKind>(row[2].as<int>());
  r.status              = static_cast<cashgraph::v1::ExceptionStatus>(row[3].as<int>());
  r.severity            = static_cast<cashgraph::v1::Severity>(row[4].as<int>());
  r.subject_identity_id = Text(row[5]);
  r.dedup_key           = Text(row[6]);
  r.context_json        = Text(row[7]);
  r.created_at_ms       = row[8].as<uint64_t>();
  r.updated_at_ms       = row[9].as<uint64_t>();
  r.resolved_at_ms      = row[10].as<uint64_t>();
  r.resolution_note     = Text(row[11]);
  return r;
}

template <typename Record>
std::vector<Record> ReadAll(const pqxx::result& res, Record (*read)(const pqxx::row&)) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

template <typename Record>
std::optional<Record> ReadFirst(const pqxx::result& res, Record (*read)(const pqxx::row&)) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

std::string Select(const char* columns, const char* table, const std::string& where) {
  return std::string("SELECT ") + columns + " FROM " + table + " " + where;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Event store
// ------------------------------------------------------------------

Result PgRepository::InsertRawEvent(Transaction& t, const model::RawEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_raw_event", r.id, r.tenant_id, r.source, static_cast<int>(r.kind), r.external_id,
                                          r.occurred_at_ms, r.amount_minor, r.currency, r.account_ref, r.counterparty,
                                          r.parent_external_id, r.mcc, r.payload_json, r.ingested_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RawEventRecord> PgRepository::GetRawEvent(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_params(Select(kRawEventColumns, "raw_event", "WHERE id=$1;"), id), &ReadRawEvent);
}

std::optional<model::RawEventRecord> PgRepository::FindRawEvent(Transaction& t, const std::string& tenant_id, const std::string& source,
                                                                cashgraph::v1::EventKind kind, const std::string& external_id) {
  return ReadFirst(TX(t).Work().exec_params(Select(kRawEventColumns, "raw_event", "WHERE tenant_id=$1 AND source=$2 AND kind=$3 AND external_id=$4;"),
                                            tenant_id, source, static_cast<int>(kind), external_id),
                   &ReadRawEvent);
}

std::vector<model::RawEventRecord> PgRepository::FindRawEventsByExternalId(Transaction& t, const std::string& tenant_id,
                                                                           cashgraph::v1::EventKind kind, const std::string& external_id) {
  return ReadAll(TX(t).Work().exec_params(
                     Select(kRawEventColumns, "raw_event", "WHERE tenant_id=$1 AND kind=$2 AND external_id=$3 ORDER BY ingested_at_ms,id;"),
                     tenant_id, static_cast<int>(kind), external_id),
                 &ReadRawEvent);
}

std::vector<model::RawEventRecord> PgRepository::FindRawEventsByParent(Transaction& t, const std::string& tenant_id,
                                                                       cashgraph::v1::EventKind kind, const std::string& parent_external_id) {
  return ReadAll(TX(t).Work().exec_params(
                     Select(kRawEventColumns, "raw_event", "WHERE tenant_id=$1 AND kind=$2 AND parent_external_id=$3 ORDER BY ingested_at_ms,id;"),
                     tenant_id, static_cast<int>(kind), parent_external_id),
                 &ReadRawEvent);
}

// ------------------------------------------------------------------
// Identities
// ------------------------------------------------------------------

Result PgRepository::InsertOrFetchIdentity(Transaction& t, model::IdentityRecord& r, bool& created) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_identity_if_absent", r.id, r.tenant_id, r.fingerprint, static_cast<int>(r.kind),
                                          r.created_at_ms, r.touched_at_ms);
    created = res.affected_rows() == 1;
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (created) return Result::Ok();

  auto stored = FindIdentityByFingerprint(t, r.tenant_id, r.fingerprint);
  if (!stored) return Result::Err(ErrorCode::InternalError, "identity vanished after conflicting insert");
  r = *stored;
  return Result::Ok();
}

std::optional<model::IdentityRecord> PgRepository::GetIdentity(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_params(Select(kIdentityColumns, "identity", "WHERE id=$1;"), id), &ReadIdentity);
}

std::optional<model::IdentityRecord> PgRepository::FindIdentityByFingerprint(Transaction& t, const std::string& tenant_id,
                                                                             const std::string& fingerprint) {
  return ReadFirst(TX(t).Work().exec_params(Select(kIdentityColumns, "identity", "WHERE tenant_id=$1 AND fingerprint=$2;"), tenant_id, fingerprint),
                   &ReadIdentity);
}

std::vector<model::IdentityRecord> PgRepository::ListIdentities(Transaction& t, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind) {
  return ReadAll(TX(t).Work().exec_params(Select(kIdentityColumns, "identity", "WHERE tenant_id=$1 AND kind=$2 ORDER BY created_at_ms,id;"),
                                          tenant_id, static_cast<int>(kind)),
                 &ReadIdentity);
}

std::vector<model::IdentityRecord> PgRepository::ListIdentitiesTouchedSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
  return ReadAll(TX(t).Work().exec_params(Select(kIdentityColumns, "identity", "WHERE tenant_id=$1 AND touched_at_ms>=$2 ORDER BY created_at_ms,id;"),
                                          tenant_id, since_ms),
                 &ReadIdentity);
}

Result PgRepository::TouchIdentity(Transaction& t, const std::string& id, uint64_t touched_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_identity", id, touched_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Links / edges
// ------------------------------------------------------------------

Result PgRepository::InsertLink(Transaction& t, const model::IdentityLinkRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_link", r.id, r.tenant_id, r.identity_id, r.raw_event_id, r.confidence, r.reason, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::IdentityLinkRecord> PgRepository::GetLinks(Transaction& t, const std::string& identity_id) {
  return ReadAll(TX(t).Work().exec_params(Select(kLinkColumns, "identity_link", "WHERE identity_id=$1 ORDER BY created_at_ms,id;"), identity_id),
                 &ReadLink);
}

Result PgRepository::InsertEdge(Transaction& t, const model::IdentityEdgeRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_edge", r.id, r.tenant_id, r.from_identity_id, r.to_identity_id, static_cast<int>(r.kind), r.weight,
                               r.matcher, r.reason, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::IdentityEdgeRecord> PgRepository::GetOutgoingEdges(Transaction& t, const std::string& identity_id) {
  return ReadAll(TX(t).Work().exec_params(Select(kEdgeColumns, "identity_edge", "WHERE from_identity_id=$1 ORDER BY created_at_ms,id;"), identity_id),
                 &ReadEdge);
}

std::vector<model::IdentityEdgeRecord> PgRepository::GetIncomingEdges(Transaction& t, const std::string& identity_id) {
  return ReadAll(TX(t).Work().exec_params(Select(kEdgeColumns, "identity_edge", "WHERE to_identity_id=$1 ORDER BY created_at_ms,id;"), identity_id),
                 &ReadEdge);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_ledger_entry", r.id, r.tenant_id, r.identity_id, r.posted_at_ms, static_cast<int>(r.direction),
                                          r.amount_minor, r.currency, r.classification_key, r.confidence, r.provenance_json, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LedgerEntryRecord> PgRepository::GetLedgerEntryForIdentity(Transaction& t, const std::string& tenant_id,
                                                                                const std::string& identity_id) {
  return ReadFirst(TX(t).Work().exec_params(Select(kLedgerColumns, "cash_ledger", "WHERE tenant_id=$1 AND identity_id=$2;"), tenant_id, identity_id),
                   &ReadLedgerEntry);
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntries(Transaction& t, const std::string& tenant_id, int64_t from_ms, int64_t to_ms) {
  return ReadAll(TX(t).Work().exec_params(
                     Select(kLedgerColumns, "cash_ledger", "WHERE tenant_id=$1 AND posted_at_ms>=$2 AND posted_at_ms<$3 ORDER BY posted_at_ms,created_at_ms;"),
                     tenant_id, from_ms, to_ms),
                 &ReadLedgerEntry);
}

// ------------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------------

Result PgRepository::InsertException(Transaction& t, const model::ExceptionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_exception", r.id, r.tenant_id, static_cast<int>(r.kind), static_cast<int>(r.status),
                               static_cast<int>(r.severity), r.subject_identity_id, r.dedup_key, r.context_json, r.created_at_ms,
                               r.updated_at_ms, r.resolved_at_ms, r.resolution_note);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateException(Transaction& t, const model::ExceptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_exception", r.id, static_cast<int>(r.kind), static_cast<int>(r.status),
                                          static_cast<int>(r.severity), r.subject_identity_id, r.dedup_key, r.context_json,
                                          r.updated_at_ms, r.resolved_at_ms, r.resolution_note);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExceptionRecord> PgRepository::GetException(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_params(Select(kExceptionColumns, "recon_exception", "WHERE id=$1;"), id), &ReadException);
}

std::optional<model::ExceptionRecord> PgRepository::FindOpenException(Transaction& t, const std::string& tenant_id, const std::string& dedup_key) {
  return ReadFirst(TX(t).Work().exec_params(Select(kExceptionColumns, "recon_exception", "WHERE tenant_id=$1 AND dedup_key=$2 AND status=$3 LIMIT 1;"),
                                            tenant_id, dedup_key, static_cast<int>(cashgraph::v1::EXCEPTION_STATUS_OPEN)),
                   &ReadException);
}

std::vector<model::ExceptionRecord> PgRepository::ListExceptions(Transaction& t, const model::ExceptionFilter& filter) {
  // Negative values disable the optional filters.
  const int kind   = filter.kind.has_value() ? static_cast<int>(*filter.kind) : -1;
  const int status = filter.status.has_value() ? static_cast<int>(*filter.status) : -1;

  return ReadAll(TX(t).Work().exec_params(
                     Select(kExceptionColumns, "recon_exception",
                            "WHERE tenant_id=$1 AND ($2 < 0 OR kind=$2) AND ($3 < 0 OR status=$3) ORDER BY created_at_ms,id;"),
                     filter.tenant_id, kind, status),
                 &ReadException);
}

} // namespace cashgraph::db::postgres
