#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <functional>

#include "internal/db/sql/sql_queries.hpp"

namespace cashgraph::db::sqlite {

using cashgraph::db::ErrorCode;
using cashgraph::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

model::RawEventRecord ReadRawEvent(sqlite3_stmt* st) {
  model::RawEventRecord r;
  r.id                 = ColText(st, 0);
  r.tenant_id          = ColText(st, 1);
  r.source             = ColText(st, 2);
  r.kind               = static_cast<cashgraph::v1::EventKind>(ColI32(st, 3));
  r.external_id        = ColText(st, 4);
  r.occurred_at_ms     = ColI64(st, 5);
  r.amount_minor       = ColI64(st, 6);
  r.currency           = ColText(st, 7);
  r.account_ref        = ColText(st, 8);
  r.counterparty       = ColText(st, 9);
  r.parent_external_id = ColText(st, 10);
  r.mcc                = ColText(st, 11);
  r.payload_json       = ColText(st, 12);
  r.ingested_at_ms     = ColU64(st, 13);
  return r;
}

model::IdentityRecord ReadIdentity(sqlite3_stmt* st) {
  model::IdentityRecord r;
  r.id            = ColText(st, 0);
  r.tenant_id     = ColText(st, 1);
  r.fingerprint   = ColText(st, 2);
  r.kind          = static_cast<cashgraph::v1::CanonicalKind>(ColI32(st, 3));
  r.created_at_ms = ColU64(st, 4);
  r.touched_at_ms = ColU64(st, 5);
  return r;
}

model::IdentityLinkRecord ReadLink(sqlite3_stmt* st) {
  model::IdentityLinkRecord r;
  r.id            = ColText(st, 0);
  r.tenant_id     = ColText(st, 1);
  r.identity_id   = ColText(st, 2);
  r.raw_event_id  = ColText(st, 3);
  r.confidence    = ColDouble(st, 4);
  r.reason        = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::IdentityEdgeRecord ReadEdge(sqlite3_stmt* st) {
  model::IdentityEdgeRecord r;
  r.id               = ColText(st, 0);
  r.tenant_id        = ColText(st, 1);
  r.from_identity_id = ColText(st, 2);
  r.to_identity_id   = ColText(st, 3);
  r.kind             = static_cast<cashgraph::v1::EdgeKind>(ColI32(st, 4));
  r.weight           = ColDouble(st, 5);
  r.matcher          = ColText(st, 6);
  r.reason           = ColText(st, 7);
  r.created_at_ms    = ColU64(st, 8);
  return r;
}

model::LedgerEntryRecord ReadLedgerEntry(sqlite3_stmt* st) {
  model::LedgerEntryRecord r;
  r.id                 = ColText(st, 0);
  r.tenant_id          = ColText(st, 1);
  r.identity_id        = ColText(st, 2);
  r.posted_at_ms       = ColI64(st, 3);
  r.direction          = static_cast<cashgraph::v1::Direction>(ColI32(st, 4));
  r.amount_minor       = ColI64(st, 5);
  r.currency           = ColText(st, 6);
  r.classification_key = ColText(st, 7);
  r.confidence         = ColDouble(st, 8);
  r.provenance_json    = ColText(st, 9);
  r.created_at_ms      = ColU64(st, 10);
  return r;
}

model::ExceptionRecord ReadException(sqlite3_stmt* st) {
  model::ExceptionRecord r;
  r.id                  = ColText(st, 0);
  r.tenant_id           = ColText(st, 1);
  r.kind                = static_cast<cashgraph::v1::ExceptionKind>(ColI32(st, 2));
  r.status              = static_cast<cashgraph::v1::ExceptionStatus>(ColI32(st, 3));
  r.severity            = static_cast<cashgraph::v1::Severity>(ColI32(st, 4));
  r.subject_identity_id = ColText(st, 5);
  r.dedup_key           = ColText(st, 6);
  r.context_json        = ColText(st, 7);
  r.created_at_ms       = ColU64(st, 8);
  r.updated_at_ms       = ColU64(st, 9);
  r.resolved_at_ms      = ColU64(st, 10);
  r.resolution_note     = ColText(st, 11);
  return r;
}

template <typename Record>
std::vector<Record> QueryAll(sqlite3* db, const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind,
                             Record (*read)(sqlite3_stmt*)) {
  std::vector<Record> out;
  Statement           st(db, sql);
  if (!st) return out;

  bind(st.get());
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(read(st.get()));
  }
  return out;
}

template <typename Record>
std::optional<Record> QueryOne(sqlite3* db, const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind,
                               Record (*read)(sqlite3_stmt*)) {
  Statement st(db, sql);
  if (!st) return std::nullopt;

  bind(st.get());
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return read(st.get());
}

std::string Select(const char* columns, const char* table, const std::string& where) {
  return std::string("SELECT ") + columns + " FROM " + table + " " + where;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, connection_mutex_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Event store
// ------------------------------------------------------------------

Result SqliteRepository::InsertRawEvent(Transaction& t, const model::RawEventRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_RAW_EVENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.source);
    BindI32(st.get(), 4, static_cast<int>(r.kind));
    BindText(st.get(), 5, r.external_id);
    BindI64(st.get(), 6, r.occurred_at_ms);
    BindI64(st.get(), 7, r.amount_minor);
    BindText(st.get(), 8, r.currency);
    BindText(st.get(), 9, r.account_ref);
    BindText(st.get(), 10, r.counterparty);
    BindText(st.get(), 11, r.parent_external_id);
    BindText(st.get(), 12, r.mcc);
    BindText(st.get(), 13, r.payload_json);
    BindU64(st.get(), 14, r.ingested_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // ON CONFLICT DO NOTHING: zero changes means the natural key exists
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
}

std::optional<model::RawEventRecord> SqliteRepository::GetRawEvent(Transaction& t, const std::string& id) {
    return QueryOne<model::RawEventRecord>(
        TX(t).Handle(), std::string("SELECT ") + sql::RAW_EVENT_COLUMNS + sql::SELECT_RAW_EVENT_BY_ID_WHERE,
        [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadRawEvent);
}

std::optional<model::RawEventRecord> SqliteRepository::FindRawEvent(Transaction& t, const std::string& tenant_id, const std::string& source,
                                                                    cashgraph::v1::EventKind kind, const std::string& external_id) {
    return QueryOne<model::RawEventRecord>(
        TX(t).Handle(), std::string("SELECT ") + sql::RAW_EVENT_COLUMNS + sql::SELECT_RAW_EVENT_BY_KEY_WHERE,
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindText(st, 2, source);
            BindI32(st, 3, static_cast<int>(kind));
            BindText(st, 4, external_id);
        },
        &ReadRawEvent);
}

std::vector<model::RawEventRecord> SqliteRepository::FindRawEventsByExternalId(Transaction& t, const std::string& tenant_id,
                                                                               cashgraph::v1::EventKind kind, const std::string& external_id) {
    return QueryAll<model::RawEventRecord>(
        TX(t).Handle(), std::string("SELECT ") + sql::RAW_EVENT_COLUMNS + sql::SELECT_RAW_EVENT_BY_EXTERNAL_WHERE,
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindI32(st, 2, static_cast<int>(kind));
            BindText(st, 3, external_id);
        },
        &ReadRawEvent);
}

std::vector<model::RawEventRecord> SqliteRepository::FindRawEventsByParent(Transaction& t, const std::string& tenant_id,
                                                                           cashgraph::v1::EventKind kind, const std::string& parent_external_id) {
    return QueryAll<model::RawEventRecord>(
        TX(t).Handle(), std::string("SELECT ") + sql::RAW_EVENT_COLUMNS + sql::SELECT_RAW_EVENT_BY_PARENT_WHERE,
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindI32(st, 2, static_cast<int>(kind));
            BindText(st, 3, parent_external_id);
        },
        &ReadRawEvent);
}

// ------------------------------------------------------------------
// Identities
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrFetchIdentity(Transaction& t, model::IdentityRecord& r, bool& created) {
    auto* db = TX(t).Handle();

    {
        Statement st(db, sql::INSERT_IDENTITY_IF_ABSENT);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st.get(), 1, r.id);
        BindText(st.get(), 2, r.tenant_id);
        BindText(st.get(), 3, r.fingerprint);
        BindI32(st.get(), 4, static_cast<int>(r.kind));
        BindU64(st.get(), 5, r.created_at_ms);
        BindU64(st.get(), 6, r.touched_at_ms);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
        created = sqlite3_changes(db) == 1;
    }

    if (created) return Result::Ok();

    auto stored = FindIdentityByFingerprint(t, r.tenant_id, r.fingerprint);
    if (!stored) return Result::Err(ErrorCode::InternalError, "identity vanished after conflicting insert");
    r = *stored;
    return Result::Ok();
}

std::optional<model::IdentityRecord> SqliteRepository::GetIdentity(Transaction& t, const std::string& id) {
    return QueryOne<model::IdentityRecord>(
        TX(t).Handle(), Select(sql::IDENTITY_COLUMNS, "identity", "WHERE id=?;"),
        [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadIdentity);
}

std::optional<model::IdentityRecord> SqliteRepository::FindIdentityByFingerprint(Transaction& t, const std::string& tenant_id,
                                                                                 const std::string& fingerprint) {
    return QueryOne<model::IdentityRecord>(
        TX(t).Handle(), Select(sql::IDENTITY_COLUMNS, "identity", "WHERE tenant_id=? AND fingerprint=?;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindText(st, 2, fingerprint);
        },
        &ReadIdentity);
}

std::vector<model::IdentityRecord> SqliteRepository::ListIdentities(Transaction& t, const std::string& tenant_id, cashgraph::v1::CanonicalKind kind) {
    return QueryAll<model::IdentityRecord>(
        TX(t).Handle(), Select(sql::IDENTITY_COLUMNS, "identity", "WHERE tenant_id=? AND kind=? ORDER BY created_at_ms,id;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindI32(st, 2, static_cast<int>(kind));
        },
        &ReadIdentity);
}

std::vector<model::IdentityRecord> SqliteRepository::ListIdentitiesTouchedSince(Transaction& t, const std::string& tenant_id, uint64_t since_ms) {
    return QueryAll<model::IdentityRecord>(
        TX(t).Handle(), Select(sql::IDENTITY_COLUMNS, "identity", "WHERE tenant_id=? AND touched_at_ms>=? ORDER BY created_at_ms,id;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindU64(st, 2, since_ms);
        },
        &ReadIdentity);
}

Result SqliteRepository::TouchIdentity(Transaction& t, const std::string& id, uint64_t touched_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::TOUCH_IDENTITY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, touched_at_ms);
    BindText(st.get(), 2, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Links / edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, const model::IdentityLinkRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_LINK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.identity_id);
    BindText(st.get(), 4, r.raw_event_id);
    BindDouble(st.get(), 5, r.confidence);
    BindText(st.get(), 6, r.reason);
    BindU64(st.get(), 7, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::IdentityLinkRecord> SqliteRepository::GetLinks(Transaction& t, const std::string& identity_id) {
    return QueryAll<model::IdentityLinkRecord>(
        TX(t).Handle(), sql::SELECT_LINKS, [&](sqlite3_stmt* st) { BindText(st, 1, identity_id); }, &ReadLink);
}

Result SqliteRepository::InsertEdge(Transaction& t, const model::IdentityEdgeRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_EDGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.from_identity_id);
    BindText(st.get(), 4, r.to_identity_id);
    BindI32(st.get(), 5, static_cast<int>(r.kind));
    BindDouble(st.get(), 6, r.weight);
    BindText(st.get(), 7, r.matcher);
    BindText(st.get(), 8, r.reason);
    BindU64(st.get(), 9, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::IdentityEdgeRecord> SqliteRepository::GetOutgoingEdges(Transaction& t, const std::string& identity_id) {
    return QueryAll<model::IdentityEdgeRecord>(
        TX(t).Handle(), Select(sql::EDGE_COLUMNS, "identity_edge", "WHERE from_identity_id=? ORDER BY created_at_ms,id;"),
        [&](sqlite3_stmt* st) { BindText(st, 1, identity_id); }, &ReadEdge);
}

std::vector<model::IdentityEdgeRecord> SqliteRepository::GetIncomingEdges(Transaction& t, const std::string& identity_id) {
    return QueryAll<model::IdentityEdgeRecord>(
        TX(t).Handle(), Select(sql::EDGE_COLUMNS, "identity_edge", "WHERE to_identity_id=? ORDER BY created_at_ms,id;"),
        [&](sqlite3_stmt* st) { BindText(st, 1, identity_id); }, &ReadEdge);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_LEDGER_ENTRY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.identity_id);
    BindI64(st.get(), 4, r.posted_at_ms);
    BindI32(st.get(), 5, static_cast<int>(r.direction));
    BindI64(st.get(), 6, r.amount_minor);
    BindText(st.get(), 7, r.currency);
    BindText(st.get(), 8, r.classification_key);
    BindDouble(st.get(), 9, r.confidence);
    BindText(st.get(), 10, r.provenance_json);
    BindU64(st.get(), 11, r.created_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
}

std::optional<model::LedgerEntryRecord> SqliteRepository::GetLedgerEntryForIdentity(Transaction& t, const std::string& tenant_id,
                                                                                    const std::string& identity_id) {
    return QueryOne<model::LedgerEntryRecord>(
        TX(t).Handle(), Select(sql::LEDGER_COLUMNS, "cash_ledger", "WHERE tenant_id=? AND identity_id=?;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindText(st, 2, identity_id);
        },
        &ReadLedgerEntry);
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntries(Transaction& t, const std::string& tenant_id, int64_t from_ms, int64_t to_ms) {
    return QueryAll<model::LedgerEntryRecord>(
        TX(t).Handle(), Select(sql::LEDGER_COLUMNS, "cash_ledger", "WHERE tenant_id=? AND posted_at_ms>=? AND posted_at_ms<? ORDER BY posted_at_ms,created_at_ms;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindI64(st, 2, from_ms);
            BindI64(st, 3, to_ms);
        },
        &ReadLedgerEntry);
}

// ------------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------------

Result SqliteRepository::InsertException(Transaction& t, const model::ExceptionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_EXCEPTION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindI32(st.get(), 3, static_cast<int>(r.kind));
    BindI32(st.get(), 4, static_cast<int>(r.status));
    BindI32(st.get(), 5, static_cast<int>(r.severity));
    BindText(st.get(), 6, r.subject_identity_id);
    BindText(st.get(), 7, r.dedup_key);
    BindText(st.get(), 8, r.context_json);
    BindU64(st.get(), 9, r.created_at_ms);
    BindU64(st.get(), 10, r.updated_at_ms);
    BindU64(st.get(), 11, r.resolved_at_ms);
    BindText(st.get(), 12, r.resolution_note);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateException(Transaction& t, const model::ExceptionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_EXCEPTION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.kind));
    BindI32(st.get(), 2, static_cast<int>(r.status));
    BindI32(st.get(), 3, static_cast<int>(r.severity));
    BindText(st.get(), 4, r.subject_identity_id);
    BindText(st.get(), 5, r.dedup_key);
    BindText(st.get(), 6, r.context_json);
    BindU64(st.get(), 7, r.updated_at_ms);
    BindU64(st.get(), 8, r.resolved_at_ms);
    BindText(st.get(), 9, r.resolution_note);
    BindText(st.get(), 10, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::optional<model::ExceptionRecord> SqliteRepository::GetException(Transaction& t, const std::string& id) {
    return QueryOne<model::ExceptionRecord>(
        TX(t).Handle(), Select(sql::EXCEPTION_COLUMNS, "recon_exception", "WHERE id=?;"),
        [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadException);
}

std::optional<model::ExceptionRecord> SqliteRepository::FindOpenException(Transaction& t, const std::string& tenant_id, const std::string& dedup_key) {
    return QueryOne<model::ExceptionRecord>(
        TX(t).Handle(), Select(sql::EXCEPTION_COLUMNS, "recon_exception", "WHERE tenant_id=? AND dedup_key=? AND status=? LIMIT 1;"),
        [&](sqlite3_stmt* st) {
            BindText(st, 1, tenant_id);
            BindText(st, 2, dedup_key);
            BindI32(st, 3, static_cast<int>(cashgraph::v1::EXCEPTION_STATUS_OPEN));
        },
        &ReadException);
}

std::vector<model::ExceptionRecord> SqliteRepository::ListExceptions(Transaction& t, const model::ExceptionFilter& filter) {
    std::string where = "WHERE tenant_id=?";
    if (filter.kind.has_value()) where += " AND kind=?";
    if (filter.status.has_value()) where += " AND status=?";
    where += " ORDER BY created_at_ms,id;";

    return QueryAll<model::ExceptionRecord>(
        TX(t).Handle(), Select(sql::EXCEPTION_COLUMNS, "recon_exception", where),
        [&](sqlite3_stmt* st) {
            int idx = 1;
            BindText(st, idx++, filter.tenant_id);
            if (filter.kind.has_value()) BindI32(st, idx++, static_cast<int>(*filter.kind));
            if (filter.status.has_value()) BindI32(st, idx++, static_cast<int>(*filter.status));
        },
        &ReadException);
}

} // namespace cashgraph::db::sqlite
