#pragma once

namespace cashgraph::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Column order of every SELECT matches the Read*Row helpers in
  sqlite_repository.cpp.
*/

// raw events

static constexpr const char* RAW_EVENT_COLUMNS =
    "id,tenant_id,source,kind,external_id,occurred_at_ms,amount_minor,currency,"
    "account_ref,counterparty,parent_external_id,mcc,payload_json,ingested_at_ms";

static constexpr const char* INSERT_RAW_EVENT =
    "INSERT INTO raw_event(id,tenant_id,source,kind,external_id,occurred_at_ms,amount_minor,currency,"
    "account_ref,counterparty,parent_external_id,mcc,payload_json,ingested_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(tenant_id,source,kind,external_id) DO NOTHING;";

static constexpr const char* SELECT_RAW_EVENT_BY_ID_WHERE = " FROM raw_event WHERE id=?;";

static constexpr const char* SELECT_RAW_EVENT_BY_KEY_WHERE =
    " FROM raw_event WHERE tenant_id=? AND source=? AND kind=? AND external_id=?;";

static constexpr const char* SELECT_RAW_EVENT_BY_EXTERNAL_WHERE =
    " FROM raw_event WHERE tenant_id=? AND kind=? AND external_id=? ORDER BY ingested_at_ms,id;";

static constexpr const char* SELECT_RAW_EVENT_BY_PARENT_WHERE =
    " FROM raw_event WHERE tenant_id=? AND kind=? AND parent_external_id=? ORDER BY ingested_at_ms,id;";

// identities

static constexpr const char* IDENTITY_COLUMNS = "id,tenant_id,fingerprint,kind,created_at_ms,touched_at_ms";

static constexpr const char* INSERT_IDENTITY_IF_ABSENT =
    "INSERT INTO identity(id,tenant_id,fingerprint,kind,created_at_ms,touched_at_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(tenant_id,fingerprint) DO NOTHING;";

static constexpr const char* TOUCH_IDENTITY =
    "UPDATE identity SET touched_at_ms=MAX(touched_at_ms,?) WHERE id=?;";

// links

static constexpr const char* INSERT_LINK =
    "INSERT INTO identity_link(id,tenant_id,identity_id,raw_event_id,confidence,reason,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LINKS =
    "SELECT id,tenant_id,identity_id,raw_event_id,confidence,reason,created_at_ms"
    " FROM identity_link WHERE identity_id=? ORDER BY created_at_ms,id;";

// edges

static constexpr const char* INSERT_EDGE =
    "INSERT INTO identity_edge(id,tenant_id,from_identity_id,to_identity_id,kind,weight,matcher,reason,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* EDGE_COLUMNS =
    "id,tenant_id,from_identity_id,to_identity_id,kind,weight,matcher,reason,created_at_ms";

// ledger

static constexpr const char* INSERT_LEDGER_ENTRY =
    "INSERT INTO cash_ledger(id,tenant_id,identity_id,posted_at_ms,direction,amount_minor,currency,"
    "classification_key,confidence,provenance_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(tenant_id,identity_id) DO NOTHING;";

static constexpr const char* LEDGER_COLUMNS =
    "id,tenant_id,identity_id,posted_at_ms,direction,amount_minor,currency,"
    "classification_key,confidence,provenance_json,created_at_ms";

// exceptions

static constexpr const char* INSERT_EXCEPTION =
    "INSERT INTO recon_exception(id,tenant_id,kind,status,severity,subject_identity_id,dedup_key,context_json,"
    "created_at_ms,updated_at_ms,resolved_at_ms,resolution_note)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_EXCEPTION =
    "UPDATE recon_exception SET kind=?,status=?,severity=?,subject_identity_id=?,dedup_key=?,context_json=?,"
    "updated_at_ms=?,resolved_at_ms=?,resolution_note=? WHERE id=?;";

static constexpr const char* EXCEPTION_COLUMNS =
    "id,tenant_id,kind,status,severity,subject_identity_id,dedup_key,context_json,"
    "created_at_ms,updated_at_ms,resolved_at_ms,resolution_note";

} // namespace cashgraph::db::sql
