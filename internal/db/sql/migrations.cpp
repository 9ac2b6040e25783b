#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace cashgraph::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS schema_migration (version INTEGER PRIMARY KEY, description TEXT NOT NULL);");
  const auto current = executor.QueryInt("SELECT COALESCE(MAX(version), 0) FROM schema_migration;");

  int applied = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= current) continue;

    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.ExecuteSQL("INSERT INTO schema_migration (version, description) VALUES (" + std::to_string(migration.version) + ", '" +
                        migration.description + "');");
    CASHGRAPH_LOG_INFO("schema migration applied", {observability::IntField("version", migration.version),
                                                    observability::StringField("description", migration.description)});
    ++applied;
  }
  return applied;
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "ledger tables",
       {
           "CREATE TABLE IF NOT EXISTS raw_event (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, source TEXT NOT NULL, kind INTEGER NOT NULL, external_id TEXT NOT NULL, occurred_at_ms INTEGER NOT NULL, amount_minor INTEGER NOT NULL, currency TEXT NOT NULL, account_ref TEXT, counterparty TEXT, parent_external_id TEXT, mcc TEXT, payload_json TEXT NOT NULL, ingested_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, source, kind, external_id));",
           "CREATE TABLE IF NOT EXISTS identity (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, fingerprint TEXT NOT NULL, kind INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, touched_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, fingerprint));",
           "CREATE TABLE IF NOT EXISTS identity_link (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, identity_id TEXT NOT NULL REFERENCES identity(id), raw_event_id TEXT NOT NULL UNIQUE REFERENCES raw_event(id), confidence REAL NOT NULL, reason TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
           "CREATE TABLE IF NOT EXISTS identity_edge (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, from_identity_id TEXT NOT NULL REFERENCES identity(id), to_identity_id TEXT NOT NULL REFERENCES identity(id), kind INTEGER NOT NULL, weight REAL NOT NULL, matcher TEXT, reason TEXT, created_at_ms INTEGER NOT NULL);",
           "CREATE TABLE IF NOT EXISTS cash_ledger (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, identity_id TEXT NOT NULL REFERENCES identity(id), posted_at_ms INTEGER NOT NULL, direction INTEGER NOT NULL, amount_minor INTEGER NOT NULL, currency TEXT NOT NULL, classification_key TEXT, confidence REAL NOT NULL, provenance_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(tenant_id, identity_id));",
           "CREATE TABLE IF NOT EXISTS recon_exception (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, kind INTEGER NOT NULL, status INTEGER NOT NULL, severity INTEGER NOT NULL, subject_identity_id TEXT, dedup_key TEXT NOT NULL, context_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, resolved_at_ms INTEGER NOT NULL DEFAULT 0, resolution_note TEXT);"}},
      {2,
       "lookup indexes",
       {
           "CREATE INDEX IF NOT EXISTS raw_event_parent_idx ON raw_event(tenant_id, kind, parent_external_id);",
           "CREATE INDEX IF NOT EXISTS raw_event_external_idx ON raw_event(tenant_id, kind, external_id);",
           "CREATE INDEX IF NOT EXISTS identity_kind_idx ON identity(tenant_id, kind);",
           "CREATE INDEX IF NOT EXISTS identity_touched_idx ON identity(tenant_id, touched_at_ms);",
           "CREATE INDEX IF NOT EXISTS identity_link_identity_idx ON identity_link(identity_id);",
           "CREATE INDEX IF NOT EXISTS identity_edge_from_idx ON identity_edge(from_identity_id);",
           "CREATE INDEX IF NOT EXISTS identity_edge_to_idx ON identity_edge(to_identity_id);",
           "CREATE INDEX IF NOT EXISTS cash_ledger_posted_idx ON cash_ledger(tenant_id, posted_at_ms);",
           "CREATE INDEX IF NOT EXISTS recon_exception_open_idx ON recon_exception(tenant_id, dedup_key, status);"}}};
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "ledger tables",
       {
           "CREATE TABLE IF NOT EXISTS raw_event (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, source TEXT NOT NULL, kind SMALLINT NOT NULL, external_id TEXT NOT NULL, occurred_at_ms BIGINT NOT NULL, amount_minor BIGINT NOT NULL, currency TEXT NOT NULL, account_ref TEXT, counterparty TEXT, parent_external_id TEXT, mcc TEXT, payload_json JSONB NOT NULL, ingested_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, source, kind, external_id));",
           "CREATE TABLE IF NOT EXISTS identity (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, fingerprint TEXT NOT NULL, kind SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, touched_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, fingerprint));",
           "CREATE TABLE IF NOT EXISTS identity_link (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, identity_id TEXT NOT NULL REFERENCES identity(id), raw_event_id TEXT NOT NULL UNIQUE REFERENCES raw_event(id), confidence DOUBLE PRECISION NOT NULL, reason TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
           "CREATE TABLE IF NOT EXISTS identity_edge (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, from_identity_id TEXT NOT NULL REFERENCES identity(id), to_identity_id TEXT NOT NULL REFERENCES identity(id), kind SMALLINT NOT NULL, weight DOUBLE PRECISION NOT NULL, matcher TEXT, reason TEXT, created_at_ms BIGINT NOT NULL);",
           "CREATE TABLE IF NOT EXISTS cash_ledger (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, identity_id TEXT NOT NULL REFERENCES identity(id), posted_at_ms BIGINT NOT NULL, direction SMALLINT NOT NULL, amount_minor BIGINT NOT NULL, currency TEXT NOT NULL, classification_key TEXT, confidence DOUBLE PRECISION NOT NULL, provenance_json JSONB NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(tenant_id, identity_id));",
           "CREATE TABLE IF NOT EXISTS recon_exception (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, kind SMALLINT NOT NULL, status SMALLINT NOT NULL, severity SMALLINT NOT NULL, subject_identity_id TEXT, dedup_key TEXT NOT NULL, context_json JSONB NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, resolved_at_ms BIGINT NOT NULL DEFAULT 0, resolution_note TEXT);"}},
      {2,
       "lookup indexes",
       {
           "CREATE INDEX IF NOT EXISTS raw_event_parent_idx ON raw_event(tenant_id, kind, parent_external_id);",
           "CREATE INDEX IF NOT EXISTS raw_event_external_idx ON raw_event(tenant_id, kind, external_id);",
           "CREATE INDEX IF NOT EXISTS identity_kind_idx ON identity(tenant_id, kind);",
           "CREATE INDEX IF NOT EXISTS identity_touched_idx ON identity(tenant_id, touched_at_ms);",
           "CREATE INDEX IF NOT EXISTS identity_link_identity_idx ON identity_link(identity_id);",
           "CREATE INDEX IF NOT EXISTS identity_edge_from_idx ON identity_edge(from_identity_id);",
           "CREATE INDEX IF NOT EXISTS identity_edge_to_idx ON identity_edge(to_identity_id);",
           "CREATE INDEX IF NOT EXISTS cash_ledger_posted_idx ON cash_ledger(tenant_id, posted_at_ms);",
           "CREATE INDEX IF NOT EXISTS recon_exception_open_idx ON recon_exception(tenant_id, dedup_key, status);"}}};
  return kMigrations;
}

} // namespace cashgraph::db::sql
