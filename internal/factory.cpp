#include "factory.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/matching/matching_config.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if CASHGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CASHGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace cashgraph::factory {

namespace {

#if CASHGRAPH_DB_POSTGRES
// Postgres DDL is transactional, so all pending migrations land together.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : tx_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  int64_t QueryInt(const std::string& sql) override {
    return tx_.query_value<int64_t>(sql);
  }

  void Commit() {
    tx_.commit();
  }

 private:
  pqxx::work tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const cashgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CASHGRAPH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    const int applied = db::sql::RunMigrations(*sqlite_db, db::sql::SqliteMigrations());
    CASHGRAPH_LOG_INFO("sqlite backend ready", {observability::StringField("path", sqlite_db->path()), observability::IntField("migrations_applied", applied),
                                                observability::BoolField("wal", database.sqlite().wal_mode() && !sqlite_db->in_memory())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CASHGRAPH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    int        applied         = 0;
    {
      auto                conn = pool->Acquire();
      PgMigrationExecutor executor(*conn);
      applied = db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
      executor.Commit();
    }
    CASHGRAPH_LOG_INFO("postgres backend ready",
                       {observability::IntField("max_connections", max_connections), observability::IntField("migrations_applied", applied)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CASHGRAPH_LOG_INFO("memory backend ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const cashgraph::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  core::EngineOptions options;
  if (config.engine().max_transaction_retries() > 0) options.max_transaction_retries = config.engine().max_transaction_retries();
  if (config.engine().has_watermark_lookback()) options.watermark_lookback_ms = util::DurationFromProto(config.engine().watermark_lookback()).count();

  app.engine = std::make_shared<core::ReconciliationEngine>(app.repository, matching::FromProto(config.matching()), options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.engine;

  app.ledger_service = std::make_shared<service::LedgerService>(ctx);

  return app;
}

} // namespace cashgraph::factory
