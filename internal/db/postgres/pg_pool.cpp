#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cashgraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  if (!ready) {
    throw util::TransactionConflict("all " + std::to_string(max_connections_) + " ledger connections are busy");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  // reserve the slot, then connect without holding the lock
  ++live_connections_;
  lock.unlock();
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    Forget();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_raw_event",
               "INSERT INTO raw_event(id,tenant_id,source,kind,external_id,occurred_at_ms,amount_minor,currency,"
               "account_ref,counterparty,parent_external_id,mcc,payload_json,ingested_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13::jsonb,$14) "
               "ON CONFLICT(tenant_id,source,kind,external_id) DO NOTHING");

  conn.prepare("insert_identity_if_absent",
               "INSERT INTO identity(id,tenant_id,fingerprint,kind,created_at_ms,touched_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(tenant_id,fingerprint) DO NOTHING");

  conn.prepare("touch_identity", "UPDATE identity SET touched_at_ms=GREATEST(touched_at_ms,$2) WHERE id=$1");

  conn.prepare("insert_link",
               "INSERT INTO identity_link(id,tenant_id,identity_id,raw_event_id,confidence,reason,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("insert_edge",
               "INSERT INTO identity_edge(id,tenant_id,from_identity_id,to_identity_id,kind,weight,matcher,reason,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("insert_ledger_entry",
               "INSERT INTO cash_ledger(id,tenant_id,identity_id,posted_at_ms,direction,amount_minor,currency,"
               "classification_key,confidence,provenance_json,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10::jsonb,$11) "
               "ON CONFLICT(tenant_id,identity_id) DO NOTHING");

  conn.prepare("insert_exception",
               "INSERT INTO recon_exception(id,tenant_id,kind,status,severity,subject_identity_id,dedup_key,context_json,"
               "created_at_ms,updated_at_ms,resolved_at_ms,resolution_note) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8::jsonb,$9,$10,$11,$12)");

  conn.prepare("update_exception",
               "UPDATE recon_exception SET kind=$2,status=$3,severity=$4,subject_identity_id=$5,dedup_key=$6,"
               "context_json=$7::jsonb,updated_at_ms=$8,resolved_at_ms=$9,resolution_note=$10 WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  if (!owned->is_open()) {
    CASHGRAPH_LOG_WARN("dropping closed postgres connection");
    Forget();
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.push_back(std::move(owned));
  }
  cv_.notify_one();
}

void PgPool::Forget() {
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

} // namespace cashgraph::db::postgres
