#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace cashgraph::db::sqlite {

namespace {

std::runtime_error SqliteError(sqlite3* db, const std::string& what) {
  return std::runtime_error(what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  if (path_.empty()) {
    throw util::InvalidArgument("sqlite path must not be empty");
  }

  if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    auto error = SqliteError(db_, "open " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw error;
  }

  ApplyPragmas(wal_mode && !in_memory());
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec failed: " + message);
  }
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw SqliteError(db_, "prepare");
  }

  const int     rc    = sqlite3_step(stmt);
  const int64_t value = rc == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw SqliteError(db_, "query");
  }
  return value;
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // links, edges and ledger rows reference identities and raw events
  Exec("PRAGMA foreign_keys=ON;");

  // a second process consolidating the same file waits instead of failing
  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw SqliteError(db_, "busy_timeout");
  }
}

} // namespace cashgraph::db::sqlite
