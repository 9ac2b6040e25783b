#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace cashgraph::db::sqlite {

// Owns the single sqlite3 connection behind the ledger store. ":memory:"
// opens a private in-process database and ignores wal_mode.
class SqliteDB final : public sql::MigrationExecutor {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }
  const std::string& path() const {
    return path_;
  }
  bool in_memory() const {
    return path_ == ":memory:";
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }
  int64_t QueryInt(const std::string& sql) override;

 private:
  void ApplyPragmas(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace cashgraph::db::sqlite
