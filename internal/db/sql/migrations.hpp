#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cashgraph::db::sql {

// One numbered schema step. Statements are idempotent (IF NOT EXISTS), so a
// step interrupted before its version row is written can be replayed.
struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void    ExecuteSQL(const std::string& sql) = 0;
  virtual int64_t QueryInt(const std::string& sql)   = 0;
};

// Applies every migration newer than the version recorded in
// schema_migration, in order. Returns the number applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace cashgraph::db::sql
