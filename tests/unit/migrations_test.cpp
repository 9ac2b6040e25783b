#include "internal/db/sql/migrations.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using cashgraph::db::sql::Migration;

// Records statements and answers the version query from what it has seen.
class RecordingExecutor final : public cashgraph::db::sql::MigrationExecutor {
 public:
  void ExecuteSQL(const std::string& sql) override {
    statements.push_back(sql);
    const std::string marker = "VALUES (";
    const auto        pos    = sql.find(marker);
    if (sql.rfind("INSERT INTO schema_migration", 0) == 0 && pos != std::string::npos) {
      version = std::max<int64_t>(version, std::stoll(sql.substr(pos + marker.size())));
    }
  }

  int64_t QueryInt(const std::string&) override {
    return version;
  }

  std::vector<std::string> statements;
  int64_t                  version = 0;
};

void TestFreshDatabaseAppliesEverything() {
  RecordingExecutor executor;
  const auto&       migrations = cashgraph::db::sql::SqliteMigrations();

  assert(cashgraph::db::sql::RunMigrations(executor, migrations) == static_cast<int>(migrations.size()));
  assert(executor.version == migrations.back().version);

  const auto creates_ledger = std::any_of(executor.statements.begin(), executor.statements.end(),
                                          [](const std::string& s) { return s.find("CREATE TABLE IF NOT EXISTS cash_ledger") != std::string::npos; });
  assert(creates_ledger);
}

void TestReopenAppliesNothing() {
  RecordingExecutor executor;
  cashgraph::db::sql::RunMigrations(executor, cashgraph::db::sql::SqliteMigrations());

  executor.statements.clear();
  assert(cashgraph::db::sql::RunMigrations(executor, cashgraph::db::sql::SqliteMigrations()) == 0);
  // only the bookkeeping table check runs
  assert(executor.statements.size() == 1);
}

void TestOnlyNewerStepsRun() {
  RecordingExecutor executor;
  executor.version = 1;

  const std::vector<Migration> migrations = {{1, "first", {"CREATE TABLE a (x INTEGER);"}}, {2, "second", {"CREATE TABLE b (x INTEGER);"}}};
  assert(cashgraph::db::sql::RunMigrations(executor, migrations) == 1);
  assert(std::find(executor.statements.begin(), executor.statements.end(), "CREATE TABLE a (x INTEGER);") == executor.statements.end());
  assert(std::find(executor.statements.begin(), executor.statements.end(), "CREATE TABLE b (x INTEGER);") != executor.statements.end());
  assert(executor.version == 2);
}

void TestBackendsShareVersions() {
  const auto& sqlite   = cashgraph::db::sql::SqliteMigrations();
  const auto& postgres = cashgraph::db::sql::PostgresMigrations();
  assert(sqlite.size() == postgres.size());
  for (size_t i = 0; i < sqlite.size(); ++i) {
    assert(sqlite[i].version == postgres[i].version);
    assert(sqlite[i].statements.size() == postgres[i].statements.size());
  }
}

} // namespace

int main() {
  TestFreshDatabaseAppliesEverything();
  TestReopenAppliesNothing();
  TestOnlyNewerStepsRun();
  TestBackendsShareVersions();

  std::cout << "cashgraph_unit_migrations: pass\n";
  return 0;
}
