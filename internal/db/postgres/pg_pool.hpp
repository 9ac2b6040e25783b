#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace cashgraph::db::postgres {

// Bounded pool of libpqxx connections, each with the ledger statements
// prepared. A connection serves one transaction at a time; the shared_ptr
// handed out by Acquire() returns it to the pool when dropped, and closed
// connections are discarded instead of reused.
//
// Acquire() waits up to acquire_timeout for a free slot and then throws
// util::TransactionConflict so the unit of work can back off and retry.
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16,
                  std::chrono::milliseconds acquire_timeout = std::chrono::seconds(30));

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              Forget();

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace cashgraph::db::postgres
