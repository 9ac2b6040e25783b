#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cashgraph::db {

/*
  Runs `work(tx)` in a fresh transaction and commits it.

  A util::TransactionConflict (raised by the work or by Commit) rolls the
  attempt back and starts over, up to `max_attempts` attempts in total. The
  last conflict propagates. Any other exception propagates immediately; the
  transaction destructor rolls back.
*/
template <typename Work>
auto RunInTransaction(Repository& repository, uint32_t max_attempts, const std::string& what, Work&& work) {
  if (max_attempts == 0) max_attempts = 1;

  for (uint32_t attempt = 1;; ++attempt) {
    auto tx = repository.Begin();
    try {
      if constexpr (std::is_void_v<decltype(work(*tx))>) {
        work(*tx);
        tx->Commit();
        return;
      } else {
        auto result = work(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict& e) {
      if (attempt >= max_attempts) throw;
      CASHGRAPH_LOG_DEBUG("transaction conflict, retrying", {observability::StringField("unit", what), observability::IntField("attempt", attempt),
                                                             observability::StringField("error", e.what())});
    }
  }
}

} // namespace cashgraph::db
