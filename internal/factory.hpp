#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/reconciliation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/ledger_service.hpp"

namespace cashgraph::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::ReconciliationEngine> engine;
  std::shared_ptr<service::LedgerService>     ledger_service;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const cashgraph::runtime::config::RuntimeConfig& config);

// Opens the configured backend and applies the schema.
std::shared_ptr<db::Repository> BuildRepository(const cashgraph::runtime::config::RuntimeConfig& config);

} // namespace cashgraph::factory
