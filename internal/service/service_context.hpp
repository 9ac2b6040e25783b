#pragma once

#include <memory>

namespace cashgraph::core {
class ReconciliationEngine;
}

namespace cashgraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<cashgraph::core::ReconciliationEngine> engine;
};

} // namespace cashgraph::service
