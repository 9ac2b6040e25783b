#pragma once

#include <cstdint>
#include <string>

namespace cashgraph::db::model {

// raw event ---> identity
struct IdentityLinkRecord {
  std::string id;
  std::string tenant_id;
  std::string identity_id;
  std::string raw_event_id;

  double      confidence = 1.0;
  std::string reason;

  uint64_t created_at_ms = 0;
};

} // namespace cashgraph::db::model
