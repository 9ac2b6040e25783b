#pragma once

#include <cstdint>
#include <string>

#include "cashgraph/v1.hpp"

namespace cashgraph::db::model {

/*
  One recognised cash movement.

  At most one row per (tenant_id, identity_id); immutable once written.
*/

struct LedgerEntryRecord {
  std::string id;
  std::string tenant_id;
  std::string identity_id;

  // bank-recognised time
  int64_t posted_at_ms = 0;

  cashgraph::v1::Direction direction = cashgraph::v1::DIRECTION_UNSPECIFIED;

  int64_t     amount_minor = 0;
  std::string currency     = "USD";

  // owned by the downstream policy layer; empty when written here
  std::string classification_key;

  double confidence = 1.0;

  // protobuf-JSON of cashgraph.core.v1.Provenance
  std::string provenance_json;

  uint64_t created_at_ms = 0;
};

} // namespace cashgraph::db::model
