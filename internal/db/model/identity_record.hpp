#pragma once

#include <cstdint>
#include <string>

#include "cashgraph/v1.hpp"

namespace cashgraph::db::model {

/*
  Canonical real-world financial event.

  Unique per (tenant_id, fingerprint). The fingerprint is never rewritten;
  touched_at_ms moves forward whenever links or edges change and drives the
  consolidation watermark.
*/

struct IdentityRecord {
  std::string id;
  std::string tenant_id;
  std::string fingerprint;

  cashgraph::v1::CanonicalKind kind = cashgraph::v1::CANONICAL_KIND_UNSPECIFIED;

  uint64_t created_at_ms = 0;
  uint64_t touched_at_ms = 0;
};

} // namespace cashgraph::db::model
