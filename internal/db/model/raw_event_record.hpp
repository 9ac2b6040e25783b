#pragma once

#include <cstdint>
#include <string>

#include "cashgraph/v1.hpp"

namespace cashgraph::db::model {

/*
  Append-only inbound observation.

  Natural key: (tenant_id, source, kind, external_id).
  Re-inserting the same key is reported as AlreadyExists and treated by the
  ingestion path as a no-op.
*/

struct RawEventRecord {
  std::string id;
  std::string tenant_id;
  std::string source;

  cashgraph::v1::EventKind kind = cashgraph::v1::EVENT_KIND_UNSPECIFIED;

  std::string external_id;
  int64_t     occurred_at_ms = 0;

  // signed minor units, credits positive
  int64_t     amount_minor = 0;
  std::string currency     = "USD";

  std::string account_ref;
  std::string counterparty;
  std::string parent_external_id;
  std::string mcc;

  // protobuf-JSON of cashgraph.core.v1.RawPayload
  std::string payload_json;

  uint64_t ingested_at_ms = 0;
};

} // namespace cashgraph::db::model
