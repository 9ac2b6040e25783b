#pragma once

#include "cashgraph/v1.hpp"
#include "internal/db/model/exception_record.hpp"
#include "internal/db/model/identity_edge_record.hpp"
#include "internal/db/model/identity_link_record.hpp"
#include "internal/db/model/identity_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/raw_event_record.hpp"

namespace cashgraph::core {

/*
  Storage record <-> wire message conversion.

  JSON columns (payload, provenance, exception context) are parsed back into
  their messages; unknown fields written by newer versions are dropped.
*/

cashgraph::v1::RawEvent        ToProto(const db::model::RawEventRecord& record);
cashgraph::v1::Identity        ToProto(const db::model::IdentityRecord& record);
cashgraph::v1::IdentityLink    ToProto(const db::model::IdentityLinkRecord& record);
cashgraph::v1::IdentityEdge    ToProto(const db::model::IdentityEdgeRecord& record);
cashgraph::v1::CashLedgerEntry ToProto(const db::model::LedgerEntryRecord& record);
cashgraph::v1::ReconException  ToProto(const db::model::ExceptionRecord& record);

// Validates an inbound event and builds its storage record (id and
// ingested_at left for the caller). Throws util::InvalidArgument.
db::model::RawEventRecord ToRecord(const cashgraph::v1::RawEvent& event);

} // namespace cashgraph::core
