#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cashgraph/v1.hpp"

namespace cashgraph::db::model {

/*
  Review queue item.

  dedup_key = kind + subject identity; at most one OPEN row per key.
  Rows are never deleted; resolution flips status and stamps resolved_at_ms.
*/

struct ExceptionRecord {
  std::string id;
  std::string tenant_id;

  cashgraph::v1::ExceptionKind   kind     = cashgraph::v1::EXCEPTION_KIND_UNSPECIFIED;
  cashgraph::v1::ExceptionStatus status   = cashgraph::v1::EXCEPTION_STATUS_OPEN;
  cashgraph::v1::Severity        severity = cashgraph::v1::SEVERITY_WARNING;

  std::string subject_identity_id;
  std::string dedup_key;

  // protobuf-JSON of cashgraph.core.v1.ExceptionContext
  std::string context_json;

  uint64_t created_at_ms  = 0;
  uint64_t updated_at_ms  = 0;
  uint64_t resolved_at_ms = 0; // 0 = unresolved

  std::string resolution_note;
};

struct ExceptionFilter {
  std::string                                   tenant_id;
  std::optional<cashgraph::v1::ExceptionKind>   kind;
  std::optional<cashgraph::v1::ExceptionStatus> status;
};

} // namespace cashgraph::db::model
