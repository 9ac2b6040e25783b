#include "record_convert.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace cashgraph::core {

using namespace cashgraph::v1;

namespace {

constexpr uint32_t kPayloadSchemaVersion = 1;

std::string NormalizeCurrency(const std::string& raw) {
  if (raw.empty()) return "USD";

  std::string code = raw;
  std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const bool letters = std::all_of(code.begin(), code.end(), [](unsigned char c) { return c >= 'A' && c <= 'Z'; });
  if (code.size() != 3 || !letters) throw util::InvalidArgument("malformed currency code '" + raw + "'");
  return code;
}

bool PayloadFitsKind(const RawPayload& payload, EventKind kind) {
  switch (payload.detail_case()) {
    case RawPayload::DETAIL_NOT_SET:
      return true;
    case RawPayload::kBank:
      return kind == EVENT_KIND_BANK_TXN;
    case RawPayload::kPayout:
      return kind == EVENT_KIND_PAYOUT;
    case RawPayload::kBalance:
      return kind == EVENT_KIND_BALANCE_TXN;
    case RawPayload::kOps:
      return kind == EVENT_KIND_OPS_PAYMENT || kind == EVENT_KIND_OPS_INVOICE;
  }
  return false;
}

} // namespace

RawEvent ToProto(const db::model::RawEventRecord& record) {
  RawEvent out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_source(record.source);
  out.set_kind(record.kind);
  out.set_external_id(record.external_id);
  *out.mutable_occurred_at() = util::MillisToProto(record.occurred_at_ms);
  out.mutable_amount()->set_amount_minor(record.amount_minor);
  out.mutable_amount()->set_currency(record.currency);
  out.set_account_ref(record.account_ref);
  out.set_counterparty(record.counterparty);
  out.set_parent_external_id(record.parent_external_id);
  out.set_mcc(record.mcc);
  util::FromJson(record.payload_json, out.mutable_payload());
  return out;
}

Identity ToProto(const db::model::IdentityRecord& record) {
  Identity out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_fingerprint(record.fingerprint);
  out.set_kind(record.kind);
  *out.mutable_created_at() = util::MillisToProto(static_cast<int64_t>(record.created_at_ms));
  *out.mutable_touched_at() = util::MillisToProto(static_cast<int64_t>(record.touched_at_ms));
  return out;
}

IdentityLink ToProto(const db::model::IdentityLinkRecord& record) {
  IdentityLink out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_identity_id(record.identity_id);
  out.set_raw_event_id(record.raw_event_id);
  out.set_confidence(record.confidence);
  out.set_reason(record.reason);
  return out;
}

IdentityEdge ToProto(const db::model::IdentityEdgeRecord& record) {
  IdentityEdge out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_from_identity_id(record.from_identity_id);
  out.set_to_identity_id(record.to_identity_id);
  out.set_kind(record.kind);
  out.set_weight(record.weight);
  out.set_matcher(record.matcher);
  out.set_reason(record.reason);
  *out.mutable_created_at() = util::MillisToProto(static_cast<int64_t>(record.created_at_ms));
  return out;
}

CashLedgerEntry ToProto(const db::model::LedgerEntryRecord& record) {
  CashLedgerEntry out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_identity_id(record.identity_id);
  *out.mutable_posted_at() = util::MillisToProto(record.posted_at_ms);
  out.set_direction(record.direction);
  out.mutable_amount()->set_amount_minor(record.amount_minor);
  out.mutable_amount()->set_currency(record.currency);
  out.set_classification_key(record.classification_key);
  out.set_confidence(record.confidence);
  util::FromJson(record.provenance_json, out.mutable_provenance());
  return out;
}

ReconException ToProto(const db::model::ExceptionRecord& record) {
  ReconException out;
  out.set_id(record.id);
  out.set_tenant_id(record.tenant_id);
  out.set_kind(record.kind);
  out.set_status(record.status);
  out.set_severity(record.severity);
  util::FromJson(record.context_json, out.mutable_context());
  *out.mutable_created_at() = util::MillisToProto(static_cast<int64_t>(record.created_at_ms));
  *out.mutable_updated_at() = util::MillisToProto(static_cast<int64_t>(record.updated_at_ms));
  if (record.resolved_at_ms != 0) *out.mutable_resolved_at() = util::MillisToProto(static_cast<int64_t>(record.resolved_at_ms));
  out.set_resolution_note(record.resolution_note);
  return out;
}

db::model::RawEventRecord ToRecord(const RawEvent& event) {
  if (event.tenant_id().empty()) throw util::InvalidArgument("tenant_id is required");
  if (event.source().empty()) throw util::InvalidArgument("source is required");
  if (event.external_id().empty()) throw util::InvalidArgument("external_id is required");
  if (event.kind() == EVENT_KIND_UNSPECIFIED || !EventKind_IsValid(event.kind())) throw util::InvalidArgument("event kind is unspecified");
  if (!event.has_occurred_at()) throw util::InvalidArgument("occurred_at is required");
  if (!event.has_amount() || event.amount().amount_minor() == 0) throw util::InvalidArgument("amount must be non-zero");
  if (!PayloadFitsKind(event.payload(), event.kind())) {
    throw util::InvalidArgument("payload variant does not match event kind " + EventKind_Name(event.kind()));
  }

  db::model::RawEventRecord record;
  record.tenant_id          = event.tenant_id();
  record.source             = event.source();
  record.kind               = event.kind();
  record.external_id        = event.external_id();
  record.occurred_at_ms     = util::ProtoToMillis(event.occurred_at());
  record.amount_minor       = event.amount().amount_minor();
  record.currency           = NormalizeCurrency(event.amount().currency());
  record.account_ref        = event.account_ref();
  record.counterparty       = event.counterparty();
  record.parent_external_id = event.parent_external_id();
  record.mcc                = event.mcc();

  RawPayload payload = event.payload();
  if (payload.schema_version() == 0) payload.set_schema_version(kPayloadSchemaVersion);
  record.payload_json = util::ToJson(payload);
  return record;
}

} // namespace cashgraph::core
