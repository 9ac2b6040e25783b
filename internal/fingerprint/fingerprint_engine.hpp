#pragma once

#include <string>
#include <string_view>

#include "cashgraph/v1.hpp"
#include "internal/db/model/raw_event_record.hpp"

namespace cashgraph::fingerprint {

struct FingerprintResult {
  // lowercase hex SHA-256 of `basis`
  std::string key;
  // tagged, '|'-joined normalised parts that were hashed
  std::string basis;
  cashgraph::v1::CanonicalKind kind = cashgraph::v1::CANONICAL_KIND_UNSPECIFIED;
  double confidence = 1.0;
  // empty unless normalisation inputs were missing
  std::string degraded_reason;

  bool degraded() const {
    return !degraded_reason.empty();
  }
};

/*
  FingerprintEngine

  Maps a raw event to the canonical key of the real-world event it
  describes. Pure and deterministic: the same event always yields the same
  key, independent of which feed reported it.

    bank txn      SETTLEMENT|account|abs(amount)|YYYY-MM-DD|counterparty
    payout        PAYOUT|provider|payout id
    balance txn   payout sub-type: same key as the payout
                  otherwise CHARGE|REFUND|FEE|provider|external id
    ops records   PAYMENT|provider|id, INVOICE|provider|id

  Missing inputs degrade the result (confidence 0.5) instead of failing.
*/
class FingerprintEngine {
 public:
  static constexpr double kDegradedConfidence = 0.5;

  FingerprintResult Fingerprint(const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload) const;

  // Upper-cases, strips punctuation and rail noise, collapses processor
  // descriptors ("STRIPE TRANSFER ST-9X2" -> "STRIPE").
  static std::string NormalizeCounterparty(std::string_view raw);

  // Canonical processor name for a provider tag or source ("sq" -> "SQUARE").
  static std::string NormalizeProvider(std::string_view raw);

  static std::string Sha256Hex(std::string_view data);

  // Key of the payout identity a component or balance record refers to.
  static std::string PayoutKey(std::string_view provider, std::string_view payout_id);

 private:
  FingerprintResult FingerprintBank(const db::model::RawEventRecord& event) const;
  FingerprintResult FingerprintPayout(const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload) const;
  FingerprintResult FingerprintBalance(const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload) const;
  FingerprintResult FingerprintOps(const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload) const;
};

} // namespace cashgraph::fingerprint
