#include "fingerprint_engine.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cashgraph::fingerprint {

using namespace cashgraph::v1;

namespace {

const std::unordered_map<std::string, std::string>& ProcessorTokens() {
  static const std::unordered_map<std::string, std::string> kTokens = {
      {"STRIPE", "STRIPE"},   {"SQUARE", "SQUARE"},   {"SQ", "SQUARE"},        {"PAYPAL", "PAYPAL"},
      {"JOBBERPAY", "JOBBER"}, {"JOBBER", "JOBBER"},   {"INTUIT", "INTUIT"},    {"SHOPIFY", "SHOPIFY"},
      {"ADYEN", "ADYEN"},     {"BRAINTREE", "BRAINTREE"}};
  return kTokens;
}

const std::unordered_set<std::string>& RailNoise() {
  static const std::unordered_set<std::string> kNoise = {"ACH", "CCD",  "PPD", "WEB", "DEPOSIT", "TRANSFER", "PAYMENT", "DES",
                                                         "ID",  "INDN", "CO",  "ENTRY", "POS",   "DEBIT",    "CREDIT"};
  return kNoise;
}

std::vector<std::string> Tokenize(std::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (unsigned char c : raw) {
    cleaned.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : ' ');
  }

  std::vector<std::string> tokens;
  std::istringstream       in(cleaned);
  std::string              token;
  while (in >> token) tokens.push_back(token);
  return tokens;
}

bool HasDigit(const std::string& token) {
  return std::any_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Join(const std::vector<std::string>& parts, char sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out.push_back(sep);
    out += parts[i];
  }
  return out;
}

FingerprintResult Finish(std::vector<std::string> parts, CanonicalKind kind, std::string degraded_reason) {
  FingerprintResult result;
  result.basis           = Join(parts, '|');
  result.key             = FingerprintEngine::Sha256Hex(result.basis);
  result.kind            = kind;
  result.degraded_reason = std::move(degraded_reason);
  result.confidence      = result.degraded() ? FingerprintEngine::kDegradedConfidence : 1.0;
  return result;
}

std::string ProviderOf(const std::string& detail_provider, const db::model::RawEventRecord& event) {
  return FingerprintEngine::NormalizeProvider(detail_provider.empty() ? event.source : detail_provider);
}

} // namespace

// ------------------------------------------------------------------
// Normalisation
// ------------------------------------------------------------------

std::string FingerprintEngine::NormalizeCounterparty(std::string_view raw) {
  const auto tokens = Tokenize(raw);

  const auto& processors = ProcessorTokens();
  for (const auto& token : tokens) {
    auto it = processors.find(token);
    if (it != processors.end()) return it->second;
  }

  std::vector<std::string> kept;
  for (const auto& token : tokens) {
    if (HasDigit(token) || RailNoise().contains(token)) continue;
    kept.push_back(token);
  }
  return Join(kept, ' ');
}

std::string FingerprintEngine::NormalizeProvider(std::string_view raw) {
  const auto tokens = Tokenize(raw);

  const auto& processors = ProcessorTokens();
  for (const auto& token : tokens) {
    auto it = processors.find(token);
    if (it != processors.end()) return it->second;
  }
  return Join(tokens, ' ');
}

std::string FingerprintEngine::Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("sha256: digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

std::string FingerprintEngine::PayoutKey(std::string_view provider, std::string_view payout_id) {
  return Sha256Hex(Join({"PAYOUT", NormalizeProvider(provider), std::string(payout_id)}, '|'));
}

// ------------------------------------------------------------------
// Per-kind keys
// ------------------------------------------------------------------

FingerprintResult FingerprintEngine::Fingerprint(const db::model::RawEventRecord& event, const RawPayload& payload) const {
  switch (event.kind) {
    case EVENT_KIND_BANK_TXN:
      return FingerprintBank(event);
    case EVENT_KIND_PAYOUT:
      return FingerprintPayout(event, payload);
    case EVENT_KIND_BALANCE_TXN:
      return FingerprintBalance(event, payload);
    case EVENT_KIND_OPS_PAYMENT:
    case EVENT_KIND_OPS_INVOICE:
      return FingerprintOps(event, payload);
    default:
      throw util::InvalidArgument("fingerprint: event kind is unspecified");
  }
}

FingerprintResult FingerprintEngine::FingerprintBank(const db::model::RawEventRecord& event) const {
  const auto counterparty = NormalizeCounterparty(event.counterparty);

  // zero amounts are rejected before fingerprinting
  std::string degraded;
  if (event.account_ref.empty()) degraded = "missing account reference";

  return Finish({"SETTLEMENT", event.account_ref, std::to_string(std::llabs(event.amount_minor)), util::UtcDay(event.occurred_at_ms), counterparty},
                CANONICAL_KIND_SETTLEMENT, std::move(degraded));
}

FingerprintResult FingerprintEngine::FingerprintPayout(const db::model::RawEventRecord& event, const RawPayload& payload) const {
  const auto provider = ProviderOf(payload.has_payout() ? payload.payout().provider() : std::string{}, event);
  return Finish({"PAYOUT", provider, event.external_id}, CANONICAL_KIND_PAYOUT, {});
}

FingerprintResult FingerprintEngine::FingerprintBalance(const db::model::RawEventRecord& event, const RawPayload& payload) const {
  const auto& detail   = payload.balance();
  const auto  provider = ProviderOf(detail.provider(), event);
  const auto  sub_type = Lower(detail.sub_type());

  if (sub_type == "payout") {
    const auto& payout_id = !detail.source_payout_id().empty() ? detail.source_payout_id() : event.parent_external_id;
    if (payout_id.empty()) {
      return Finish({"PAYOUT", provider, event.external_id}, CANONICAL_KIND_PAYOUT, "payout reference without payout id");
    }
    return Finish({"PAYOUT", provider, payout_id}, CANONICAL_KIND_PAYOUT, {});
  }
  if (sub_type == "charge") return Finish({"CHARGE", provider, event.external_id}, CANONICAL_KIND_CHARGE, {});
  if (sub_type == "refund") return Finish({"REFUND", provider, event.external_id}, CANONICAL_KIND_REFUND, {});
  if (sub_type == "fee") return Finish({"FEE", provider, event.external_id}, CANONICAL_KIND_FEE, {});

  // Sub-type missing or unknown: infer from the sign.
  const auto reason = sub_type.empty() ? std::string("balance transaction without sub-type") : "unknown balance sub-type '" + sub_type + "'";
  if (event.amount_minor < 0) return Finish({"REFUND", provider, event.external_id}, CANONICAL_KIND_REFUND, reason);
  return Finish({"CHARGE", provider, event.external_id}, CANONICAL_KIND_CHARGE, reason);
}

FingerprintResult FingerprintEngine::FingerprintOps(const db::model::RawEventRecord& event, const RawPayload& payload) const {
  const auto provider = ProviderOf(payload.has_ops() ? payload.ops().provider() : std::string{}, event);
  if (event.kind == EVENT_KIND_OPS_INVOICE) {
    return Finish({"INVOICE", provider, event.external_id}, CANONICAL_KIND_INVOICE, {});
  }
  return Finish({"PAYMENT", provider, event.external_id}, CANONICAL_KIND_PAYMENT, {});
}

} // namespace cashgraph::fingerprint
