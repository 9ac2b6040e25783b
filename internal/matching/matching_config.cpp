#include "matching_config.hpp"

#include "internal/util/time.hpp"

namespace cashgraph::matching {

namespace {

void ApplyDuration(const google::protobuf::Duration& d, int64_t& target) {
  const auto ms = util::DurationFromProto(d).count();
  if (ms > 0) target = ms;
}

} // namespace

MatchingConfig FromProto(const cashgraph::runtime::config::MatchingConfig& proto) {
  MatchingConfig cfg;

  if (proto.has_settlement_window()) ApplyDuration(proto.settlement_window(), cfg.settlement_window_ms);
  if (proto.amount_tolerance_minor() > 0) cfg.amount_tolerance_minor = proto.amount_tolerance_minor();
  if (proto.has_drift_window()) ApplyDuration(proto.drift_window(), cfg.drift_window_ms);
  if (proto.has_in_transit_aging()) ApplyDuration(proto.in_transit_aging(), cfg.in_transit_aging_ms);

  if (proto.has_composition_window()) ApplyDuration(proto.composition_window(), cfg.composition_window_ms);
  if (proto.max_subset_pool() > 0) cfg.max_subset_pool = proto.max_subset_pool();
  if (proto.max_reported_subsets() > 0) cfg.max_reported_subsets = proto.max_reported_subsets();

  if (proto.has_ops_match_window()) ApplyDuration(proto.ops_match_window(), cfg.ops_match_window_ms);
  if (proto.similarity_threshold() > 0.0) cfg.similarity_threshold = proto.similarity_threshold();

  if (proto.has_ghost_aging()) ApplyDuration(proto.ghost_aging(), cfg.ghost_aging_ms);
  if (proto.has_timing_escalation()) ApplyDuration(proto.timing_escalation(), cfg.timing_escalation_ms);

  return cfg;
}

} // namespace cashgraph::matching
