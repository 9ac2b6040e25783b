#pragma once

#include <cstddef>
#include <cstdint>

#include "config/config.pb.h"

namespace cashgraph::matching {

/*
  Matcher tunables, passed explicitly to every run.
  Windows are in milliseconds; amounts in minor units.
*/
struct MatchingConfig {
  int64_t settlement_window_ms   = 2 * 24 * 3600 * 1000LL;
  int64_t amount_tolerance_minor = 100;
  int64_t drift_window_ms        = 7 * 24 * 3600 * 1000LL;
  int64_t in_transit_aging_ms    = 5 * 24 * 3600 * 1000LL;

  int64_t     composition_window_ms = 7 * 24 * 3600 * 1000LL;
  std::size_t max_subset_pool       = 20;
  std::size_t max_reported_subsets  = 10;

  int64_t ops_match_window_ms  = 24 * 3600 * 1000LL;
  double  similarity_threshold = 0.6;

  int64_t ghost_aging_ms       = 3 * 24 * 3600 * 1000LL;
  int64_t timing_escalation_ms = 7 * 24 * 3600 * 1000LL;
};

// Unset (zero) proto fields keep the defaults above.
MatchingConfig FromProto(const cashgraph::runtime::config::MatchingConfig& proto);

} // namespace cashgraph::matching
