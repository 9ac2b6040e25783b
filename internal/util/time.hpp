#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace cashgraph::util {

// All ledger instants are epoch milliseconds, UTC.

uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(int64_t ms);
int64_t                     ProtoToMillis(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds DurationFromProto(const google::protobuf::Duration& d);

// UTC calendar day ("YYYY-MM-DD") of an epoch-millisecond instant.
std::string UtcDay(int64_t epoch_ms);

constexpr int64_t kMillisPerHour = 3600LL * 1000LL;
constexpr int64_t kMillisPerDay  = 24LL * kMillisPerHour;

} // namespace cashgraph::util
