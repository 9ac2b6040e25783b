#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace cashgraph::util {

uint64_t NowMillis() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

google::protobuf::Timestamp MillisToProto(int64_t ms) {
  google::protobuf::Timestamp ts;
  int64_t                     seconds = ms / 1000;
  int64_t                     rem     = ms % 1000;
  if (rem < 0) {
    rem += 1000;
    seconds -= 1;
  }
  ts.set_seconds(seconds);
  ts.set_nanos(static_cast<int32_t>(rem * 1000000));
  return ts;
}

int64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  return ts.seconds() * 1000 + ts.nanos() / 1000000;
}

std::chrono::milliseconds DurationFromProto(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
}

std::string UtcDay(int64_t epoch_ms) {
  int64_t seconds = epoch_ms / 1000;
  if (epoch_ms < 0 && epoch_ms % 1000 != 0) {
    seconds -= 1;
  }
  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

} // namespace cashgraph::util
