#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace engram::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                   std::chrono::nanoseconds(ts.nanos()));
}

std::string FormatRfc3339(TimePoint tp) {
  auto ts = ToProto(tp);
  ts.set_nanos(0);
  return google::protobuf::util::TimeUtil::ToString(ts);
}

std::string NowRfc3339() {
  return FormatRfc3339(Now());
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

double ToUnixSeconds(TimePoint tp) {
  const auto micros = std::chrono::floor<std::chrono::microseconds>(tp.time_since_epoch());
  return static_cast<double>(micros.count()) / 1e6;
}

} // namespace engram::util
