#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace engram::util {

/*
  Time utilities. Stored timestamps are RFC3339 strings in UTC
  ("2024-01-15T10:30:00Z"); parsing accepts any RFC3339 offset and
  fractional seconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Whole-second UTC rendering, e.g. "2024-01-15T10:30:00Z".
std::string FormatRfc3339(TimePoint tp);

// Current time rendered with FormatRfc3339.
std::string NowRfc3339();

std::optional<TimePoint> ParseRfc3339(const std::string& text);

// Fractional seconds since the unix epoch, floored to whole microseconds.
// Time range filters on every backend compare these values.
double ToUnixSeconds(TimePoint tp);

} // namespace engram::util
