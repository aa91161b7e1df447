#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace audit::util {

/*
  Wall-clock and calendar helpers for timestamps and partition keys.

  Calendar helpers are always UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

uint64_t ToUnixMillis(TimePoint tp);
uint64_t ToUnixMillis(const google::protobuf::Timestamp& ts);

uint64_t NowMs();

// "YYYY-MM-DD" of the UTC day containing unix_ms.
std::string UtcDate(uint64_t unix_ms);

// Inverse of UtcDate: unix millis of 00:00:00 UTC on that day.
// Throws std::invalid_argument on a malformed date.
uint64_t UtcDateToMillis(const std::string& date);

} // namespace audit::util
