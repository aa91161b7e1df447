#include "time.hpp"

#include <cstdio>
#include <limits>
#include <stdexcept>

namespace audit::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMillis(const google::protobuf::Timestamp& ts) {
  constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / 1000 - 1;
  if (ts.seconds() <= 0 && ts.nanos() <= 0) return 0;
  if (ts.seconds() >= kMaxSeconds) return static_cast<uint64_t>(kMaxSeconds) * 1000;

  // floor, so a negative nanos moves back into the previous millisecond
  int64_t ms = ts.seconds() * 1000 + ts.nanos() / 1000000;
  if (ts.nanos() < 0 && ts.nanos() % 1000000 != 0) --ms;
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

std::string UtcDate(uint64_t unix_ms) {
  const std::chrono::sys_days day =
      std::chrono::floor<std::chrono::days>(std::chrono::sys_time<std::chrono::milliseconds>(std::chrono::milliseconds(unix_ms)));
  const std::chrono::year_month_day ymd{day};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

uint64_t UtcDateToMillis(const std::string& date) {
  int      y = 0;
  unsigned m = 0;
  unsigned d = 0;
  if (date.size() != 10 || std::sscanf(date.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
    throw std::invalid_argument("malformed date: " + date);
  }

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!ymd.ok()) {
    throw std::invalid_argument("malformed date: " + date);
  }

  const std::chrono::sys_days day{ymd};
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(day.time_since_epoch()).count());
}

} // namespace audit::util
