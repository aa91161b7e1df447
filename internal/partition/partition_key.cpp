#include "partition_key.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace audit::partition {

namespace {

std::chrono::year_month ParseMonth(const std::string& date) {
  const auto day = std::chrono::sys_days{std::chrono::floor<std::chrono::days>(
      std::chrono::sys_time<std::chrono::milliseconds>(std::chrono::milliseconds(util::UtcDateToMillis(date))))};
  const std::chrono::year_month_day ymd{day};
  return {ymd.year(), ymd.month()};
}

std::string FirstDay(std::chrono::year_month ym) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-01", static_cast<int>(ym.year()), static_cast<unsigned>(ym.month()));
  return buf;
}

std::string Key(std::chrono::year_month ym) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "y%04dm%02u", static_cast<int>(ym.year()), static_cast<unsigned>(ym.month()));
  return buf;
}

} // namespace

std::string KeyForDate(const std::string& date) {
  return Key(ParseMonth(date));
}

db::model::PartitionRecord MonthPartition(const std::string& date, int month_offset) {
  const auto month = ParseMonth(date) + std::chrono::months{month_offset};
  const auto next  = month + std::chrono::months{1};

  db::model::PartitionRecord record;
  record.partition_key = Key(month);
  record.range_start   = FirstDay(month);
  record.range_end     = FirstDay(next);
  return record;
}

} // namespace audit::partition
