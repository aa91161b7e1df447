#pragma once

#include <string>

#include "internal/db/model/partition_record.hpp"

namespace audit::partition {

/*
  Monthly partitioning.

  A partition covers [first day of month, first day of next month) in UTC
  and is named yYYYYmMM, e.g. y2025m11.
*/

// Partition key for a "YYYY-MM-DD" date.
std::string KeyForDate(const std::string& date);

// Partition for the month offset `month_offset` months from the month
// containing `date` (negative offsets go back in time).
db::model::PartitionRecord MonthPartition(const std::string& date, int month_offset = 0);

} // namespace audit::partition
