#pragma once

#include <string>

namespace audit::db::model {

/*
  One monthly bucket: [range_start, range_end), dates as YYYY-MM-DD.
*/

struct PartitionRecord {
  std::string partition_key; // y2025m11
  std::string range_start;
  std::string range_end;
};

} // namespace audit::db::model
