#pragma once

#include <cstdint>
#include <string>

namespace audit::db::model {

/*
  Legal hold over every event of one correlation_id.
*/

struct LegalHoldRecord {
  std::string correlation_id;
  std::string reason;
  std::string placed_by;
  uint64_t    placed_at_ms = 0;

  // events carrying legal_hold, filled in on read
  uint64_t event_count = 0;
};

} // namespace audit::db::model
