#pragma once

#include <cstdint>
#include <string>

namespace audit::lease {

// Exclusive claim on one DLQ entry. Times are unix millis.
struct Lease {
  std::string lease_id;
  std::string entry_id;
  std::string owner;

  uint64_t expires_at_ms = 0;
};

}
