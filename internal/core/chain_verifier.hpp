#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "event_store.hpp"

namespace audit::core {

struct ChainReport {
  bool        valid          = true;
  uint64_t    events_checked = 0;
  std::string broken_event_id;
  std::string detail;
};

/*
  Recomputes the per-correlation hash chain in insertion order and
  stops at the first link that disagrees with what was stored.
*/
class ChainVerifier {
 public:
  explicit ChainVerifier(std::shared_ptr<EventStore> store);

  ChainReport Verify(const std::string& correlation_id) const;

 private:
  std::shared_ptr<EventStore> store_;
};

} // namespace audit::core
