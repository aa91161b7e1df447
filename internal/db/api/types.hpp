#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

#include "internal/db/model/action_trace_record.hpp"

namespace audit::db {

/*
  Action trace scan filter. Unset dimensions match everything;
  the time window is [since_ms, until_ms).
*/
struct ActionTraceFilter {
  std::optional<std::string> incident_type;
  std::optional<std::string> playbook_id;
  std::optional<std::string> playbook_version;
  std::optional<std::string> action_type;

  uint64_t since_ms = 0;
  uint64_t until_ms = std::numeric_limits<uint64_t>::max();
};

bool Matches(const ActionTraceFilter& filter, const model::ActionTraceRecord& record);

using ActionTraceVisitor = std::function<void(const model::ActionTraceRecord&)>;

} // namespace audit::db
