#include "types.hpp"

namespace audit::db {

bool Matches(const ActionTraceFilter& filter, const model::ActionTraceRecord& record) {
  if (record.action_timestamp_ms < filter.since_ms || record.action_timestamp_ms >= filter.until_ms) return false;
  if (filter.incident_type && record.incident_type != *filter.incident_type) return false;
  if (filter.playbook_id && record.playbook_id != *filter.playbook_id) return false;
  if (filter.playbook_version && record.playbook_version != *filter.playbook_version) return false;
  if (filter.action_type && record.action_type != *filter.action_type) return false;
  return true;
}

} // namespace audit::db
