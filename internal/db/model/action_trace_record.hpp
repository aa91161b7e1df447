#pragma once

#include <cstdint>
#include <string>

namespace audit::db::model {

/*
  One remediation action execution. Append-only, read by analytics.
*/

struct ActionTraceRecord {
  std::string action_id;

  std::string incident_type;
  std::string alert_name;
  std::string incident_severity;

  std::string playbook_id;
  std::string playbook_version;
  int32_t     playbook_step_number = 0;
  std::string playbook_execution_id;

  bool catalog_selected  = false;
  bool chained           = false;
  bool manual_escalation = false;

  std::string action_type;
  std::string execution_status;

  uint64_t action_timestamp_ms = 0;
  std::string action_date; // YYYY-MM-DD (UTC), partition routing
};

} // namespace audit::db::model
