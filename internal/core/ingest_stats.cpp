#include "ingest_stats.hpp"

namespace audit::core {

void IngestStats::RecordRejected(const std::string& reason) {
  ++rejected_;
  std::lock_guard lock(reasons_mutex_);
  ++rejected_by_reason_[reason];
}

IngestCounters IngestStats::Snapshot() const {
  IngestCounters c;
  c.accepted               = accepted_.load();
  c.rejected               = rejected_.load();
  c.stored                 = stored_.load();
  c.duplicates             = duplicates_.load();
  c.queued                 = queued_.load();
  c.dlq_enqueue_failed     = dlq_enqueue_failed_.load();
  c.partition_missing      = partition_missing_.load();
  c.write_latency_us_sum   = write_latency_us_sum_.load();
  c.write_latency_us_count = write_latency_us_count_.load();

  std::lock_guard lock(reasons_mutex_);
  c.rejected_by_reason = rejected_by_reason_;
  return c;
}

} // namespace audit::core
