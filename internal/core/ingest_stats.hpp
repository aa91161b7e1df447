#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace audit::core {

struct IngestCounters {
  uint64_t accepted           = 0;
  uint64_t rejected           = 0;
  uint64_t stored             = 0;
  uint64_t duplicates         = 0;
  uint64_t queued             = 0;
  uint64_t dlq_enqueue_failed = 0;
  uint64_t partition_missing  = 0;

  std::map<std::string, uint64_t> rejected_by_reason;

  uint64_t write_latency_us_sum   = 0;
  uint64_t write_latency_us_count = 0;
};

// In-process ingestion counters, safe for concurrent writers.
class IngestStats {
 public:
  void RecordStored() {
    ++accepted_;
    ++stored_;
  }

  void RecordDuplicate() {
    ++accepted_;
    ++duplicates_;
  }

  void RecordQueued() {
    ++accepted_;
    ++queued_;
  }

  void RecordRejected(const std::string& reason);

  void RecordDlqEnqueueFailed() {
    ++dlq_enqueue_failed_;
  }

  void RecordPartitionMissing() {
    ++partition_missing_;
  }

  void ObserveWriteLatencyUs(uint64_t us) {
    write_latency_us_sum_ += us;
    ++write_latency_us_count_;
  }

  IngestCounters Snapshot() const;

 private:
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> stored_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> queued_{0};
  std::atomic<uint64_t> dlq_enqueue_failed_{0};
  std::atomic<uint64_t> partition_missing_{0};
  std::atomic<uint64_t> write_latency_us_sum_{0};
  std::atomic<uint64_t> write_latency_us_count_{0};

  mutable std::mutex              reasons_mutex_;
  std::map<std::string, uint64_t> rejected_by_reason_;
};

} // namespace audit::core
