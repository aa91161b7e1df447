#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/event_writer.hpp"
#include "internal/runtime/background_worker.hpp"
#include "queue.hpp"

namespace audit::dlq {

struct RecoveryOptions {
  uint32_t workers     = 1;
  uint32_t batch_size  = 10;
  uint32_t max_retries = 6;

  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{300000};
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds lease_duration{30000};
  std::chrono::milliseconds shutdown_drain_timeout{10000};
};

struct RecoveryCounters {
  uint64_t replayed      = 0;
  uint64_t rescheduled   = 0;
  uint64_t dead_lettered = 0;
};

/*
  Drains the DLQ through the shared validated write path.

  Each pool thread leases its own batch, so an entry has at most one
  in-flight replay. A failed replay is rescheduled with exponential
  backoff until retry_count reaches max_retries, then dead-lettered.

  Stop() runs one last pass that ignores backoff, bounded by
  shutdown_drain_timeout.
*/
class RecoveryWorker : public runtime::BackgroundWorker {
 public:
  RecoveryWorker(std::shared_ptr<Queue> queue, std::shared_ptr<core::EventWriter> writer, RecoveryOptions options);
  ~RecoveryWorker() override;

  void Start() override;
  void Stop() override;

  // One lease / replay / settle cycle for entries due at now_ms.
  // Returns the number of entries processed.
  std::size_t DrainOnce(uint64_t now_ms);

  RecoveryCounters Counters() const;

 private:
  std::size_t Cycle(const std::string& owner, uint64_t now_ms);

  void Process(const std::string& owner, const DlqEntry& entry, uint64_t now_ms);

  void Run(const std::string& owner);

  void FinalDrain();

  std::string OwnerName(uint32_t index) const;

  std::shared_ptr<Queue>             queue_;
  std::shared_ptr<core::EventWriter> writer_;
  RecoveryOptions                    options_;
  std::string                        instance_id_;

  std::vector<std::thread> threads_;
  std::mutex               mutex_;
  std::condition_variable  cv_;
  bool                     stopping_ = false;
  std::atomic<bool>        running_{false};

  std::atomic<uint64_t> replayed_{0};
  std::atomic<uint64_t> rescheduled_{0};
  std::atomic<uint64_t> dead_lettered_{0};
};

} // namespace audit::dlq
