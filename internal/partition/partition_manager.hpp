#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/runtime/background_worker.hpp"

namespace audit::partition {

struct MaintenanceOptions {
  uint32_t months_behind = 1;
  uint32_t months_ahead  = 2;

  std::chrono::milliseconds interval{3600000};
};

/*
  Keeps monthly buckets provisioned around the current month.

  Partitions are never created on insert; this is the only writer of
  partition rows.
*/
class PartitionManager : public runtime::BackgroundWorker {
 public:
  PartitionManager(std::shared_ptr<db::Repository> repository, MaintenanceOptions options);
  ~PartitionManager() override;

  // Creates [now - months_behind, now + months_ahead] in one transaction.
  // Idempotent. Returns the keys that were ensured.
  std::vector<std::string> EnsurePartitions(uint64_t now_ms);

  void Start() override;
  void Stop() override;

 private:
  void Run();

  std::shared_ptr<db::Repository> repository_;
  MaintenanceOptions              options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
};

} // namespace audit::partition
