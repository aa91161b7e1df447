#include "partition_manager.hpp"

#include "internal/core/event_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "partition_key.hpp"

namespace audit::partition {

using observability::IntField;
using observability::StringField;

PartitionManager::PartitionManager(std::shared_ptr<db::Repository> repository, MaintenanceOptions options)
    : repository_(std::move(repository)), options_(options) {
}

PartitionManager::~PartitionManager() {
  Stop();
}

std::vector<std::string> PartitionManager::EnsurePartitions(uint64_t now_ms) {
  const auto today = util::UtcDate(now_ms);

  std::vector<std::string> keys;
  auto                     tx = repository_->Begin();

  const int first = -static_cast<int>(options_.months_behind);
  const int last  = static_cast<int>(options_.months_ahead);

  for (int offset = first; offset <= last; ++offset) {
    const auto partition = MonthPartition(today, offset);
    const auto result    = repository_->CreatePartition(*tx, partition);
    if (!result) {
      core::RaiseStoreError(result, "create partition " + partition.partition_key);
    }
    keys.push_back(partition.partition_key);
  }

  tx->Commit();
  return keys;
}

void PartitionManager::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  thread_   = std::thread(&PartitionManager::Run, this);
}

void PartitionManager::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
}

void PartitionManager::Run() {
  for (;;) {
    try {
      const auto keys = EnsurePartitions(util::NowMs());
      AUDIT_LOG_INFO("Partitions ensured", {IntField("count", static_cast<int64_t>(keys.size())),
                                            StringField("first", keys.front()), StringField("last", keys.back())});
    } catch (const std::exception& e) {
      AUDIT_LOG_ERROR("Partition maintenance failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, options_.interval, [this] { return stopping_; })) return;
  }
}

} // namespace audit::partition
