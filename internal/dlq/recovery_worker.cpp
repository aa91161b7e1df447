#include "recovery_worker.hpp"

#include <algorithm>
#include <limits>

#include "backoff.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace audit::dlq {

using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kMaxWorkers = 8;

} // namespace

RecoveryWorker::RecoveryWorker(std::shared_ptr<Queue> queue, std::shared_ptr<core::EventWriter> writer,
                               RecoveryOptions options)
    : queue_(std::move(queue)), writer_(std::move(writer)), options_(options),
      instance_id_(util::GenerateUUIDString().substr(0, 8)) {
  options_.workers    = std::clamp<uint32_t>(options_.workers, 1, kMaxWorkers);
  options_.batch_size = std::max<uint32_t>(options_.batch_size, 1);
  options_.max_retries = std::max<uint32_t>(options_.max_retries, 1);
}

RecoveryWorker::~RecoveryWorker() {
  Stop();
}

void RecoveryWorker::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }

  for (uint32_t i = 0; i < options_.workers; ++i) {
    threads_.emplace_back(&RecoveryWorker::Run, this, OwnerName(i));
  }

  AUDIT_LOG_INFO("DLQ recovery worker started",
                 {IntField("workers", options_.workers), IntField("batch_size", options_.batch_size),
                  IntField("max_retries", options_.max_retries)});
}

void RecoveryWorker::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();

  FinalDrain();
  AUDIT_LOG_INFO("DLQ recovery worker stopped", {});
}

std::size_t RecoveryWorker::DrainOnce(uint64_t now_ms) {
  return Cycle(OwnerName(0), now_ms);
}

RecoveryCounters RecoveryWorker::Counters() const {
  RecoveryCounters c;
  c.replayed      = replayed_.load();
  c.rescheduled   = rescheduled_.load();
  c.dead_lettered = dead_lettered_.load();
  return c;
}

std::size_t RecoveryWorker::Cycle(const std::string& owner, uint64_t now_ms) {
  LeaseRequest req;
  req.owner          = owner;
  req.now_ms         = now_ms;
  req.due_before_ms  = now_ms;
  req.max_entries    = options_.batch_size;
  req.lease_duration = options_.lease_duration;

  const auto batch = queue_->LeaseDue(req);
  for (const auto& entry : batch) {
    Process(owner, entry, now_ms);
  }

  observability::Metrics::Instance().SetDlqDepth(queue_->Depth());
  return batch.size();
}

void RecoveryWorker::Process(const std::string& owner, const DlqEntry& entry, uint64_t now_ms) {
  std::string error;
  try {
    writer_->Replay(entry.destination, entry.payload, now_ms);
  } catch (const std::exception& e) {
    error = e.what();
  }

  try {
    if (error.empty()) {
      queue_->Complete(entry.entry_id, owner);
      ++replayed_;
      AUDIT_LOG_INFO("DLQ entry replayed", {StringField("entry_id", entry.entry_id),
                                            StringField("destination", entry.destination),
                                            IntField("retry_count", entry.retry_count)});
      return;
    }

    const uint32_t retry_count = entry.retry_count + 1;
    if (retry_count >= options_.max_retries) {
      queue_->DeadLetter(entry.entry_id, owner, error, now_ms);
      ++dead_lettered_;
      observability::Metrics::Instance().RecordDeadLetter(entry.destination);
      AUDIT_LOG_ERROR("DLQ entry dead-lettered",
                      {StringField("entry_id", entry.entry_id), StringField("destination", entry.destination),
                       IntField("retry_count", retry_count), StringField("error", error)});
      return;
    }

    const auto delay = BackoffDelay(retry_count, options_.initial_backoff, options_.max_backoff);
    queue_->Reschedule(entry.entry_id, owner, error, now_ms + static_cast<uint64_t>(delay.count()));
    ++rescheduled_;
    AUDIT_LOG_WARN("DLQ replay failed, rescheduled",
                   {StringField("entry_id", entry.entry_id), StringField("destination", entry.destination),
                    IntField("retry_count", retry_count), IntField("backoff_ms", delay.count()),
                    StringField("error", error)});
  } catch (const util::LeaseConflict& e) {
    // Lease expired mid-replay and another owner took the entry over.
    AUDIT_LOG_WARN("DLQ entry lost lease during replay",
                   {StringField("entry_id", entry.entry_id), StringField("owner", owner), StringField("error", e.what())});
  }
}

void RecoveryWorker::Run(const std::string& owner) {
  for (;;) {
    try {
      Cycle(owner, util::NowMs());
    } catch (const std::exception& e) {
      AUDIT_LOG_ERROR("DLQ recovery cycle failed", {StringField("owner", owner), StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_; })) return;
  }
}

void RecoveryWorker::FinalDrain() {
  const auto deadline = std::chrono::steady_clock::now() + options_.shutdown_drain_timeout;
  const auto owner    = OwnerName(0);

  try {
    const auto depth = queue_->Depth();
    if (depth == 0) return;

    const uint64_t now_ms = util::NowMs();

    LeaseRequest req;
    req.owner          = owner;
    req.now_ms         = now_ms;
    req.due_before_ms  = kNoDueHorizon;
    req.max_entries    = static_cast<uint32_t>(std::min<uint64_t>(depth, std::numeric_limits<uint32_t>::max()));
    req.lease_duration = options_.lease_duration;

    const auto batch = queue_->LeaseDue(req);

    std::size_t processed = 0;
    for (const auto& entry : batch) {
      if (std::chrono::steady_clock::now() >= deadline) break;
      Process(owner, entry, util::NowMs());
      ++processed;
    }

    // Unprocessed entries keep their lease and are reclaimed once it expires.
    AUDIT_LOG_INFO("DLQ shutdown drain finished",
                   {IntField("processed", static_cast<int64_t>(processed)),
                    IntField("remaining", static_cast<int64_t>(batch.size() - processed))});
  } catch (const std::exception& e) {
    AUDIT_LOG_ERROR("DLQ shutdown drain failed", {StringField("error", e.what())});
  }
}

std::string RecoveryWorker::OwnerName(uint32_t index) const {
  return "recovery-" + instance_id_ + "-" + std::to_string(index);
}

} // namespace audit::dlq
