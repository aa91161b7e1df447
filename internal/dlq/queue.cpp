#include "queue.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace audit::dlq {

namespace {

bool Crossed(uint64_t before, uint64_t after, uint64_t max_entries, uint64_t percent) {
  const auto threshold = max_entries * percent;
  return before * 100 < threshold && after * 100 >= threshold;
}

} // namespace

void EnsureCapacity(uint64_t depth, uint64_t max_entries) {
  if (max_entries > 0 && depth >= max_entries) {
    throw util::ResourceExhausted("dlq full: " + std::to_string(depth) + "/" + std::to_string(max_entries) + " entries");
  }
}

void ReportCapacity(uint64_t depth_before, uint64_t depth_after, uint64_t max_entries) {
  if (max_entries == 0) return;

  if (Crossed(depth_before, depth_after, max_entries, 90)) {
    AUDIT_LOG_ERROR("DLQ above 90% capacity", {observability::IntField("depth", static_cast<int64_t>(depth_after)),
                                               observability::IntField("max_entries", static_cast<int64_t>(max_entries))});
  } else if (Crossed(depth_before, depth_after, max_entries, 80)) {
    AUDIT_LOG_WARN("DLQ above 80% capacity", {observability::IntField("depth", static_cast<int64_t>(depth_after)),
                                              observability::IntField("max_entries", static_cast<int64_t>(max_entries))});
  }
}

} // namespace audit::dlq
