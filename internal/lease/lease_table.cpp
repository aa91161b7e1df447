#include "lease_table.hpp"

#include "internal/util/uuid.hpp"

namespace audit::lease {

bool LeaseTable::IsExpired(const Lease& lease, uint64_t now_ms) {
  return lease.expires_at_ms <= now_ms;
}

std::string LeaseTable::GenerateLeaseID() {
  return util::GenerateUUIDString();
}

void LeaseTable::EraseLocked(const std::string& entry_id) {
  auto it = by_entry_.find(entry_id);
  if (it == by_entry_.end()) return;

  leases_.erase(it->second);
  by_entry_.erase(it);
}

std::optional<Lease> LeaseTable::FindLive(const std::string& entry_id, uint64_t now_ms) {
  auto it = by_entry_.find(entry_id);
  if (it == by_entry_.end()) return std::nullopt;

  auto lease_it = leases_.find(it->second);
  if (lease_it == leases_.end() || IsExpired(lease_it->second, now_ms)) {
    EraseLocked(entry_id);
    return std::nullopt;
  }
  return lease_it->second;
}

std::optional<Lease> LeaseTable::Acquire(const std::string& entry_id, const std::string& owner, uint64_t now_ms,
                                         uint64_t duration_ms) {
  std::lock_guard lock(mutex_);

  if (auto live = FindLive(entry_id, now_ms); live && live->owner != owner) return std::nullopt;
  EraseLocked(entry_id);

  Lease lease;
  lease.lease_id      = GenerateLeaseID();
  lease.entry_id      = entry_id;
  lease.owner         = owner;
  lease.expires_at_ms = now_ms + duration_ms;

  leases_[lease.lease_id] = lease;
  by_entry_[entry_id]     = lease.lease_id;
  return lease;
}

bool LeaseTable::IsHeldBy(const std::string& entry_id, const std::string& owner, uint64_t now_ms) {
  std::lock_guard lock(mutex_);

  auto live = FindLive(entry_id, now_ms);
  return live && live->owner == owner;
}

bool LeaseTable::HasActive(const std::string& entry_id, uint64_t now_ms) {
  std::lock_guard lock(mutex_);
  return FindLive(entry_id, now_ms).has_value();
}

void LeaseTable::Release(const std::string& entry_id) {
  std::lock_guard lock(mutex_);
  EraseLocked(entry_id);
}

std::size_t LeaseTable::Size() {
  std::lock_guard lock(mutex_);
  return leases_.size();
}

} // namespace audit::lease
