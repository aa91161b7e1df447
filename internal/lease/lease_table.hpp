#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace audit::lease {

/*
  At most one live lease per entry. Expired leases are pruned lazily and
  can be taken over by any owner.
*/
class LeaseTable {
 public:
  // nullopt if another owner holds an unexpired lease on the entry.
  std::optional<Lease> Acquire(const std::string& entry_id, const std::string& owner, uint64_t now_ms,
                               uint64_t duration_ms);

  // true if owner holds an unexpired lease on the entry.
  bool IsHeldBy(const std::string& entry_id, const std::string& owner, uint64_t now_ms);

  bool HasActive(const std::string& entry_id, uint64_t now_ms);

  void Release(const std::string& entry_id);

  std::size_t Size();

 private:
  std::mutex mutex_;

  std::unordered_map<std::string, Lease>       leases_;
  std::unordered_map<std::string, std::string> by_entry_;

  std::optional<Lease> FindLive(const std::string& entry_id, uint64_t now_ms);
  void                 EraseLocked(const std::string& entry_id);

  static bool        IsExpired(const Lease& lease, uint64_t now_ms);
  static std::string GenerateLeaseID();
};

} // namespace audit::lease
