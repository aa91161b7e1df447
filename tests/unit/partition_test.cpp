#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/partition/partition_key.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/util/time.hpp"

namespace {

using audit::partition::KeyForDate;
using audit::partition::MonthPartition;

std::set<std::string> Keys(audit::db::Repository& repo) {
  auto tx         = repo.Begin(audit::db::TxMode::kReadOnly);
  auto partitions = repo.ListPartitions(*tx);
  tx->Commit();

  std::set<std::string> keys;
  for (const auto& p : partitions) keys.insert(p.partition_key);
  return keys;
}

void TestKeys() {
  assert(KeyForDate("2025-11-15") == "y2025m11");
  assert(KeyForDate("2025-01-01") == "y2025m01");
  assert(KeyForDate("2024-02-29") == "y2024m02");
}

void TestMonthBoundaries() {
  auto nov = MonthPartition("2025-11-15");
  assert(nov.partition_key == "y2025m11");
  assert(nov.range_start == "2025-11-01");
  assert(nov.range_end == "2025-12-01");

  auto jan = MonthPartition("2025-12-31", 1);
  assert(jan.partition_key == "y2026m01");
  assert(jan.range_start == "2026-01-01");
  assert(jan.range_end == "2026-02-01");

  auto dec = MonthPartition("2025-01-10", -1);
  assert(dec.partition_key == "y2024m12");
  assert(dec.range_end == "2025-01-01");

  auto feb = MonthPartition("2024-02-29");
  assert(feb.range_end == "2024-03-01");
}

void TestTimestampToDate() {
  google::protobuf::Timestamp ts;
  ts.set_seconds(1700000000);
  ts.set_nanos(1500000);
  assert(audit::util::ToUnixMillis(ts) == 1700000000001ULL);

  // negative nanos floor into the previous millisecond instead of wrapping
  ts.set_nanos(-1);
  assert(audit::util::ToUnixMillis(ts) == 1699999999999ULL);
  assert(audit::util::UtcDate(audit::util::ToUnixMillis(ts)) == "2023-11-14");

  ts.set_seconds(253402300799);
  ts.set_nanos(0);
  assert(audit::util::UtcDate(audit::util::ToUnixMillis(ts)) == "9999-12-31");
}

void TestEnsureIsIdempotent() {
  auto repo = std::make_shared<audit::db::memory::MemoryRepository>();

  audit::partition::MaintenanceOptions options;
  options.months_behind = 1;
  options.months_ahead  = 2;
  audit::partition::PartitionManager manager(repo, options);

  // 2025-11-15T12:00:00Z
  const auto keys = manager.EnsurePartitions(1763208000000ULL);
  assert(keys.size() == 4);
  assert(keys.front() == "y2025m10");
  assert(keys.back() == "y2026m01");

  manager.EnsurePartitions(1763208000000ULL);
  const std::set<std::string> expected = {"y2025m10", "y2025m11", "y2025m12", "y2026m01"};
  assert(Keys(*repo) == expected);
}

void TestBackgroundMaintenance() {
  auto repo = std::make_shared<audit::db::memory::MemoryRepository>();
  audit::partition::PartitionManager manager(repo, {});

  manager.Start();
  manager.Stop();

  const auto keys = Keys(*repo);
  assert(keys.count(KeyForDate(audit::util::UtcDate(audit::util::NowMs()))) == 1);
  assert(keys.size() == 4);
}

} // namespace

int main() {
  TestKeys();
  TestMonthBoundaries();
  TestTimestampToDate();
  TestEnsureIsIdempotent();
  TestBackgroundMaintenance();

  std::cout << "audit_store_unit_partition: pass\n";
  return 0;
}
