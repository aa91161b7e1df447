#include "internal/lease/lease_table.hpp"

#include <cassert>
#include <iostream>

namespace {

using audit::lease::LeaseTable;

void TestAcquireIsExclusiveUntilExpiry() {
  LeaseTable table;

  auto first = table.Acquire("entry-1", "worker-a", 1000, 500);
  assert(first.has_value());
  assert(first->owner == "worker-a");
  assert(first->expires_at_ms == 1500);
  assert(!first->lease_id.empty());

  assert(!table.Acquire("entry-1", "worker-b", 1200, 500).has_value());
  assert(table.IsHeldBy("entry-1", "worker-a", 1200));
  assert(!table.IsHeldBy("entry-1", "worker-b", 1200));
}

void TestExpiredLeaseCanBeTakenOver() {
  LeaseTable table;

  assert(table.Acquire("entry-2", "worker-a", 1000, 500).has_value());
  assert(!table.HasActive("entry-2", 1500));

  auto takeover = table.Acquire("entry-2", "worker-b", 1600, 500);
  assert(takeover.has_value());
  assert(takeover->owner == "worker-b");
  assert(!table.IsHeldBy("entry-2", "worker-a", 1600));
  assert(table.Size() == 1);
}

void TestReleaseFreesEntry() {
  LeaseTable table;

  assert(table.Acquire("entry-3", "worker-a", 1000, 500).has_value());
  assert(table.Acquire("entry-4", "worker-a", 1000, 500).has_value());
  assert(table.Size() == 2);

  table.Release("entry-3");
  assert(!table.HasActive("entry-3", 1100));
  assert(table.HasActive("entry-4", 1100));
  assert(table.Size() == 1);

  assert(table.Acquire("entry-3", "worker-b", 1100, 500).has_value());

  // releasing an unknown entry is a no-op
  table.Release("entry-unknown");
  assert(table.Size() == 2);
}

} // namespace

int main() {
  TestAcquireIsExclusiveUntilExpiry();
  TestExpiredLeaseCanBeTakenOver();
  TestReleaseFreesEntry();

  std::cout << "audit_store_unit_lease_table: pass\n";
  return 0;
}
