#include "memory_repository.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "internal/partition/partition_key.hpp"
#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace audit::db::memory {

namespace {

std::optional<std::string> PartitionKeyOf(const std::string& date) {
  try {
    return partition::KeyForDate(date);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

} // namespace

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result ReadOnly() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

const model::AuditEventRecord* MemoryRepository::FindEvent(const std::string& event_id, const std::string& event_date) const {
  auto key = PartitionKeyOf(event_date);
  if (!key) return nullptr;

  auto part = state_.partitions.find(*key);
  if (part == state_.partitions.end()) return nullptr;

  auto it = part->second.events.find(event_id);
  if (it == part->second.events.end() || it->second.event_date != event_date) return nullptr;
  return &it->second;
}

// ------------------------------------------------------------------
// Partitions
// ------------------------------------------------------------------

Result MemoryRepository::CreatePartition(Transaction& t, const model::PartitionRecord& r) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s = tx.Mutable();
  if (s.partitions.contains(r.partition_key)) return Result::Ok();

  s.partitions[r.partition_key].range = r;
  tx.OnRollback([key = r.partition_key](State& st) { st.partitions.erase(key); });
  return Result::Ok();
}

bool MemoryRepository::HasPartition(Transaction& t, const std::string& partition_key) {
  return TX(t).View().partitions.contains(partition_key);
}

std::vector<model::PartitionRecord> MemoryRepository::ListPartitions(Transaction& t) {
  std::vector<model::PartitionRecord> out;
  for (const auto& [_, part] : TX(t).View().partitions) {
    out.push_back(part.range);
  }
  return out;
}

// ------------------------------------------------------------------
// Audit events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::AuditEventRecord& r) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s   = tx.Mutable();
  auto  key = PartitionKeyOf(r.event_date);
  if (!key) return Result::Err(ErrorCode::ConstraintViolation, "malformed event_date: " + r.event_date);

  auto part = s.partitions.find(*key);
  if (part == s.partitions.end()) {
    return Result::Err(ErrorCode::PartitionMissing, "no partition " + *key + " for event_date " + r.event_date);
  }

  if (s.event_index.contains(r.event_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "event " + r.event_id + " already exists");
  }

  if (!r.parent_event_id.empty() && !FindEvent(r.parent_event_id, r.parent_event_date)) {
    return Result::Err(ErrorCode::ForeignKeyViolation,
                       "parent (" + r.parent_event_id + ", " + r.parent_event_date + ") does not exist");
  }

  r.sequence = s.next_sequence++;
  part->second.events.emplace(r.event_id, r);
  s.event_index.emplace(r.event_id, r.event_date);
  if (!r.parent_event_id.empty()) {
    ++s.child_counts[r.parent_event_id];
  }
  s.chains[r.correlation_id].emplace(r.sequence, r.event_id);

  tx.OnRollback([key = *key, r](State& st) {
    st.partitions[key].events.erase(r.event_id);
    st.event_index.erase(r.event_id);
    if (!r.parent_event_id.empty() && --st.child_counts[r.parent_event_id] == 0) {
      st.child_counts.erase(r.parent_event_id);
    }
    auto chain = st.chains.find(r.correlation_id);
    if (chain != st.chains.end()) {
      chain->second.erase(r.sequence);
      if (chain->second.empty()) st.chains.erase(chain);
    }
  });
  return Result::Ok();
}

std::optional<model::AuditEventRecord> MemoryRepository::GetEvent(Transaction& t, const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.event_index.find(event_id);
  if (it == s.event_index.end()) return std::nullopt;

  const auto* record = FindEvent(event_id, it->second);
  if (!record) return std::nullopt;
  return *record;
}

std::optional<model::AuditEventRecord> MemoryRepository::GetEventInPartition(Transaction& t, const std::string& event_id,
                                                                             const std::string& event_date) {
  (void)TX(t);
  const auto* record = FindEvent(event_id, event_date);
  if (!record) return std::nullopt;
  return *record;
}

Result MemoryRepository::DeleteEvent(Transaction& t, const std::string& event_id) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s  = tx.Mutable();
  auto  it = s.event_index.find(event_id);
  if (it == s.event_index.end()) return Result::Err(ErrorCode::NotFound, "event " + event_id + " not found");

  if (auto children = s.child_counts.find(event_id); children != s.child_counts.end() && children->second > 0) {
    return Result::Err(ErrorCode::RestrictViolation,
                       "event " + event_id + " has " + std::to_string(children->second) + " child event(s)");
  }

  const auto key     = *PartitionKeyOf(it->second);
  auto&      events  = s.partitions[key].events;
  auto       node    = events.find(event_id);
  const auto removed = node->second;

  if (removed.legal_hold) {
    return Result::Err(ErrorCode::LegalHold, "event " + event_id + " is under legal hold");
  }

  events.erase(node);
  s.event_index.erase(it);
  if (!removed.parent_event_id.empty() && --s.child_counts[removed.parent_event_id] == 0) {
    s.child_counts.erase(removed.parent_event_id);
  }
  s.chains[removed.correlation_id].erase(removed.sequence);

  tx.OnRollback([key, removed](State& st) {
    st.partitions[key].events.emplace(removed.event_id, removed);
    st.event_index.emplace(removed.event_id, removed.event_date);
    if (!removed.parent_event_id.empty()) ++st.child_counts[removed.parent_event_id];
    st.chains[removed.correlation_id].emplace(removed.sequence, removed.event_id);
  });
  return Result::Ok();
}

uint64_t MemoryRepository::CountChildren(Transaction& t, const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.child_counts.find(event_id);
  return it == s.child_counts.end() ? 0 : it->second;
}

std::vector<model::AuditEventRecord> MemoryRepository::ListEventsByCorrelation(Transaction& t, const std::string& correlation_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::AuditEventRecord> out;

  auto chain = s.chains.find(correlation_id);
  if (chain == s.chains.end()) return out;

  for (const auto& [_, event_id] : chain->second) {
    auto idx = s.event_index.find(event_id);
    if (idx == s.event_index.end()) continue;
    if (const auto* record = FindEvent(event_id, idx->second)) out.push_back(*record);
  }
  return out;
}

std::string MemoryRepository::LatestChainHash(Transaction& t, const std::string& correlation_id) {
  const auto& s     = TX(t).View();
  auto        chain = s.chains.find(correlation_id);
  if (chain == s.chains.end() || chain->second.empty()) return {};

  const auto& event_id = chain->second.rbegin()->second;
  auto        idx      = s.event_index.find(event_id);
  if (idx == s.event_index.end()) return {};

  const auto* record = FindEvent(event_id, idx->second);
  return record ? record->event_hash : std::string{};
}

// ------------------------------------------------------------------
// Legal holds
// ------------------------------------------------------------------

model::AuditEventRecord* MemoryRepository::MutableEvent(State& s, const std::string& event_id) {
  auto idx = s.event_index.find(event_id);
  if (idx == s.event_index.end()) return nullptr;

  auto key = PartitionKeyOf(idx->second);
  if (!key) return nullptr;

  auto part = s.partitions.find(*key);
  if (part == s.partitions.end()) return nullptr;

  auto it = part->second.events.find(event_id);
  return it == part->second.events.end() ? nullptr : &it->second;
}

uint64_t MemoryRepository::SetHoldFlags(State& s, const std::string& correlation_id, bool hold,
                                        std::vector<std::string>& changed) {
  auto chain = s.chains.find(correlation_id);
  if (chain == s.chains.end()) return 0;

  uint64_t matched = 0;
  for (const auto& [_, event_id] : chain->second) {
    auto* record = MutableEvent(s, event_id);
    if (!record) continue;
    ++matched;
    if (record->legal_hold == hold) continue;
    record->legal_hold = hold;
    changed.push_back(event_id);
  }
  return matched;
}

Result MemoryRepository::PlaceLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s     = tx.Mutable();
  auto  chain = s.chains.find(hold.correlation_id);
  if (chain == s.chains.end() || chain->second.empty()) {
    return Result::Err(ErrorCode::NotFound, "no events for correlation_id " + hold.correlation_id);
  }

  std::vector<std::string> changed;
  hold.event_count = SetHoldFlags(s, hold.correlation_id, true, changed);

  std::optional<model::LegalHoldRecord> previous;
  if (auto it = s.legal_holds.find(hold.correlation_id); it != s.legal_holds.end()) previous = it->second;

  auto stored        = hold;
  stored.event_count = 0;
  s.legal_holds[hold.correlation_id] = stored;

  tx.OnRollback([correlation_id = hold.correlation_id, changed, previous](State& st) {
    for (const auto& event_id : changed) {
      if (auto* record = MutableEvent(st, event_id)) record->legal_hold = false;
    }
    if (previous) st.legal_holds[correlation_id] = *previous;
    else st.legal_holds.erase(correlation_id);
  });
  return Result::Ok();
}

Result MemoryRepository::ReleaseLegalHold(Transaction& t, model::LegalHoldRecord& hold) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s        = tx.Mutable();
  auto  existing = s.legal_holds.find(hold.correlation_id);

  std::vector<std::string> changed;
  SetHoldFlags(s, hold.correlation_id, false, changed);
  if (existing == s.legal_holds.end() && changed.empty()) {
    return Result::Err(ErrorCode::NotFound, "no legal hold on correlation_id " + hold.correlation_id);
  }

  std::optional<model::LegalHoldRecord> previous;
  if (existing != s.legal_holds.end()) {
    previous = existing->second;
    hold     = existing->second;
    s.legal_holds.erase(existing);
  }
  hold.event_count = changed.size();

  tx.OnRollback([changed, previous](State& st) {
    for (const auto& event_id : changed) {
      if (auto* record = MutableEvent(st, event_id)) record->legal_hold = true;
    }
    if (previous) st.legal_holds[previous->correlation_id] = *previous;
  });
  return Result::Ok();
}

std::vector<model::LegalHoldRecord> MemoryRepository::ListLegalHolds(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::LegalHoldRecord> out;

  for (const auto& [correlation_id, hold] : s.legal_holds) {
    auto entry        = hold;
    entry.event_count = 0;
    if (auto chain = s.chains.find(correlation_id); chain != s.chains.end()) {
      for (const auto& [_, event_id] : chain->second) {
        auto idx = s.event_index.find(event_id);
        if (idx == s.event_index.end()) continue;
        const auto* record = FindEvent(event_id, idx->second);
        if (record && record->legal_hold) ++entry.event_count;
      }
    }
    out.push_back(std::move(entry));
  }
  return out;
}

// ------------------------------------------------------------------
// Action traces
// ------------------------------------------------------------------

Result MemoryRepository::InsertActionTrace(Transaction& t, const model::ActionTraceRecord& r) {
  auto& tx = TX(t);
  if (!tx.Writable()) return ReadOnly();

  auto& s   = tx.Mutable();
  auto  key = PartitionKeyOf(r.action_date);
  if (!key) return Result::Err(ErrorCode::ConstraintViolation, "malformed action_date: " + r.action_date);

  auto part = s.partitions.find(*key);
  if (part == s.partitions.end()) {
    return Result::Err(ErrorCode::PartitionMissing, "no partition " + *key + " for action_date " + r.action_date);
  }

  if (s.action_ids.contains(r.action_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "action trace " + r.action_id + " already exists");
  }

  part->second.traces.push_back(r);
  s.action_ids.insert(r.action_id);

  tx.OnRollback([key = *key, action_id = r.action_id](State& st) {
    auto& traces = st.partitions[key].traces;
    traces.erase(std::remove_if(traces.begin(), traces.end(), [&](const auto& tr) { return tr.action_id == action_id; }), traces.end());
    st.action_ids.erase(action_id);
  });
  return Result::Ok();
}

Result MemoryRepository::ScanActionTraces(Transaction& t, const ActionTraceFilter& filter, const ActionTraceVisitor& visit) {
  const auto& s = TX(t).View();

  for (const auto& [_, part] : s.partitions) {
    const auto start = util::UtcDateToMillis(part.range.range_start);
    const auto end   = util::UtcDateToMillis(part.range.range_end);
    if (end <= filter.since_ms || start >= filter.until_ms) continue;

    for (const auto& trace : part.traces) {
      if (Matches(filter, trace)) visit(trace);
    }
  }
  return Result::Ok();
}

}
