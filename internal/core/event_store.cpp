#include "event_store.hpp"

#include <string_view>

#include "event_codec.hpp"
#include "internal/util/errors.hpp"

namespace audit::core {

using db::ErrorCode;
using db::TxMode;

namespace {

// Typed errors pass through; anything a backend driver throws while
// reading means the store is not usable right now.
template <typename Fn>
auto Guard(std::string_view op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::ValidationError&) {
    throw;
  } catch (const util::ReferentialIntegrityError&) {
    throw;
  } catch (const util::PartitionMissingError&) {
    throw;
  } catch (const util::StorageUnavailableError&) {
    throw;
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::DeleteRestricted&) {
    throw;
  } catch (const util::AlreadyExists&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError(std::string(op) + ": " + e.what());
  }
}

} // namespace

void RaiseStoreError(const db::Result& result, const std::string& context) {
  const auto message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::ForeignKeyViolation:
      throw util::ReferentialIntegrityError(message);
    case ErrorCode::PartitionMissing:
      throw util::PartitionMissingError(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::RestrictViolation:
    case ErrorCode::LegalHold:
      throw util::DeleteRestricted(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::ConstraintViolation:
      // a row the backend refuses is a caller error, not an outage
      throw util::ValidationError("invalid_record", message);
    default:
      throw util::StorageUnavailableError(context + " (" + db::ToString(result.code) + "): " + result.message);
  }
}

EventStore::EventStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

InsertResult EventStore::InsertInTx(db::Transaction& tx, db::model::AuditEventRecord record, uint64_t now_ms) {
  if (auto existing = repository_->GetEvent(tx, record.event_id)) {
    return {InsertStatus::kDuplicate, std::move(*existing)};
  }

  record.parent_event_date.clear();
  if (!record.parent_event_id.empty()) {
    auto parent = repository_->GetEvent(tx, record.parent_event_id);
    if (!parent) {
      throw util::ReferentialIntegrityError("parent event " + record.parent_event_id + " does not exist");
    }
    record.parent_event_date = parent->event_date;
  }

  record.created_at_ms       = now_ms;
  record.previous_event_hash = repository_->LatestChainHash(tx, record.correlation_id);
  record.event_hash          = ComputeEventHash(record);

  auto result = repository_->InsertEvent(tx, record);
  if (result.Is(ErrorCode::AlreadyExists)) {
    return {InsertStatus::kDuplicate, std::move(record)};
  }
  if (!result) RaiseStoreError(result, "insert event " + record.event_id);
  return {InsertStatus::kStored, std::move(record)};
}

InsertResult EventStore::Insert(db::model::AuditEventRecord record, uint64_t now_ms) {
  return Guard("insert event", [&] {
    auto tx     = repository_->Begin(TxMode::kReadWrite);
    auto result = InsertInTx(*tx, std::move(record), now_ms);
    if (result.status == InsertStatus::kDuplicate) {
      tx->Rollback();
    } else {
      tx->Commit();
    }
    return result;
  });
}

std::vector<InsertResult> EventStore::InsertBatch(std::vector<db::model::AuditEventRecord> records, uint64_t now_ms) {
  return Guard("insert event batch", [&] {
    std::vector<InsertResult> results;
    results.reserve(records.size());

    auto tx = repository_->Begin(TxMode::kReadWrite);
    for (auto& record : records) {
      results.push_back(InsertInTx(*tx, std::move(record), now_ms));
    }
    tx->Commit();
    return results;
  });
}

std::optional<db::model::AuditEventRecord> EventStore::Lookup(const std::string& event_id) {
  return Guard("lookup event", [&] {
    auto tx    = repository_->Begin(TxMode::kReadOnly);
    auto found = repository_->GetEvent(*tx, event_id);
    tx->Commit();
    return found;
  });
}

void EventStore::Delete(const std::string& event_id) {
  Guard("delete event", [&] {
    auto tx     = repository_->Begin(TxMode::kReadWrite);
    auto result = repository_->DeleteEvent(*tx, event_id);
    if (!result) RaiseStoreError(result, "delete event " + event_id);
    tx->Commit();
  });
}

InsertStatus EventStore::InsertActionTrace(const db::model::ActionTraceRecord& record) {
  return Guard("insert action trace", [&] {
    auto tx     = repository_->Begin(TxMode::kReadWrite);
    auto result = repository_->InsertActionTrace(*tx, record);
    if (result.Is(ErrorCode::AlreadyExists)) {
      tx->Rollback();
      return InsertStatus::kDuplicate;
    }
    if (!result) RaiseStoreError(result, "insert action trace " + record.action_id);
    tx->Commit();
    return InsertStatus::kStored;
  });
}

db::model::LegalHoldRecord EventStore::PlaceLegalHold(db::model::LegalHoldRecord hold) {
  return Guard("place legal hold", [&] {
    auto tx     = repository_->Begin(TxMode::kReadWrite);
    auto result = repository_->PlaceLegalHold(*tx, hold);
    if (!result) RaiseStoreError(result, "place legal hold on " + hold.correlation_id);
    tx->Commit();
    return hold;
  });
}

db::model::LegalHoldRecord EventStore::ReleaseLegalHold(const std::string& correlation_id) {
  return Guard("release legal hold", [&] {
    db::model::LegalHoldRecord hold;
    hold.correlation_id = correlation_id;

    auto tx     = repository_->Begin(TxMode::kReadWrite);
    auto result = repository_->ReleaseLegalHold(*tx, hold);
    if (!result) RaiseStoreError(result, "release legal hold on " + correlation_id);
    tx->Commit();
    return hold;
  });
}

std::vector<db::model::LegalHoldRecord> EventStore::LegalHolds() {
  return Guard("list legal holds", [&] {
    auto tx    = repository_->Begin(TxMode::kReadOnly);
    auto holds = repository_->ListLegalHolds(*tx);
    tx->Commit();
    return holds;
  });
}

std::vector<db::model::AuditEventRecord> EventStore::Chain(const std::string& correlation_id) {
  return Guard("list chain", [&] {
    auto tx     = repository_->Begin(TxMode::kReadOnly);
    auto events = repository_->ListEventsByCorrelation(*tx, correlation_id);
    tx->Commit();
    return events;
  });
}

std::vector<db::model::PartitionRecord> EventStore::Partitions() {
  return Guard("list partitions", [&] {
    auto tx         = repository_->Begin(TxMode::kReadOnly);
    auto partitions = repository_->ListPartitions(*tx);
    tx->Commit();
    return partitions;
  });
}

} // namespace audit::core
