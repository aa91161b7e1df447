#pragma once

namespace audit::db {

enum class TxMode {
  kReadWrite,
  kReadOnly,
};

/*
  One unit of work against the audit store.

  Every backend guarantees:

  - writes are invisible to other transactions until Commit()
  - an event insert and its chain-head lookup happen in the same transaction,
    so concurrent writers on one correlation id cannot fork a chain
  - destroying an uncommitted transaction rolls it back
  - read-only transactions (analytics, event lookup) never block each other

  Begin() on a repository throws util::StorageUnavailableError when the
  backend is unreachable; the ingestion gateway keys its DLQ fallback on that.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace audit::db
