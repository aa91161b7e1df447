#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace audit::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  if (mode_ == TxMode::kReadWrite) {
    write_lock_ = std::unique_lock<std::shared_timed_mutex>(repo_.mutex_, std::defer_lock);
    if (!write_lock_.try_lock_for(repo_.lock_timeout_)) {
      throw util::StorageUnavailableError("memory store: timed out waiting for writer lock");
    }
    return;
  }

  read_lock_ = std::shared_lock<std::shared_timed_mutex>(repo_.mutex_, std::defer_lock);
  if (!read_lock_.try_lock_for(repo_.lock_timeout_)) {
    throw util::StorageUnavailableError("memory store: timed out waiting for reader lock");
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) return;
  undo_.clear();
  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
  Release();
}

void MemoryTransaction::Release() {
  finished_ = true;
  if (write_lock_.owns_lock()) write_lock_.unlock();
  if (read_lock_.owns_lock()) read_lock_.unlock();
}

} // namespace audit::db::memory
