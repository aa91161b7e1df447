#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace audit::db::memory {

/*
  Transaction = lock + undo log

  kReadWrite takes the exclusive lock, kReadOnly a shared one, both
  bounded by the repository's lock_timeout. There are no snapshots, so
  a reader blocks behind a writer for as long as the writer is open.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  // Throws util::StorageUnavailableError if the lock is not acquired in time.
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool Writable() const {
    return mode_ == TxMode::kReadWrite && !finished_;
  }

  MemoryRepository::State& Mutable() {
    return repo_.state_;
  }
  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

  void OnRollback(Undo undo) {
    undo_.push_back(std::move(undo));
  }

 private:
  void Release();

  MemoryRepository&                            repo_;
  TxMode                                       mode_;
  std::unique_lock<std::shared_timed_mutex>    write_lock_;
  std::shared_lock<std::shared_timed_mutex>    read_lock_;
  std::vector<Undo>                            undo_;
  bool                                         committed_ = false;
  bool                                         finished_  = false;
};

} // namespace audit::db::memory
