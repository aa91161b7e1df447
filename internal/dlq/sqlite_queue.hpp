#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "queue.hpp"

namespace audit::dlq {

/*
  Durable queue on its own SQLite database. Every operation runs in one
  BEGIN IMMEDIATE transaction, so leasing is atomic across threads and
  processes sharing the file.
*/
class SqliteQueue final : public Queue {
public:
  // Creates the dlq tables if missing.
  SqliteQueue(std::shared_ptr<db::sqlite::SqliteDB> db, uint64_t max_entries = 10000);

  std::string Enqueue(const std::string& destination, const std::string& payload, const std::string& last_error,
                      uint64_t now_ms) override;
  std::vector<DlqEntry> LeaseDue(const LeaseRequest& req) override;
  void Complete(const std::string& entry_id, const std::string& owner) override;
  void Reschedule(const std::string& entry_id, const std::string& owner, const std::string& error,
                  uint64_t next_attempt_at_ms) override;
  void DeadLetter(const std::string& entry_id, const std::string& owner, const std::string& error,
                  uint64_t now_ms) override;

  uint64_t Depth() override;
  uint64_t DeadLetterCount() override;
  std::vector<DeadLetterRecord> ListDeadLetters(std::size_t limit) override;

private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
  uint64_t                              max_entries_;
};

} // namespace audit::dlq
