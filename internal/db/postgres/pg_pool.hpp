#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace audit::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A transaction checks out one connection and returns it when the
  shared_ptr drops. Every new connection gets the event, partition and
  action-trace statements prepared. Closed connections are discarded on
  return so the next Acquire() reconnects.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Throws util::StorageUnavailableError if the server is unreachable or
  // every connection stays checked out past timeout.
  std::shared_ptr<pqxx::connection> Acquire(std::chrono::milliseconds timeout);

  std::size_t MaxConnections() const {
    return max_connections_;
  }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace audit::db::postgres
