#pragma once

#include <string>
#include <vector>

namespace audit::db::sql {

// Sink for schema statements; sqlite runs them on the connection, postgres inside one pqxx::work.

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Statements are IF NOT EXISTS, so startup re-runs them against existing stores.

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// audit_partitions, audit_events, action_traces and their indexes.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& SqliteDlqSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace audit::db::sql
