#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analytics/aggregation_engine.hpp"
#include "internal/core/chain_verifier.hpp"
#include "internal/core/event_store.hpp"
#include "internal/core/event_writer.hpp"
#include "internal/core/ingestion_gateway.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/dlq/memory_queue.hpp"
#include "internal/dlq/recovery_worker.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/write_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/partition/partition_manager.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/write_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if AUDIT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/dlq/sqlite_queue.hpp"
#endif
#if AUDIT_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace audit::factory {

using namespace audit;
using observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
}

#if AUDIT_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

#endif

#if AUDIT_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const audit::runtime::config::RuntimeConfig& config) {
  const auto& database      = config.database();
  const auto  write_timeout = ToMillis(database.write_timeout());

  if (database.has_sqlite()) {
#if AUDIT_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), write_timeout, sqlite.wal_mode());

    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());

    // A second handle lets analytics read while a writer holds the first.
    std::shared_ptr<db::sqlite::SqliteDB> reader;
    if (!sqlite_db->InMemory()) {
      reader = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), db::sqlite::SqliteOptions{write_timeout, sqlite.wal_mode(), true});
    }

    AUDIT_LOG_INFO("Using sqlite store", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), std::move(reader));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if AUDIT_DB_POSTGRES
    const auto& postgres = database.postgres();

    // Pooled connections prepare statements on open, so the schema has to exist first.
    try {
      pqxx::connection bootstrap(postgres.connection_uri());
      pqxx::work       tx(bootstrap);

      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    } catch (const pqxx::broken_connection& e) {
      throw util::StorageUnavailableError(std::string("postgres: cannot reach store: ") + e.what());
    }

    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections());

    AUDIT_LOG_INFO("Using postgres store", {});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), write_timeout);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  AUDIT_LOG_INFO("Using in-memory store", {});
  return std::make_shared<db::memory::MemoryRepository>(write_timeout);
}

std::shared_ptr<dlq::Queue> BuildQueue(const audit::runtime::config::RuntimeConfig& config) {
  const auto& dlq = config.dlq();

  if (dlq.has_sqlite()) {
#if AUDIT_DB_SQLITE
    auto queue_db = std::make_shared<db::sqlite::SqliteDB>(dlq.sqlite().path());
    AUDIT_LOG_INFO("Using sqlite dlq", {StringField("path", dlq.sqlite().path())});
    return std::make_shared<dlq::SqliteQueue>(std::move(queue_db), dlq.max_entries());
#else
    throw std::runtime_error("sqlite dlq requested but not enabled at build time");
#endif
  }

  AUDIT_LOG_WARN("Using in-memory dlq; queued writes do not survive a restart", {});
  return std::make_shared<dlq::MemoryQueue>(dlq.max_entries());
}

dlq::RecoveryOptions ToRecoveryOptions(const audit::runtime::config::DlqConfig& dlq) {
  dlq::RecoveryOptions options;
  options.workers                = dlq.workers();
  options.batch_size             = dlq.batch_size();
  options.max_retries            = dlq.max_retries();
  options.initial_backoff        = ToMillis(dlq.initial_backoff());
  options.max_backoff            = ToMillis(dlq.max_backoff());
  options.poll_interval          = ToMillis(dlq.poll_interval());
  options.lease_duration         = ToMillis(dlq.lease_duration());
  options.shutdown_drain_timeout = ToMillis(dlq.shutdown_drain_timeout());
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const audit::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  partition::MaintenanceOptions maintenance;
  maintenance.months_ahead  = config.partitions().months_ahead();
  maintenance.months_behind = config.partitions().months_behind();
  maintenance.interval      = ToMillis(config.partitions().maintenance_interval());

  auto partitions = std::make_shared<partition::PartitionManager>(repository, maintenance);
  partitions->EnsurePartitions(util::NowMs());

  auto store    = std::make_shared<core::EventStore>(repository);
  auto writer   = std::make_shared<core::EventWriter>(store);
  auto verifier = std::make_shared<core::ChainVerifier>(store);

  // ------------------------------------------------------------------
  // DLQ
  // ------------------------------------------------------------------
  auto queue    = BuildQueue(config);
  auto gateway  = std::make_shared<core::IngestionGateway>(writer, queue);
  auto recovery = std::make_shared<dlq::RecoveryWorker>(queue, writer, ToRecoveryOptions(config.dlq()));

  // ------------------------------------------------------------------
  // Analytics
  // ------------------------------------------------------------------
  analytics::AnalyticsOptions analytics_options;
  analytics_options.default_time_range  = config.analytics().default_time_range();
  analytics_options.default_min_samples = config.analytics().default_min_samples();

  auto engine = std::make_shared<analytics::AggregationEngine>(repository, analytics_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.gateway        = gateway;
  ctx.store          = store;
  ctx.chain_verifier = verifier;
  ctx.analytics      = engine;
  ctx.dlq            = queue;
  ctx.recovery       = recovery;

  auto write_service     = std::make_shared<service::WriteService>(ctx);
  auto analytics_service = std::make_shared<service::AnalyticsService>(ctx);
  auto admin_service     = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::WriteServer>(write_service));
  app.grpc_services.push_back(std::make_unique<grpc::AnalyticsServer>(analytics_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.background_workers.push_back(partitions);
  app.background_workers.push_back(recovery);

  return app;
}

} // namespace audit::factory
