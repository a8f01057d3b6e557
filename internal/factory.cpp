#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/aggregate/loader.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if CHATLOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CHATLOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace chatlog::factory {

namespace {

using std::chrono::milliseconds;

uint32_t OrDefault(uint32_t value, uint32_t fallback) {
  return value > 0 ? value : fallback;
}

#if CHATLOG_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(db_.Prepare("SELECT COALESCE(MAX(version),0) FROM schema_migrations;"),
                                                                    &sqlite3_finalize);
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
      throw util::StorageError(std::string("sqlite schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    return sqlite3_column_int(stmt.get(), 0);
  }

  void RecordVersion(int version) override {
    db_.Exec("INSERT INTO schema_migrations(version, applied_at_ms) VALUES (" + std::to_string(version) + ", " +
             std::to_string(util::NowMs()) + ");");
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if CHATLOG_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    Run([&](pqxx::work& tx) { tx.exec(sql); });
  }

  int CurrentVersion() override {
    int version = 0;
    Run([&](pqxx::work& tx) { version = tx.query_value<int>("SELECT COALESCE(MAX(version),0) FROM schema_migrations;"); });
    return version;
  }

  void RecordVersion(int version) override {
    Run([&](pqxx::work& tx) {
      tx.exec_params("INSERT INTO schema_migrations(version, applied_at_ms) VALUES ($1, $2);", version, static_cast<int64_t>(util::NowMs()));
    });
  }

 private:
  template <typename Fn>
  void Run(Fn&& fn) {
    auto conn = pool_->Acquire();
    try {
      pqxx::work tx(*conn);
      fn(tx);
      tx.commit();
    } catch (const pqxx::failure& e) {
      throw util::StorageError(std::string("postgres migration: ") + e.what());
    }
  }

  std::shared_ptr<db::postgres::PgPool> pool_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const chatlog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if CHATLOG_DB_SQLITE
    const auto& sqlite = database.sqlite();

    db::sqlite::SqliteOptions options;
    options.path         = sqlite.path();
    options.wal_mode     = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;
    options.busy_timeout = milliseconds(OrDefault(sqlite.busy_timeout_ms(), chatlog::config::kDefaultBusyTimeoutMs));
    options.writer_wait  = milliseconds(OrDefault(database.lock_timeout_ms(), chatlog::config::kDefaultLockTimeoutMs));

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    {
      auto                    writer = sqlite_db->AcquireWriter();
      SqliteMigrationExecutor executor(*sqlite_db);
      db::sql::RunMigrations(executor, db::sql::SqliteMigrations());
    }

    CHATLOG_LOG_INFO("using sqlite repository", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CHATLOG_DB_POSTGRES
    const auto& postgres = database.postgres();

    db::postgres::PgOptions options;
    options.conninfo          = postgres.connection_uri();
    options.max_connections   = OrDefault(postgres.max_connections(), chatlog::config::kDefaultMaxConnections);
    options.statement_timeout = milliseconds(OrDefault(postgres.statement_timeout_ms(), chatlog::config::kDefaultStatementTimeoutMs));
    options.acquire_timeout   = milliseconds(OrDefault(postgres.acquire_timeout_ms(), chatlog::config::kDefaultAcquireTimeoutMs));

    auto pool = std::make_shared<db::postgres::PgPool>(std::move(options));
    {
      PostgresMigrationExecutor executor(pool);
      db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
    }

    CHATLOG_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CHATLOG_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>(milliseconds(OrDefault(database.lock_timeout_ms(), chatlog::config::kDefaultLockTimeoutMs)));
}

/*
    Build full application dependency graph
*/
Application Build(const chatlog::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Write side
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.bus        = std::make_shared<eventstore::EventBus>();
  app.events     = std::make_shared<eventstore::EventStore>(app.repository, app.bus);
  app.snapshots  = std::make_shared<eventstore::SnapshotStore>(app.repository);

  service::ServiceContext ctx;
  ctx.events    = app.events;
  ctx.snapshots = app.snapshots;
  ctx.loader    = aggregate::LoaderOptionsFromConfig(config.loader());

  app.conversations = std::make_shared<service::ConversationService>(std::move(ctx));

  // ------------------------------------------------------------------
  // Read side
  // ------------------------------------------------------------------
  app.projector = std::make_shared<projection::Projector>(app.events, app.bus, projection::ProjectorOptionsFromConfig(config.projector()));
  app.recovery  = std::make_shared<projection::StreamRecovery>(app.repository, app.conversations,
                                                              projection::StreamRecoveryOptionsFromConfig(config.recovery()));

  return app;
}

} // namespace chatlog::factory
