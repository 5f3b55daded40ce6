#include "factory.hpp"

#include <unistd.h>

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/journal_index.hpp"
#include "internal/registry/notification_verifier.hpp"
#include "internal/sandbox/process_sandbox.hpp"
#include "internal/sandbox/sandbox_limits.hpp"
#include "internal/service/service_context.hpp"
#if DOCBUILD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DOCBUILD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace docbuild::factory {

using docbuild::runtime::config::RuntimeConfig;

namespace {

#if DOCBUILD_DB_POSTGRES
// Runs on a plain connection: pooled connections prepare statements against tables that must already exist.
class PgSchemaExecutor final : public db::sql::SchemaExecutor {
 public:
  explicit PgSchemaExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  PgSchemaExecutor executor(tx);
  db::sql::ApplySchema(executor, db::sql::Dialect::kPostgres);
  tx.commit();
}
#endif

std::string HostName() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "docbuild";
  }
  return buffer;
}

std::string ResolveToolchainVersion(const docbuild::runtime::config::BuilderConfig& builder) {
  if (!builder.toolchain_version().empty()) {
    return builder.toolchain_version();
  }
  if (builder.toolchain_version_command().empty()) {
    return "unknown";
  }

  std::vector<std::string> command(builder.toolchain_version_command().begin(), builder.toolchain_version_command().end());
  try {
    auto version = sandbox::DetectToolchainVersion(command);
    DOCBUILD_LOG_INFO("detected toolchain version", {observability::StringField("version", version)});
    return version;
  } catch (const std::exception& e) {
    DOCBUILD_LOG_WARN("toolchain version detection failed", {observability::StringField("error", e.what())});
    return "unknown";
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCBUILD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::ApplySchema(*sqlite_db, db::sql::Dialect::kSqlite);
    DOCBUILD_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DOCBUILD_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    DOCBUILD_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DOCBUILD_LOG_WARN("no database configured, state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const auto& builder_config = config.builder();
  const auto  worker_name    = builder_config.worker_name().empty() ? HostName() : builder_config.worker_name();

  // ------------------------------------------------------------------
  // Persistence + queue
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto default_limits = sandbox::LimitsFromConfig(builder_config.limits());

  queue::QueueOptions queue_options;
  queue_options.max_attempts           = config.queue().max_attempts();
  queue_options.delay_between_attempts = std::chrono::seconds(config.queue().delay_between_attempts_seconds());
  queue_options.claim_timeout          = std::chrono::seconds(config.queue().claim_timeout_seconds());
  queue_options.candidate_batch_size   = config.queue().candidate_batch_size();
  queue_options.build_timeout          = default_limits.timeout;
  app.queue                            = std::make_shared<queue::BuildQueue>(app.repository, queue_options);

  // ------------------------------------------------------------------
  // Registry synchronization
  // ------------------------------------------------------------------
  app.index = std::make_shared<registry::JournalIndex>(config.registry().journal_path());

  sync::SyncOptions sync_options;
  sync_options.checkpoint_name = config.sync().checkpoint_name();
  sync_options.holder          = worker_name + ":" + std::to_string(getpid());
  sync_options.lock_ttl        = std::chrono::seconds(config.sync().lock_ttl_seconds());
  sync_options.registry_name   = config.registry().name();
  app.sync                     = std::make_shared<sync::IndexSync>(app.repository, app.index, app.queue, sync_options);

  // ------------------------------------------------------------------
  // Builder
  // ------------------------------------------------------------------
  if (!builder_config.command().empty()) {
    sandbox::ProcessSandboxOptions sandbox_options;
    sandbox_options.command.assign(builder_config.command().begin(), builder_config.command().end());
    sandbox_options.environment.insert(builder_config.environment().begin(), builder_config.environment().end());
    sandbox_options.doc_subdir = builder_config.doc_subdir();

    sandbox::DocBuilderOptions builder_options;
    builder_options.worker            = worker_name;
    builder_options.builder_version   = builder_config.builder_version();
    builder_options.toolchain_version = ResolveToolchainVersion(builder_config);
    builder_options.work_dir          = builder_config.work_dir();
    builder_options.default_target    = builder_config.default_target();
    builder_options.default_limits    = default_limits;
    builder_options.keep_work_dirs    = builder_config.keep_work_dirs();

    app.builder = std::make_shared<sandbox::DocBuilder>(app.repository, std::make_shared<sandbox::ProcessSandbox>(sandbox_options),
                                                        builder_options);
  }

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  orchestrator::OrchestratorOptions orchestrator_options;
  orchestrator_options.workers              = app.builder ? builder_config.workers() : 0;
  orchestrator_options.worker_name          = worker_name;
  orchestrator_options.idle_poll_interval   = std::chrono::milliseconds(builder_config.idle_poll_interval_ms());
  orchestrator_options.locked_poll_interval = std::chrono::milliseconds(builder_config.locked_poll_interval_ms());
  orchestrator_options.sync_enabled         = !config.sync().disabled();
  orchestrator_options.sync_poll_interval   = std::chrono::seconds(config.sync().poll_interval_seconds());
  orchestrator_options.abandoned_build_age =
      default_limits.timeout + std::chrono::seconds(builder_config.abandoned_build_grace_seconds());
  orchestrator_options.registry_name            = config.registry().name();
  orchestrator_options.abandoned_sweep_interval = std::chrono::seconds(builder_config.abandoned_sweep_interval_seconds());
  orchestrator_options.max_queued_rebuilds      = config.queue().max_queued_rebuilds();
  orchestrator_options.rebuild_interval         = std::chrono::seconds(config.queue().rebuild_interval_seconds());
  app.orchestrator = std::make_shared<orchestrator::Orchestrator>(app.repository, app.sync, app.queue, app.builder, orchestrator_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.queue        = app.queue;
  ctx.sync         = app.sync;
  ctx.orchestrator = app.orchestrator;
  ctx.verifier     = std::make_shared<registry::NotificationVerifier>(config.registry().notification_secret());

  app.admin_service = std::make_shared<service::AdminService>(ctx);
  app.query_service = std::make_shared<service::QueryService>(ctx);

  return app;
}

} // namespace docbuild::factory
