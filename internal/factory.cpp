#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if STORYGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STORYGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace storygraph::factory {

using storygraph::observability::StringField;

namespace {

#if STORYGRAPH_DB_POSTGRES
// Runs schema statements in one pqxx::work on a pooled connection.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : tx_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  void Commit() {
    tx_.commit();
  }

 private:
  pqxx::work tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const storygraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STORYGRAPH_DB_SQLITE
    const auto path      = database.sqlite().path().empty() ? std::string("storygraph.sqlite") : database.sqlite().path();
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    STORYGRAPH_LOG_INFO("using sqlite store", {StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STORYGRAPH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    {
      // Pooled connections prepare statements against the tables, so the
      // schema goes in first on a plain connection.
      pqxx::connection    conn(database.postgres().connection_uri());
      PgMigrationExecutor executor(conn);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      executor.Commit();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    STORYGRAPH_LOG_INFO("using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STORYGRAPH_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

Runtime BuildRuntime(std::shared_ptr<db::Repository> repository, const std::string& default_branch) {
  Runtime runtime;
  runtime.repository = std::move(repository);

  runtime.graph     = std::make_shared<graph::GraphStore>(runtime.repository);
  runtime.branches  = std::make_shared<branch::BranchIndex>(runtime.repository);
  runtime.lifecycle = std::make_shared<story::StoryLifecycle>(runtime.repository);

  service::ServiceContext ctx;
  ctx.graph          = runtime.graph;
  ctx.branches       = runtime.branches;
  ctx.lifecycle      = runtime.lifecycle;
  ctx.default_branch = default_branch;

  runtime.story_service = std::make_shared<service::StoryService>(ctx);
  return runtime;
}

Runtime BuildRuntime(const storygraph::runtime::config::RuntimeConfig& config) {
  return BuildRuntime(BuildRepository(config), config::ConfigLoader::DefaultBranchName(config));
}

} // namespace storygraph::factory
