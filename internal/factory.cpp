#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/migration/file_system.hpp"
#if SQLMIGRATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SQLMIGRATE_DB_POSTGRES
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_session.hpp"
#endif

namespace sqlmigrate::factory {

std::shared_ptr<db::Repository> BuildRepository(const sqlmigrate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  const auto& table    = config.migrations().tracking_table();

  if (database.has_sqlite()) {
#if SQLMIGRATE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode        = database.sqlite().wal_mode();
    options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    options.foreign_keys    = database.sqlite().foreign_keys();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), table);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SQLMIGRATE_DB_POSTGRES
    auto session = std::make_shared<db::postgres::PgSession>(config::PostgresConnectionString(database.postgres()));
    return std::make_shared<db::postgres::PgRepository>(std::move(session), table);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no database backend configured");
}

/*
    Build the dependency graph for one run
*/
Application Build(const sqlmigrate::runtime::config::RuntimeConfig& config, std::shared_ptr<migration::MigrationReporter> reporter) {
  Application app;

  // ------------------------------------------------------------------
  // Database (held for the whole run)
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Migration components
  // ------------------------------------------------------------------
  app.source = std::make_shared<migration::MigrationSource>(std::make_shared<migration::LocalFileSystem>(), config.migrations().extension());
  app.runner = std::make_unique<migration::MigrationRunner>(app.repository, app.source, std::move(reporter));

  return app;
}

} // namespace sqlmigrate::factory
