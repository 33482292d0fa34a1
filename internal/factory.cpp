#include "factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/config/resolution_config.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/ingest/repository_record_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if RESOLVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RESOLVER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if RESOLVER_INGEST_ARROW
#include "internal/ingest/csv_record_source.hpp"
#endif

namespace resolver::factory {

namespace {

#if RESOLVER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->ApplySchema(db::sql::SqliteSchema());
}
#endif

#if RESOLVER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  pool->ApplySchema(db::sql::PostgresSchema());
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const resolver::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if RESOLVER_DB_SQLITE
    if (database.sqlite().path().empty()) throw util::ConfigurationError("database.sqlite.path must be set");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    RESOLVER_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RESOLVER_DB_POSTGRES
    if (database.postgres().connection_uri().empty()) throw util::ConfigurationError("database.postgres.connection_uri must be set");
    const std::size_t max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto              pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    RESOLVER_LOG_INFO("repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  RESOLVER_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::unique_ptr<ingest::RecordSource> BuildRecordSource(const resolver::runtime::config::SourceConfig& source, std::shared_ptr<db::Repository> repository) {
  if (source.has_csv()) {
#if RESOLVER_INGEST_ARROW
    return std::make_unique<ingest::CsvRecordSource>(source.csv());
#else
    throw util::ConfigurationError("csv source requested but Arrow CSV support is not enabled at build time");
#endif
  }
  return std::make_unique<ingest::RepositoryRecordSource>(std::move(repository));
}

/*
    Build full application dependency graph
*/
Application Build(const resolver::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Engine first: configuration errors surface before any I/O
  // ------------------------------------------------------------------
  app.engine = std::make_unique<core::ResolutionEngine>(config::BuildResolutionConfig(config));

  // ------------------------------------------------------------------
  // Boundaries
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  app.source     = BuildRecordSource(config.source(), app.repository);

  persist::WriteOptions write_options;
  write_options.write_normalized = config.persistence().write_normalized();
  write_options.write_edges      = config.persistence().write_edges();
  app.writer                     = std::make_unique<persist::ResultWriter>(app.repository, write_options);

  if (!config.graph_export().graph_json_path().empty()) {
    exporter::ExportOptions export_options;
    export_options.include_masters = config.graph_export().include_masters();
    app.exporter.emplace(export_options);
    app.export_path = config.graph_export().graph_json_path();
  }

  return app;
}

} // namespace resolver::factory
