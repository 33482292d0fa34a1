#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"

#include "internal/core/resolution_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/exporter/graph_exporter.hpp"
#include "internal/ingest/record_source.hpp"
#include "internal/persist/result_writer.hpp"

namespace resolver::factory {

/*
  Application

  Everything one CLI invocation needs. The engine is built (and its
  configuration validated) before any record is loaded.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::unique_ptr<ingest::RecordSource>   source;
  std::unique_ptr<core::ResolutionEngine> engine;
  std::unique_ptr<persist::ResultWriter>  writer;

  std::optional<exporter::GraphExporter> exporter;
  std::string                            export_path;
};

/*
  Composition root. The ONLY place allowed to know concrete repository
  and record source types.

  Throws util::ConfigurationError for invalid resolution settings and for
  backends requested but not enabled at build time.
*/
std::shared_ptr<db::Repository> BuildRepository(const resolver::runtime::config::DatabaseConfig& database);

std::unique_ptr<ingest::RecordSource> BuildRecordSource(const resolver::runtime::config::SourceConfig& source, std::shared_ptr<db::Repository> repository);

Application Build(const resolver::runtime::config::RuntimeConfig& config);

} // namespace resolver::factory
