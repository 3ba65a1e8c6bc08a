#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/migration/migration_reporter.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/migration/migration_source.hpp"

namespace sqlmigrate::factory {

/*
  Application

  Owns everything one CLI invocation needs. The repository holds the
  database connection; it is released when the Application is destroyed,
  whatever the outcome of the run.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<const migration::MigrationSource> source;
  std::unique_ptr<migration::MigrationRunner>     runner;
};

/*
  BuildRepository

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const sqlmigrate::runtime::config::RuntimeConfig& config);

Application Build(const sqlmigrate::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<migration::MigrationReporter> reporter);

} // namespace sqlmigrate::factory
