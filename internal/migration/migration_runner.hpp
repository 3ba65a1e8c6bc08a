#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/migration/migration_reporter.hpp"
#include "internal/migration/migration_source.hpp"
#include "internal/migration/migration_store.hpp"
#include "internal/migration/migration_types.hpp"

namespace sqlmigrate::migration {

/*
  MigrationRunner

  Applies pending migrations strictly one after another, in ascending
  filename order, each inside its own transaction together with its
  tracking record.

  Guarantees:
  - a migration's effects and its tracking record commit together or not at all
  - on the first failure that migration is rolled back, migrations committed
    before it stay applied and nothing after it is attempted
  - a second Run() without new files applies nothing

  Not thread-safe; one runner per database at a time (no lock is taken).
  The repository, and with it the connection, is owned by the caller.
*/
class MigrationRunner {
 public:
  MigrationRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const MigrationSource> source,
                  std::shared_ptr<MigrationReporter> reporter = nullptr);

  // Throws a util::MigrationError subclass on failure (state becomes kFailed).
  MigrationSummary Run(const std::filesystem::path& directory);

  // Ensures the tracking table and computes the pending set; applies nothing.
  MigrationPlan Plan(const std::filesystem::path& directory);

  MigrationStore& Store() {
    return store_;
  }

  RunState State() const {
    return state_;
  }

 private:
  MigrationPlan Scan(const std::filesystem::path& directory);
  void          Apply(const MigrationFile& file, std::size_t index, std::size_t pending);
  void          RollBack(db::Transaction& tx, const MigrationFile& file);
  void          Transition(RunState next);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const MigrationSource> source_;
  std::shared_ptr<MigrationReporter>     reporter_;
  MigrationStore                         store_;
  RunState                               state_ = RunState::kIdle;
};

} // namespace sqlmigrate::migration
