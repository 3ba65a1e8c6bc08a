#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "internal/migration/migration_types.hpp"
#include "internal/util/errors.hpp"

namespace sqlmigrate::migration {

/*
  Presentation collaborator of MigrationRunner.

  The runner never prints; it reports progress here and returns the summary
  to its caller. All hooks default to no-ops.
*/
class MigrationReporter {
 public:
  virtual ~MigrationReporter() = default;

  virtual void OnStateChange(RunState /*from*/, RunState /*to*/) {
  }

  virtual void OnSchemaReady(const std::string& /*tracking_table*/) {
  }

  virtual void OnSkipped(const MigrationFile& /*file*/) {
  }

  // index is 0-based within the pending set
  virtual void OnApplying(const MigrationFile& /*file*/, std::size_t /*index*/, std::size_t /*pending*/) {
  }

  virtual void OnApplied(const MigrationFile& /*file*/, std::chrono::milliseconds /*elapsed*/) {
  }

  virtual void OnFailed(const util::MigrationError& /*error*/) {
  }

  virtual void OnSummary(const MigrationSummary& /*summary*/) {
  }
};

// Writes every hook to the process logger.
class LoggingReporter final : public MigrationReporter {
 public:
  void OnSchemaReady(const std::string& tracking_table) override;
  void OnSkipped(const MigrationFile& file) override;
  void OnApplying(const MigrationFile& file, std::size_t index, std::size_t pending) override;
  void OnApplied(const MigrationFile& file, std::chrono::milliseconds elapsed) override;
  void OnFailed(const util::MigrationError& error) override;
  void OnSummary(const MigrationSummary& summary) override;
};

} // namespace sqlmigrate::migration
