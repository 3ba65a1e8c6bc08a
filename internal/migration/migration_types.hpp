#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmigrate::migration {

/*
  One candidate migration on disk.

  Identity is the filename. The body is not carried here: it is read
  fresh through MigrationSource::ReadBody() right before it is applied.
*/
struct MigrationFile {
  std::string           filename;
  std::filesystem::path path;
};

/*
  What a run would do, computed without touching the database schema
  beyond the tracking table.
*/
struct MigrationPlan {
  // every candidate, ascending byte-wise filename order
  std::vector<MigrationFile> candidates;

  // candidates not in the tracking table, same order
  std::vector<MigrationFile> pending;

  std::size_t already_applied = 0;
};

struct MigrationSummary {
  std::size_t total_candidates = 0;
  std::size_t already_applied  = 0;
  std::size_t newly_applied    = 0;
};

inline bool operator==(const MigrationSummary& a, const MigrationSummary& b) {
  return a.total_candidates == b.total_candidates && a.already_applied == b.already_applied && a.newly_applied == b.newly_applied;
}

/*
  Runner state machine:

    Idle -> SchemaReady -> Scanning -> Applying(i) -> Committed(i) -> ... -> Done
                                                   \-> RolledBack(i) -> Failed

  Failed is also reached straight from Idle/SchemaReady/Scanning when the
  store or the source is unavailable.
*/
enum class RunState {
  kIdle,
  kSchemaReady,
  kScanning,
  kApplying,
  kCommitted,
  kRolledBack,
  kDone,
  kFailed,
};

inline std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "idle";
    case RunState::kSchemaReady:
      return "schema_ready";
    case RunState::kScanning:
      return "scanning";
    case RunState::kApplying:
      return "applying";
    case RunState::kCommitted:
      return "committed";
    case RunState::kRolledBack:
      return "rolled_back";
    case RunState::kDone:
      return "done";
    case RunState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace sqlmigrate::migration
