#pragma once

#include <cstdint>
#include <string>

namespace sqlmigrate::db::model {

/*
  One row of the tracking table.

  Append-only: a record is inserted when its migration commits and is never
  updated or deleted afterwards. The surrogate id column is not carried here,
  ordering always goes by filename.
*/

struct MigrationRecord {
  std::string filename;

  // Unix epoch milliseconds
  uint64_t applied_at_ms = 0;
};

} // namespace sqlmigrate::db::model
