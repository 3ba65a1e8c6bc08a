#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/migration_record.hpp"

namespace sqlmigrate::migration {

/*
  MigrationStore

  Bookkeeping of applied migrations, kept in the tracking table of the
  database being migrated so that runner state and schema state cannot
  drift apart.

  EnsureSchema/ListApplied/ListRecords run in short transactions of their
  own and throw util::StoreUnavailable. RecordApplied runs inside the
  caller's migration transaction and throws util::DuplicateRecord or
  util::ApplyError.
*/
class MigrationStore {
 public:
  explicit MigrationStore(std::shared_ptr<db::Repository> repository);

  void EnsureSchema();

  std::unordered_set<std::string> ListApplied();

  // applied rows, ordered by filename
  std::vector<db::model::MigrationRecord> ListRecords();

  void RecordApplied(db::Transaction& tx, const std::string& filename);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace sqlmigrate::migration
