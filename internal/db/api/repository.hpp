#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/migration_record.hpp"

namespace sqlmigrate::db {

/*
  Repository abstraction over the database being migrated.

  CRITICAL GUARANTEES:

  - One repository wraps one connection/session for its whole lifetime
  - All statements run inside a Transaction obtained from Begin()
  - Reads inside a transaction see its own writes
  - A migration body and its tracking record share one Transaction, so
    either both become visible or neither does

  The tracking table name is fixed at construction and has already been
  validated as a plain SQL identifier.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Migration bodies
  // ---------------------------------------------------------------------

  // Executes one or more ';'-separated statements.
  virtual Result ExecuteScript(Transaction&, const std::string& sql) = 0;

  // ---------------------------------------------------------------------
  // Tracking table
  // ---------------------------------------------------------------------

  // CREATE TABLE IF NOT EXISTS; safe to call on every run.
  virtual Result CreateTrackingTable(Transaction&) = 0;

  // Rows ordered by filename.
  virtual Result ListMigrationRecords(Transaction&, std::vector<model::MigrationRecord>& out) = 0;

  // AlreadyExists if the filename is recorded already.
  virtual Result InsertMigrationRecord(Transaction&, const model::MigrationRecord&) = 0;

  virtual std::string_view BackendName() const = 0;
  virtual const std::string& TrackingTable() const = 0;
};

} // namespace sqlmigrate::db
