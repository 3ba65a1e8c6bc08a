#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sqlmigrate::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> db, std::string tracking_table);

  std::unique_ptr<Transaction> Begin() override;

  Result ExecuteScript(Transaction&, const std::string& sql) override;

  Result CreateTrackingTable(Transaction&) override;
  Result ListMigrationRecords(Transaction&, std::vector<model::MigrationRecord>& out) override;
  Result InsertMigrationRecord(Transaction&, const model::MigrationRecord&) override;

  std::string_view BackendName() const override { return "sqlite"; }
  const std::string& TrackingTable() const override { return table_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::string table_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc, const char* message = nullptr);
};

} // namespace sqlmigrate::db::sqlite
