#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "pg_session.hpp"
#include "pg_tx.hpp"

namespace sqlmigrate::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgSession> session, std::string tracking_table);

  std::unique_ptr<Transaction> Begin() override;

  Result ExecuteScript(Transaction&, const std::string& sql) override;

  Result CreateTrackingTable(Transaction&) override;
  Result ListMigrationRecords(Transaction&, std::vector<model::MigrationRecord>& out) override;
  Result InsertMigrationRecord(Transaction&, const model::MigrationRecord&) override;

  std::string_view BackendName() const override { return "postgres"; }
  const std::string& TrackingTable() const override { return table_; }

private:
  std::shared_ptr<PgSession> session_;
  std::string table_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace sqlmigrate::db::postgres
