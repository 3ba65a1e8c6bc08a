#include "pg_repository.hpp"

#include "internal/db/sql/identifier.hpp"

namespace sqlmigrate::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgSession> session, std::string tracking_table)
    : session_(std::move(session)), table_(sql::ValidateIdentifier(tracking_table)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(session_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  // most specific pqxx types first: unique_violation is an integrity_constraint_violation
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::syntax_error*>(&e) || dynamic_cast<const pqxx::undefined_table*>(&e) ||
      dynamic_cast<const pqxx::undefined_column*>(&e) || dynamic_cast<const pqxx::undefined_function*>(&e)) {
    return Result::Err(ErrorCode::InvalidStatement, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e) || dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::insufficient_privilege*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::disk_full*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::data_exception*>(&e) || dynamic_cast<const pqxx::sql_error*>(&e)) {
    return Result::Err(ErrorCode::InvalidStatement, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::ExecuteScript(Transaction& t, const std::string& sql) {
  // an all-whitespace body is a valid (empty) migration
  if (sql.find_first_not_of(" \t\r\n") == std::string::npos) {
    return Result::Ok();
  }
  try {
    // no parameters: the simple query protocol accepts several statements at once
    TX(t).Work().exec(sql);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CreateTrackingTable(Transaction& t) {
  try {
    TX(t).Work().exec("CREATE TABLE IF NOT EXISTS " + table_ +
                      " (id SERIAL PRIMARY KEY, filename VARCHAR(255) NOT NULL UNIQUE, applied_at TIMESTAMPTZ NOT NULL DEFAULT now());");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListMigrationRecords(Transaction& t, std::vector<model::MigrationRecord>& out) {
  try {
    auto res = TX(t).Work().exec("SELECT filename, (EXTRACT(EPOCH FROM applied_at) * 1000)::BIGINT FROM " + table_ + " ORDER BY filename;");

    out.clear();
    out.reserve(res.size());
    for (const auto& row : res) {
      model::MigrationRecord r;
      r.filename      = row[0].c_str();
      r.applied_at_ms = row[1].is_null() ? 0 : row[1].as<uint64_t>();
      out.push_back(std::move(r));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertMigrationRecord(Transaction& t, const model::MigrationRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO " + table_ + " (filename, applied_at) VALUES ($1, to_timestamp($2::BIGINT / 1000.0));",
                             r.filename, r.applied_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace sqlmigrate::db::postgres
