#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace sqlmigrate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgSession> session) : session_(std::move(session))
{
  tx_ = std::make_unique<pqxx::work>(session_->Connection());
}

PgTransaction::~PgTransaction() {
  if (!closed_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      SQLMIGRATE_LOG_WARN("postgres rollback on scope exit failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  closed_    = true;
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (closed_) return;
  tx_->abort();
  closed_ = true;
}

} // namespace sqlmigrate::db::postgres
