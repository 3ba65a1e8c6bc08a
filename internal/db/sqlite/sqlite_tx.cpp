#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sqlmigrate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  // sqlite may already have rolled back on its own (IOERR, FULL, ...)
  if (!closed_ && !sqlite3_get_autocommit(db_->Handle())) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      SQLMIGRATE_LOG_WARN("sqlite rollback on scope exit failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (closed_) {
    throw std::logic_error("sqlite transaction already closed");
  }
  db_->Exec("COMMIT;");
  closed_    = true;
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (closed_) {
    return;
  }
  if (!sqlite3_get_autocommit(db_->Handle())) {
    db_->Exec("ROLLBACK;");
  }
  closed_ = true;
}

} // namespace sqlmigrate::db::sqlite
