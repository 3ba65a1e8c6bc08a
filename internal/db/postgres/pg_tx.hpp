#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_session.hpp"

namespace sqlmigrate::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgSession> session);
  ~PgTransaction() override;

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsClosed() const override { return closed_; }
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<PgSession> session_;
  std::unique_ptr<pqxx::work> tx_;
  bool closed_    = false;
  bool committed_ = false;
};

} // namespace sqlmigrate::db::postgres
