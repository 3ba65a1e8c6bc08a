#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

namespace sqlmigrate::db::postgres {

/*
  PgSession

  The single connection a migration run works on.

  Design notes:
  -------------
  - Created by the caller (composition root) and held for the whole run.
  - libpqxx connections are NOT thread-safe; the runner is single-threaded
    and opens at most one pqxx::work at a time on it.
  - The connection closes when the last owner (repository or open
    transaction) releases its shared_ptr.
*/

class PgSession {
 public:
  explicit PgSession(std::string conninfo);

  PgSession(const PgSession&)            = delete;
  PgSession& operator=(const PgSession&) = delete;

  pqxx::connection& Connection();

  bool IsOpen() const;

 private:
  std::string                       conninfo_;
  std::unique_ptr<pqxx::connection> conn_;
};

} // namespace sqlmigrate::db::postgres
