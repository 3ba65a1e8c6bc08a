#include "pg_session.hpp"

#include <stdexcept>

namespace sqlmigrate::db::postgres {

PgSession::PgSession(std::string conninfo) : conninfo_(std::move(conninfo)) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo_);
  } catch (const pqxx::broken_connection& e) {
    throw std::runtime_error("cannot connect to postgres: " + std::string(e.what()));
  }
}

pqxx::connection& PgSession::Connection() {
  if (!IsOpen()) {
    throw pqxx::broken_connection("postgres session is closed");
  }
  return *conn_;
}

bool PgSession::IsOpen() const {
  return conn_ && conn_->is_open();
}

} // namespace sqlmigrate::db::postgres
