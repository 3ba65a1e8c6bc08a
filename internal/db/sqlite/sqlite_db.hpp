#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace sqlmigrate::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
  bool foreign_keys    = false;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is opened in the constructor and closed in the destructor;
  a migration run holds exactly one of these from start to finish.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string, throws std::runtime_error on failure
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace sqlmigrate::db::sqlite
