#pragma once

namespace sqlmigrate::db {

/*
  Abstract transaction, scoped to exactly one unit of work.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other sessions until Commit()
  - Rollback() discards every statement executed through it
  - Destructor MUST rollback if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once the transaction is closed (committed or rolled back)
  virtual bool IsClosed() const = 0;

  // true only if Commit() succeeded
  virtual bool IsCommitted() const = 0;
};

} // namespace sqlmigrate::db
