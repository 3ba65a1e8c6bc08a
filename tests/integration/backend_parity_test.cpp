#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/migration/file_system.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/migration/migration_source.hpp"
#include "internal/util/errors.hpp"

#if SQLMIGRATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SQLMIGRATE_DB_POSTGRES
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_session.hpp"
#endif

namespace {

using sqlmigrate::db::Repository;
using sqlmigrate::migration::LocalFileSystem;
using sqlmigrate::migration::MigrationRunner;
using sqlmigrate::migration::MigrationSource;
using sqlmigrate::migration::MigrationSummary;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                                            name;
  std::function<std::shared_ptr<Repository>(const std::string& table)>   make_repository;
  std::function<bool(const std::string& table)>                          table_exists;
  std::function<void(const std::vector<std::string>& tables)>            cleanup;
  std::function<void()>                                                  teardown;
};

// Scratch migration directory plus unique, lowercase table names so reruns
// against a long-lived server do not collide.
class Scenario {
 public:
  explicit Scenario(const std::string& label) : suffix_(label + "_" + std::to_string(NowMs())) {
    dir_ = std::filesystem::temp_directory_path() / ("sqlmigrate_parity_" + suffix_);
    std::filesystem::create_directories(dir_);
  }

  ~Scenario() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string Table(const std::string& base) {
    auto name = base + "_" + suffix_;
    tables_.push_back(name);
    return name;
  }

  void Write(const std::string& filename, const std::string& body) const {
    std::ofstream out(dir_ / filename, std::ios::trunc);
    out << body;
  }

  const std::filesystem::path& Dir() const {
    return dir_;
  }

  const std::vector<std::string>& Tables() const {
    return tables_;
  }

 private:
  std::string              suffix_;
  std::filesystem::path    dir_;
  std::vector<std::string> tables_;
};

MigrationRunner MakeRunner(std::shared_ptr<Repository> repo) {
  return MigrationRunner(std::move(repo), std::make_shared<MigrationSource>(std::make_shared<LocalFileSystem>()));
}

void ExpectSummary(const MigrationSummary& s, std::size_t total, std::size_t already, std::size_t newly) {
  assert(s.total_candidates == total);
  assert(s.already_applied == already);
  assert(s.newly_applied == newly);
}

void VerifyCreateThenAlter(BackendFactory& backend) {
  Scenario   sc("alter");
  const auto tracking = sc.Table("tracking");
  const auto t        = sc.Table("t");

  sc.Write("0001_create_table.sql", "CREATE TABLE " + t + " (id INT)");
  sc.Write("0002_add_column.sql", "ALTER TABLE " + t + " ADD COLUMN name TEXT");

  {
    auto runner = MakeRunner(backend.make_repository(tracking));
    ExpectSummary(runner.Run(sc.Dir()), 2, 0, 2);
    assert(backend.table_exists(t));
  }

  // a new connection must see what the first one committed
  auto runner = MakeRunner(backend.make_repository(tracking));
  ExpectSummary(runner.Run(sc.Dir()), 2, 2, 0);

  const auto records = runner.Store().ListRecords();
  assert(records.size() == 2);
  assert(records[0].filename == "0001_create_table.sql");
  assert(records[1].filename == "0002_add_column.sql");
  assert(records[0].applied_at_ms <= records[1].applied_at_ms);

  backend.cleanup(sc.Tables());
}

void VerifyFailureIsAtomic(BackendFactory& backend) {
  Scenario   sc("atomic");
  const auto tracking = sc.Table("tracking");
  const auto a        = sc.Table("a");
  const auto b        = sc.Table("b");
  const auto c        = sc.Table("c");

  sc.Write("0001_a.sql", "CREATE TABLE " + a + " (id INTEGER);");
  sc.Write("0002_b.sql", "CREATE TABLE " + b + " (id INTEGER);\nINSERT INTO no_such_table_" + b + " VALUES (1);");
  sc.Write("0003_c.sql", "CREATE TABLE " + c + " (id INTEGER);");

  {
    auto runner = MakeRunner(backend.make_repository(tracking));
    bool threw  = false;
    try {
      (void)runner.Run(sc.Dir());
    } catch (const sqlmigrate::util::ApplyError& e) {
      threw = true;
      assert(e.Filename() == "0002_b.sql");
    }
    assert(threw);

    assert(backend.table_exists(a));
    assert(!backend.table_exists(b));
    assert(!backend.table_exists(c));

    const auto records = runner.Store().ListRecords();
    assert(records.size() == 1);
    assert(records[0].filename == "0001_a.sql");
  }

  sc.Write("0002_b.sql", "CREATE TABLE " + b + " (id INTEGER);");

  auto runner = MakeRunner(backend.make_repository(tracking));
  ExpectSummary(runner.Run(sc.Dir()), 3, 1, 2);
  assert(backend.table_exists(b));
  assert(backend.table_exists(c));

  backend.cleanup(sc.Tables());
}

void VerifyEmptyDirectory(BackendFactory& backend) {
  Scenario   sc("empty");
  const auto tracking = sc.Table("tracking");

  auto runner = MakeRunner(backend.make_repository(tracking));
  ExpectSummary(runner.Run(sc.Dir()), 0, 0, 0);
  assert(backend.table_exists(tracking));
  assert(runner.Store().ListRecords().empty());

  backend.cleanup(sc.Tables());
}

#if SQLMIGRATE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("sqlmigrate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [db_path](const std::string& table) {
            auto db = std::make_shared<sqlmigrate::db::sqlite::SqliteDB>(db_path);
            return std::make_shared<sqlmigrate::db::sqlite::SqliteRepository>(std::move(db), table);
          },
      .table_exists =
          [db_path](const std::string& table) {
            sqlmigrate::db::sqlite::SqliteDB db(db_path);
            sqlite3_stmt* st = db.Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
            sqlite3_bind_text(st, 1, table.c_str(), -1, SQLITE_TRANSIENT);
            const bool exists = sqlite3_step(st) == SQLITE_ROW;
            sqlite3_finalize(st);
            return exists;
          },
      .cleanup =
          [db_path](const std::vector<std::string>& tables) {
            sqlmigrate::db::sqlite::SqliteDB db(db_path);
            for (const auto& table : tables) {
              db.Exec("DROP TABLE IF EXISTS " + table + ";");
            }
          },
      .teardown =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if SQLMIGRATE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SQLMIGRATE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SQLMIGRATE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);

  return BackendFactory{
      .name = "postgres",
      .make_repository =
          [conninfo](const std::string& table) {
            auto session = std::make_shared<sqlmigrate::db::postgres::PgSession>(conninfo);
            return std::make_shared<sqlmigrate::db::postgres::PgRepository>(std::move(session), table);
          },
      .table_exists =
          [conninfo](const std::string& table) {
            sqlmigrate::db::postgres::PgSession session(conninfo);
            pqxx::work                          tx(session.Connection());
            auto                                res = tx.exec_params("SELECT to_regclass($1) IS NOT NULL;", table);
            return res[0][0].as<bool>();
          },
      .cleanup =
          [conninfo](const std::vector<std::string>& tables) {
            sqlmigrate::db::postgres::PgSession session(conninfo);
            pqxx::work                          tx(session.Connection());
            for (const auto& table : tables) {
              tx.exec("DROP TABLE IF EXISTS " + table + ";");
            }
            tx.commit();
          },
      .teardown = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyEmptyDirectory(backend);
  VerifyCreateThenAlter(backend);
  VerifyFailureIsAtomic(backend);

  backend.teardown();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;

#if SQLMIGRATE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SQLMIGRATE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "sqlmigrate_integration_backend_parity: pass\n";
  return 0;
}
