#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/identifier.hpp"

namespace sqlmigrate::db::sqlite {

using sqlmigrate::db::ErrorCode;
using sqlmigrate::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Refuses BEGIN/COMMIT/END/ROLLBACK at prepare time. A body that ends the
// outer transaction would commit its own first half with no tracking record.
static int DenyTransactionControl(void*, int action, const char*, const char*, const char*, const char*) {
    return action == SQLITE_TRANSACTION ? SQLITE_DENY : SQLITE_OK;
}

class TransactionControlGuard {
public:
    explicit TransactionControlGuard(sqlite3* db) : db_(db) {
        sqlite3_set_authorizer(db_, DenyTransactionControl, nullptr);
    }
    ~TransactionControlGuard() { sqlite3_set_authorizer(db_, nullptr, nullptr); }

    TransactionControlGuard(const TransactionControlGuard&)            = delete;
    TransactionControlGuard& operator=(const TransactionControlGuard&) = delete;

private:
    sqlite3* db_;
};

static constexpr const char* kEndsTransaction = "migration body must not end the transaction (BEGIN/COMMIT/END/ROLLBACK)";

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, std::string tracking_table)
    : db_(std::move(db)), table_(sql::ValidateIdentifier(tracking_table)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc, const char* message) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    std::string msg = message ? message : sqlite3_errmsg(db);

    // primary result code lives in the low byte of the extended one
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, std::move(msg));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, std::move(msg));
            return Result::Err(ErrorCode::ConstraintViolation, std::move(msg));
        }
        case SQLITE_ERROR:
            return Result::Err(ErrorCode::InvalidStatement, std::move(msg));
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_READONLY:
        case SQLITE_PERM:
            return Result::Err(ErrorCode::Unavailable, std::move(msg));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, std::move(msg));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, std::move(msg));
        default:
            return Result::Err(ErrorCode::InternalError, std::move(msg));
    }
}

// ------------------------------------------------------------------
// Migration bodies
// ------------------------------------------------------------------

Result SqliteRepository::ExecuteScript(Transaction& t, const std::string& sql) {
    auto* db = TX(t).Handle();

    // sqlite3_exec walks every statement in the string, stopping at the first error
    char* err = nullptr;
    int rc = SQLITE_OK;
    {
        TransactionControlGuard guard(db);
        rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    }

    if (rc == SQLITE_AUTH) {
        std::string msg = std::string(kEndsTransaction) + ": " + (err ? err : sqlite3_errmsg(db));
        sqlite3_free(err);
        return Result::Err(ErrorCode::InvalidStatement, std::move(msg));
    }

    Result result = Translate(db, rc, err);
    sqlite3_free(err);
    if (result && sqlite3_get_autocommit(db)) {
        return Result::Err(ErrorCode::InvalidStatement, kEndsTransaction);
    }
    return result;
}

// ------------------------------------------------------------------
// Tracking table
// ------------------------------------------------------------------

Result SqliteRepository::CreateTrackingTable(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql =
        "CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "filename TEXT NOT NULL UNIQUE, "
        "applied_at INTEGER NOT NULL DEFAULT (unixepoch() * 1000));";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    Result result = Translate(db, rc, err);
    sqlite3_free(err);
    return result;
}

Result SqliteRepository::ListMigrationRecords(Transaction& t, std::vector<model::MigrationRecord>& out) {
    auto* db = TX(t).Handle();

    const std::string sql = "SELECT filename, applied_at FROM " + table_ + " ORDER BY filename;";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        return Translate(db, rc);
    }

    out.clear();
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::MigrationRecord r;
        r.filename = ColText(st, 0);
        r.applied_at_ms = ColU64(st, 1);
        out.push_back(std::move(r));
    }

    Result result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

Result SqliteRepository::InsertMigrationRecord(Transaction& t, const model::MigrationRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = "INSERT INTO " + table_ + " (filename, applied_at) VALUES (?, ?);";

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        return Translate(db, rc);
    }

    BindText(st, 1, r.filename);
    BindU64(st, 2, r.applied_at_ms);

    rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

} // namespace sqlmigrate::db::sqlite
