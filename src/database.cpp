// ═══════════════════════════════════════════════════════════════════
//  database.cpp — SQLite driver implementation
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/database.h"
#include <sqlite3.h>

namespace shorturl::db {

namespace {

// Finalizes the statement on every exit path
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() { sqlite3_finalize(stmt); }
};

[[noreturn]] void fail(sqlite3* db, int rc, const std::string& what) {
    std::string message = what + ": " + sqlite3_errmsg(db);
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        throw ConstraintError(message);
    }
    throw Error(message);
}

} // namespace

Database::Database(const std::string& path) {
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw Error("Failed to open database '" + path + "': " + err);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL");
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), mutex_(std::move(other.mutex_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        mutex_ = std::move(other.mutex_);
        other.db_ = nullptr;
    }
    return *this;
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result Database::exec(const std::string& sql) {
    return exec(sql, {});
}

Result Database::exec(const std::string& sql, const std::vector<std::string>& params) {
    if (!db_) throw Error("Database is closed");
    std::lock_guard<std::mutex> lock(*mutex_);

    Result result;
    StatementGuard guard;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &guard.stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail(db_, rc, "SQL error");
    }

    for (int i = 0; i < static_cast<int>(params.size()); i++) {
        sqlite3_bind_text(guard.stmt, i + 1, params[i].c_str(),
                          static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
    }

    int colCount = sqlite3_column_count(guard.stmt);
    result.columns.reserve(colCount);
    for (int i = 0; i < colCount; i++) {
        result.columns.push_back(sqlite3_column_name(guard.stmt, i));
    }

    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        Row row;
        for (int i = 0; i < colCount; i++) {
            auto text = sqlite3_column_text(guard.stmt, i);
            row[result.columns[i]] = text ? reinterpret_cast<const char*>(text) : "";
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        fail(db_, rc, "SQL step error");
    }

    result.affectedRows = sqlite3_changes(db_);
    result.lastInsertId = sqlite3_last_insert_rowid(db_);
    return result;
}

void Database::execMulti(const std::string& sql) {
    if (!db_) throw Error("Database is closed");
    std::lock_guard<std::mutex> lock(*mutex_);

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw Error("SQL exec error: " + err);
    }
}

} // namespace shorturl::db
