#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/database.h — SQLite connection and query builder
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct sqlite3;

namespace shorturl::db {

using Row = std::unordered_map<std::string, std::string>;

struct Result {
    std::vector<Row> rows;
    std::vector<std::string> columns;
    int affectedRows = 0;
    std::int64_t lastInsertId = 0;

    bool empty() const { return rows.empty(); }
    std::size_t size() const { return rows.size(); }
    const Row& first() const { return rows.front(); }
};

// Any SQLite failure
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// UNIQUE / NOT NULL / CHECK violations
class ConstraintError : public Error {
public:
    using Error::Error;
};

// ═══════════════════════════════════════════
//  Database
//  One connection; exec() calls are serialized so
//  lastInsertId/affectedRows belong to the caller's statement.
// ═══════════════════════════════════════════
class Database {
public:
    explicit Database(const std::string& path = ":memory:");
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    Result exec(const std::string& sql);
    Result exec(const std::string& sql, const std::vector<std::string>& params);

    // Several statements, no results (schema setup)
    void execMulti(const std::string& sql);

    bool isOpen() const { return db_ != nullptr; }
    void close();

private:
    sqlite3* db_ = nullptr;
    std::unique_ptr<std::mutex> mutex_ = std::make_unique<std::mutex>();
};

// ═══════════════════════════════════════════
//  QueryBuilder (fluent, SELECT and INSERT)
// ═══════════════════════════════════════════
class QueryBuilder {
public:
    explicit QueryBuilder(Database& db) : db_(db) {}

    QueryBuilder& table(const std::string& name) { table_ = name; return *this; }

    QueryBuilder& select(const std::string& cols = "*") {
        type_ = "SELECT";
        columns_ = cols;
        return *this;
    }

    QueryBuilder& where(const std::string& condition, const std::string& value) {
        conditions_.push_back(condition);
        params_.push_back(value);
        return *this;
    }

    QueryBuilder& orderBy(const std::string& col, const std::string& dir = "ASC") {
        orderBy_ = col + " " + dir;
        return *this;
    }

    QueryBuilder& limit(int n) { limit_ = n; return *this; }

    // Column order is preserved in the generated statement
    QueryBuilder& insert(std::vector<std::pair<std::string, std::string>> data) {
        type_ = "INSERT";
        insertData_ = std::move(data);
        return *this;
    }

    std::string toSql() const {
        std::ostringstream sql;
        if (type_ == "SELECT") {
            sql << "SELECT " << columns_ << " FROM " << table_;
        } else if (type_ == "INSERT") {
            sql << "INSERT INTO " << table_ << " (";
            std::string cols, vals;
            for (auto& [k, _] : insertData_) {
                if (!cols.empty()) { cols += ", "; vals += ", "; }
                cols += k;
                vals += "?";
            }
            sql << cols << ") VALUES (" << vals << ")";
            return sql.str();
        }

        for (std::size_t i = 0; i < conditions_.size(); ++i) {
            sql << (i == 0 ? " WHERE " : " AND ") << conditions_[i];
        }
        if (!orderBy_.empty()) sql << " ORDER BY " << orderBy_;
        if (limit_ > 0) sql << " LIMIT " << limit_;

        return sql.str();
    }

    Result run() {
        std::vector<std::string> allParams = params_;
        if (type_ == "INSERT") {
            allParams.clear();
            for (auto& [_, v] : insertData_) allParams.push_back(v);
        }
        return db_.exec(toSql(), allParams);
    }

private:
    Database& db_;
    std::string type_ = "SELECT";
    std::string table_;
    std::string columns_ = "*";
    std::vector<std::string> conditions_;
    std::vector<std::string> params_;
    std::string orderBy_;
    int limit_ = 0;
    std::vector<std::pair<std::string, std::string>> insertData_;
};

inline QueryBuilder query(Database& db) {
    return QueryBuilder(db);
}

} // namespace shorturl::db
