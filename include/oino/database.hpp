/**
 * oino/database.hpp - RAII SQLite database and statement wrappers
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Example usage:
 *
 *   oino::Database db;
 *   if (!db.open("shop.db")) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *
 *   oino::Statement stmt;
 *   if (!db.prepare("SELECT sql FROM sqlite_master WHERE name = ?", stmt) ||
 *       !stmt.bind_text(1, "orders")) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *   while (stmt.step() == SQLITE_ROW) {
 *       printf("%s\n", stmt.column_text(0).c_str());
 *   }
 */

#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <utility>
#include <vector>

namespace oino {

// ============================================================================
// Query Result Types
// ============================================================================

struct ResultRow {
    std::vector<std::string> values;

    const std::string& operator[](size_t i) const { return values[i]; }
    std::string& operator[](size_t i) { return values[i]; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

struct Result {
    std::vector<std::string> columns;
    std::vector<ResultRow> rows;
    std::string error;

    bool ok() const { return error.empty(); }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const ResultRow& operator[](size_t i) const { return rows[i]; }

    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

// ============================================================================
// Prepared Statement
// ============================================================================

class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement() { finalize(); }

    // Non-copyable
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Movable
    Statement(Statement&& other) noexcept
        : db_(other.db_), stmt_(other.stmt_) {
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }

    Statement& operator=(Statement&& other) noexcept {
        if (this != &other) {
            finalize();
            db_ = other.db_;
            stmt_ = other.stmt_;
            other.db_ = nullptr;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    bool valid() const { return stmt_ != nullptr; }

    void finalize() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    // ========================================================================
    // Binding (1-based indexes)
    // ========================================================================

    bool bind_text(int index, const std::string& value) {
        return stmt_ && sqlite3_bind_text(stmt_, index, value.c_str(),
                                          static_cast<int>(value.size()),
                                          SQLITE_TRANSIENT) == SQLITE_OK;
    }

    bool bind_int64(int index, int64_t value) {
        return stmt_ && sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
    }

    bool bind_null(int index) {
        return stmt_ && sqlite3_bind_null(stmt_, index) == SQLITE_OK;
    }

    // ========================================================================
    // Stepping
    // ========================================================================

    /// Returns SQLITE_ROW, SQLITE_DONE or an error code.
    int step() {
        return stmt_ ? sqlite3_step(stmt_) : SQLITE_MISUSE;
    }

    int column_count() const {
        return stmt_ ? sqlite3_column_count(stmt_) : 0;
    }

    std::string column_name(int i) const {
        const char* name = stmt_ ? sqlite3_column_name(stmt_, i) : nullptr;
        return name ? name : "";
    }

    std::string column_text(int i) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
        return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, i))) : "";
    }

    /// Column value with the storage class SQLite reports for it.
    Cell column_cell(int i) const {
        switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, i);
            case SQLITE_BLOB: {
                const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i));
                int size = sqlite3_column_bytes(stmt_, i);
                return data ? Bytes(data, data + size) : Bytes();
            }
            case SQLITE_NULL:
                return Null{};
            default:
                return column_text(i);
        }
    }

    std::string error() const {
        return db_ ? sqlite3_errmsg(db_) : "Statement not prepared";
    }

    sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    Database() = default;

    /**
     * Constructor with explicit path
     */
    explicit Database(const char* path) { open(path); }
    ~Database() { close(); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_), last_error_(std::move(other.last_error_)) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            last_error_ = std::move(other.last_error_);
            other.db_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Open/Close
    // ========================================================================

    bool open(const char* path = ":memory:") {
        close();
        // Serialized: one connection is shared by concurrent requests
        int rc = sqlite3_open_v2(path, &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return false;
        }
        last_error_.clear();
        return true;
    }

    bool open(const std::string& path) {
        return open(path.c_str());
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }

    // ========================================================================
    // Statements
    // ========================================================================

    bool prepare(const std::string& sql, Statement& out) {
        if (!db_) {
            last_error_ = "Database not open";
            return false;
        }
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            return false;
        }
        out = Statement(db_, stmt);
        last_error_.clear();
        return true;
    }

    // ========================================================================
    // Query Execution
    // ========================================================================

    Result query(const char* sql) {
        Result result;

        Statement stmt;
        if (!prepare(sql, stmt)) {
            result.error = last_error_;
            return result;
        }

        int col_count = stmt.column_count();
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            result.columns.push_back(stmt.column_name(i));
        }

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            ResultRow row;
            row.values.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                row.values.push_back(stmt.column_text(i));
            }
            result.rows.push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            result.error = sqlite3_errmsg(db_);
        }
        return result;
    }

    Result query(const std::string& sql) {
        return query(sql.c_str());
    }

    /**
     * Get single value (first column of first row)
     */
    std::string scalar(const std::string& sql) {
        auto result = query(sql);
        if (result.ok() && !result.empty()) {
            return result[0][0];
        }
        return "";
    }

    int exec(const char* sql) {
        if (!db_) {
            last_error_ = "Database not open";
            return SQLITE_ERROR;
        }

        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
        } else {
            last_error_.clear();
        }
        return rc;
    }

    int exec(const std::string& sql) {
        return exec(sql.c_str());
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }
    const std::string& last_error() const { return last_error_; }

    // ========================================================================
    // Utility
    // ========================================================================

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

    int changes() const {
        return db_ ? sqlite3_changes(db_) : 0;
    }

private:
    sqlite3* db_ = nullptr;
    std::string last_error_;
};

// ============================================================================
// Connection Lock
// ============================================================================

/**
 * Holds the connection mutex for a scope, so that a step and the reads of
 * changes(), last_insert_rowid() and the error message that follow it see
 * the same statement. The mutex is recursive and only exists in serialized
 * mode; without it the lock does nothing.
 */
class ConnectionLock {
public:
    explicit ConnectionLock(const Database& db)
        : mutex_(db.handle() ? sqlite3_db_mutex(db.handle()) : nullptr) {
        if (mutex_) sqlite3_mutex_enter(mutex_);
    }

    ~ConnectionLock() {
        if (mutex_) sqlite3_mutex_leave(mutex_);
    }

    ConnectionLock(const ConnectionLock&) = delete;
    ConnectionLock& operator=(const ConnectionLock&) = delete;

private:
    sqlite3_mutex* mutex_;
};

} // namespace oino
