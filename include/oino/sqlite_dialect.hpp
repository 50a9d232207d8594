/**
 * oino/sqlite_dialect.hpp - SqlDialect backend for SQLite
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Identifiers are quoted with double quotes and table names with
 * brackets. Dates travel as ISO-8601 text, booleans as 0/1 and blobs as
 * X'..' literals.
 *
 *   auto db = std::make_shared<oino::Database>();
 *   db->open(":memory:");
 *   auto dialect = oino::make_sqlite_dialect(db, "main");
 */

#pragma once

#include "database.hpp"
#include "datetime.hpp"
#include "dialect.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include "str.hpp"
#include <memory>
#include <string>

namespace oino {

// ============================================================================
// Quoting and Literals
// ============================================================================

inline std::string sqlite_quote_identifier(const std::string& name) {
    return "\"" + replace_all(name, "\"", "\"\"") + "\"";
}

inline std::string sqlite_quote_table(const std::string& name) {
    return "[" + replace_all(name, "]", "]]") + "]";
}

inline std::string sql_string_literal(const std::string& s) {
    return "'" + replace_all(s, "'", "''") + "'";
}

inline LogicalType sqlite_logical_type(const std::string& native_type) {
    const std::string t = to_upper(native_type);
    if (t.find("BOOL") != std::string::npos) return LogicalType::Boolean;
    if (t.find("DATE") != std::string::npos || t.find("TIME") != std::string::npos) {
        return LogicalType::Datetime;
    }
    if (t.find("BLOB") != std::string::npos || t == "BINARY" || t == "VARBINARY") {
        return LogicalType::Blob;
    }
    if (t.find("CHAR") != std::string::npos || t.find("TEXT") != std::string::npos ||
        t.find("CLOB") != std::string::npos) {
        return LogicalType::String;
    }
    if (t.find("INT") != std::string::npos || t.find("REAL") != std::string::npos ||
        t.find("FLOA") != std::string::npos || t.find("DOUB") != std::string::npos ||
        t.find("NUMERIC") != std::string::npos || t.find("DECIMAL") != std::string::npos) {
        return LogicalType::Number;
    }
    OINO_LOG_INFO("sqlite", "unrecognized native type '%s' treated as string", native_type.c_str());
    return LogicalType::String;
}

inline std::string sqlite_print_literal(const Cell& value, const std::string& /*native_type*/) {
    struct Printer {
        std::string operator()(const Unset&) const { return "NULL"; }
        std::string operator()(const Null&) const { return "NULL"; }
        std::string operator()(const std::string& s) const { return sql_string_literal(s); }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return format_double(v); }
        std::string operator()(bool v) const { return v ? "1" : "0"; }
        std::string operator()(const Timestamp& ts) const {
            return sql_string_literal(format_iso8601(ts));
        }
        std::string operator()(const Bytes& b) const { return "X'" + hex_encode(b, true) + "'"; }
    };
    return std::visit(Printer{}, value);
}

inline Cell sqlite_parse_literal(const Cell& raw, const std::string& native_type) {
    if (!has_value(raw)) return Null{};

    switch (sqlite_logical_type(native_type)) {
        case LogicalType::Number:
            if (const auto* s = std::get_if<std::string>(&raw)) {
                int64_t i;
                double d;
                if (parse_int64(*s, i)) return i;
                if (parse_double(*s, d)) return d;
            }
            return raw;

        case LogicalType::Boolean:
            if (const auto* i = std::get_if<int64_t>(&raw)) return *i != 0;
            if (const auto* d = std::get_if<double>(&raw)) return *d != 0.0;
            if (const auto* s = std::get_if<std::string>(&raw)) {
                return !(s->empty() || iequals(*s, "false") ||
                         s->find_first_not_of('0') == std::string::npos);
            }
            return raw;

        case LogicalType::Datetime:
            if (const auto* s = std::get_if<std::string>(&raw)) {
                if (auto ts = parse_datetime(*s)) return *ts;
                OINO_LOG_DEBUG("sqlite", "unparsable datetime '%s' kept as text", s->c_str());
            }
            return raw;

        case LogicalType::Blob:
            if (const auto* s = std::get_if<std::string>(&raw)) {
                return Bytes(s->begin(), s->end());
            }
            return raw;

        case LogicalType::String:
            return raw;
    }
    return raw;
}

// ============================================================================
// Dialect Factory
// ============================================================================

/**
 * Build a dialect over an open connection. The connection is shared by
 * every cursor the dialect hands out.
 */
inline std::shared_ptr<const SqlDialect> make_sqlite_dialect(std::shared_ptr<Database> db,
                                                             const std::string& database_name) {
    auto dialect = std::make_shared<SqlDialect>();
    dialect->name = "sqlite";
    dialect->database = database_name;
    dialect->quote_identifier = sqlite_quote_identifier;
    dialect->quote_table = sqlite_quote_table;
    dialect->print_literal = sqlite_print_literal;
    dialect->parse_literal = sqlite_parse_literal;
    dialect->logical_type = sqlite_logical_type;

    dialect->describe_table = [db](const std::string& table) -> std::string {
        ConnectionLock lock(*db);
        Statement stmt;
        if (!db->prepare("SELECT sql FROM sqlite_master WHERE type = 'table' AND name = ?", stmt) ||
            !stmt.bind_text(1, table)) {
            throw DataSourceError(db->last_error());
        }
        int rc = stmt.step();
        if (rc == SQLITE_ROW) return stmt.column_text(0);
        if (rc != SQLITE_DONE) throw DataSourceError(stmt.error());
        return "";
    };

    dialect->execute = [db](const std::string& sql) -> Cursor {
        OINO_LOG_DEBUG("sqlite", "%s", sql.c_str());
        ConnectionLock lock(*db);
        Statement prepared;
        if (!db->prepare(sql, prepared)) {
            throw DataSourceError(db->last_error());
        }
        auto stmt = std::make_shared<Statement>(std::move(prepared));
        auto pending = std::make_shared<int>(stmt->step());
        if (*pending != SQLITE_ROW && *pending != SQLITE_DONE) {
            throw DataSourceError(stmt->error());
        }

        Cursor cursor;
        int col_count = stmt->column_count();
        for (int i = 0; i < col_count; ++i) {
            cursor.columns.push_back(stmt->column_name(i));
        }
        if (col_count == 0) {
            cursor.changes = db->changes();
            cursor.last_insert_id = db->last_insert_rowid();
        }
        cursor.fetch = [db, stmt, pending](std::vector<Cell>& row) {
            if (*pending != SQLITE_ROW) return false;
            ConnectionLock lock(*db);
            int n = stmt->column_count();
            row.clear();
            row.reserve(n);
            for (int i = 0; i < n; ++i) {
                row.push_back(stmt->column_cell(i));
            }
            *pending = stmt->step();
            if (*pending != SQLITE_ROW && *pending != SQLITE_DONE) {
                throw DataSourceError(stmt->error());
            }
            return true;
        };
        return cursor;
    };

    return dialect;
}

/// Open the database named by params.url (a path, file:// url or :memory:).
inline std::shared_ptr<const SqlDialect> open_sqlite_dialect(const DbParams& params) {
    std::string path = params.url;
    if (starts_with(path, "file://")) path = path.substr(7);
    if (path.empty()) path = ":memory:";

    auto db = std::make_shared<Database>();
    if (!db->open(path)) {
        throw DataSourceError("Cannot open " + path + ": " + db->last_error());
    }
    OINO_LOG_INFO("sqlite", "opened %s", path.c_str());
    return make_sqlite_dialect(db, params.database.empty() ? path : params.database);
}

inline DialectRegistry DialectRegistry::with_builtins() {
    DialectRegistry registry;
    registry.add("sqlite", open_sqlite_dialect);
    return registry;
}

} // namespace oino
