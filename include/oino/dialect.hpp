/**
 * oino/dialect.hpp - SQL engine capability set and dialect registry
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * A SqlDialect is a struct of callables, one per capability the core
 * needs from a database engine. Backends fill it in once and register a
 * factory under a type name:
 *
 *   oino::DialectRegistry registry = oino::DialectRegistry::with_builtins();
 *   registry.add("mydb", [](const oino::DbParams& p) { return make_mydb_dialect(p); });
 *
 *   auto dialect = registry.create({"sqlite", "shop.db", "shop"});
 *   auto cursor = dialect->execute("SELECT 1");
 */

#pragma once

#include "errors.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace oino {

// ============================================================================
// Cursor
// ============================================================================

/**
 * Pull-based result of one statement. fetch() fills the row with raw
 * driver values and returns false once the result is exhausted. Errors
 * while stepping are thrown as DataSourceError.
 */
struct Cursor {
    std::vector<std::string> columns;
    std::function<bool(std::vector<Cell>&)> fetch;

    int64_t changes = 0;         // rows affected by a write
    int64_t last_insert_id = 0;

    bool next(std::vector<Cell>& row) {
        return fetch ? fetch(row) : false;
    }
};

// ============================================================================
// Statement Parts
// ============================================================================

/// Fragments of a SELECT; empty fragments are left out of the statement.
struct SelectParts {
    std::string table;      // quoted
    std::string columns;    // quoted, comma separated
    std::string where;
    std::string group_by;
    std::string order_by;
    std::string limit;      // count with an optional OFFSET
};

inline std::string print_select_standard(const SelectParts& p) {
    std::string sql = "SELECT " + p.columns + " FROM " + p.table;
    if (!p.where.empty()) sql += " WHERE " + p.where;
    if (!p.group_by.empty()) sql += " GROUP BY " + p.group_by;
    if (!p.order_by.empty()) sql += " ORDER BY " + p.order_by;
    if (!p.limit.empty()) sql += " LIMIT " + p.limit;
    return sql + ";";
}

// ============================================================================
// Dialect
// ============================================================================

struct SqlDialect {
    std::string name;       // registry key, e.g. "sqlite"
    std::string database;   // logical database name

    std::function<std::string(const std::string& name)> quote_identifier;
    std::function<std::string(const std::string& name)> quote_table;

    /// Render a value as an SQL literal for a column of the given native type
    std::function<std::string(const Cell& value, const std::string& native_type)> print_literal;

    /// Convert a raw driver value into the cell matching the native type
    std::function<Cell(const Cell& raw, const std::string& native_type)> parse_literal;

    std::function<LogicalType(const std::string& native_type)> logical_type;

    /// Native table description (DDL text). Empty when the table is unknown.
    std::function<std::string(const std::string& table)> describe_table;

    std::function<Cursor(const std::string& sql)> execute;

    std::function<std::string(const SelectParts& parts)> print_select = print_select_standard;
};

// ============================================================================
// Registry
// ============================================================================

struct DbParams {
    std::string type;       // dialect name
    std::string url;        // engine specific location
    std::string database;   // logical name, also the id codec domain
};

using DialectFactory = std::function<std::shared_ptr<const SqlDialect>(const DbParams&)>;

class DialectRegistry {
public:
    /// Registry with every backend compiled into this build
    static DialectRegistry with_builtins();

    void add(const std::string& type, DialectFactory factory) {
        factories_[type] = std::move(factory);
    }

    bool has(const std::string& type) const {
        return factories_.count(type) > 0;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& kv : factories_) out.push_back(kv.first);
        return out;
    }

    std::shared_ptr<const SqlDialect> create(const DbParams& params) const {
        auto it = factories_.find(params.type);
        if (it == factories_.end()) {
            throw DataSourceError("Unknown database type: " + params.type);
        }
        return it->second(params);
    }

private:
    std::map<std::string, DialectFactory> factories_;
};

} // namespace oino
