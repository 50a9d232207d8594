/**
 * oino/schema.hpp - Build a DataModel from a native table description
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * The description is the CREATE TABLE statement reported by the engine.
 * It is tokenized (quoted identifiers, string literals, nested brackets)
 * and the column block is read one top-level definition at a time:
 *
 *   CREATE TABLE "orders" (
 *       id INTEGER PRIMARY KEY AUTOINCREMENT,
 *       "customer name" VARCHAR(80) NOT NULL,
 *       total DECIMAL(10,2),
 *       FOREIGN KEY (customer) REFERENCES customers(id)
 *   )
 *
 * Column and constraint definitions that are not understood are skipped
 * with a warning. Only a description that is not a CREATE TABLE at all
 * fails with SchemaParseError.
 */

#pragma once

#include "data_model.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "str.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace oino {

// ============================================================================
// Tokenizer
// ============================================================================

struct DdlToken {
    enum Kind { Word, QuotedIdent, String, Number, Punct };

    Kind kind;
    std::string text;   // quotes removed for QuotedIdent and String

    bool is_identifier() const { return kind == Word || kind == QuotedIdent; }
    bool is_keyword(const char* kw) const { return kind == Word && iequals(text, kw); }
    bool is_punct(char c) const { return kind == Punct && text.size() == 1 && text[0] == c; }
};

inline std::vector<DdlToken> tokenize_ddl(const std::string& sql) {
    std::vector<DdlToken> tokens;
    size_t i = 0;
    const size_t n = sql.size();

    auto read_quoted = [&](char close, DdlToken::Kind kind) {
        std::string text;
        ++i;
        while (i < n) {
            if (sql[i] == close) {
                // Doubled closing quote is an escaped quote
                if (close != ']' && i + 1 < n && sql[i + 1] == close) {
                    text += close;
                    i += 2;
                    continue;
                }
                ++i;
                tokens.push_back({kind, text});
                return;
            }
            text += sql[i++];
        }
        throw SchemaParseError("Unterminated quote in table description");
    };

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(sql[i]);
        if (std::isspace(c)) {
            ++i;
        } else if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            while (i < n && sql[i] != '\n') ++i;
        } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            size_t end = sql.find("*/", i + 2);
            i = end == std::string::npos ? n : end + 2;
        } else if (c == '"') {
            read_quoted('"', DdlToken::QuotedIdent);
        } else if (c == '`') {
            read_quoted('`', DdlToken::QuotedIdent);
        } else if (c == '[') {
            read_quoted(']', DdlToken::QuotedIdent);
        } else if (c == '\'') {
            read_quoted('\'', DdlToken::String);
        } else if (std::isdigit(c) || ((c == '-' || c == '+') && i + 1 < n &&
                                       std::isdigit(static_cast<unsigned char>(sql[i + 1])))) {
            size_t start = i++;
            while (i < n && (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '.')) ++i;
            tokens.push_back({DdlToken::Number, sql.substr(start, i - start)});
        } else if (std::isalpha(c) || c == '_') {
            size_t start = i;
            while (i < n && (std::isalnum(static_cast<unsigned char>(sql[i])) ||
                             sql[i] == '_' || sql[i] == '$')) {
                ++i;
            }
            tokens.push_back({DdlToken::Word, sql.substr(start, i - start)});
        } else {
            tokens.push_back({DdlToken::Punct, std::string(1, static_cast<char>(c))});
            ++i;
        }
    }
    return tokens;
}

// ============================================================================
// Introspection Options
// ============================================================================

struct IntrospectOptions {
    std::string exclude_field_prefix;
    std::vector<std::string> include_fields;    // empty = all columns
    std::vector<std::string> exclude_fields;
    bool use_dates_as_string = false;

    bool is_excluded(const std::string& name) const {
        if (!exclude_field_prefix.empty() && starts_with(name, exclude_field_prefix)) return true;
        if (std::find(exclude_fields.begin(), exclude_fields.end(), name) != exclude_fields.end()) {
            return true;
        }
        return !include_fields.empty() &&
               std::find(include_fields.begin(), include_fields.end(), name) == include_fields.end();
    }
};

// ============================================================================
// SchemaIntrospector
// ============================================================================

class SchemaIntrospector {
public:
    using Tokens = std::vector<DdlToken>;

    /**
     * Parse a CREATE TABLE statement into a DataModel.
     *
     * @throws SchemaParseError if the text is not a CREATE TABLE statement,
     *         a table level primary key names an excluded or missing
     *         column, or no usable columns remain.
     */
    static DataModel build(const std::string& table_name,
                           const std::string& description,
                           std::shared_ptr<const SqlDialect> dialect,
                           const IntrospectOptions& options = {}) {
        if (trim(description).empty()) {
            throw SchemaParseError("No description for table " + table_name);
        }
        Tokens tokens = tokenize_ddl(description);
        std::vector<Tokens> definitions = column_block(tokens);

        std::vector<Field> fields;
        std::set<std::string> excluded;

        for (const auto& def : definitions) {
            try {
                if (parse_table_constraint(def, fields, excluded)) continue;

                Field field = parse_column(def, *dialect);
                if (options.use_dates_as_string && field.type == LogicalType::Datetime) {
                    field.type = LogicalType::String;
                }
                if (options.is_excluded(field.name)) {
                    if (field.is_primary_key) {
                        throw SchemaParseError("Primary key field '" + field.name +
                                               "' can not be excluded");
                    }
                    OINO_LOG_DEBUG("schema", "field '%s' excluded", field.name.c_str());
                    excluded.insert(field.name);
                    continue;
                }
                fields.push_back(std::move(field));
            } catch (const UnsupportedFieldDefinition& e) {
                OINO_LOG_WARN("schema", "%s: %s", table_name.c_str(), e.what());
            }
        }

        if (fields.empty()) {
            throw SchemaParseError("No usable columns in table " + table_name);
        }
        DataModel model(table_name, std::move(fields), std::move(dialect));
        OINO_LOG_DEBUG("schema", "%s %s", table_name.c_str(), model.print_debug().c_str());
        return model;
    }

    /// Describe the table through the dialect and build its model.
    static DataModel introspect(const std::string& table_name,
                                std::shared_ptr<const SqlDialect> dialect,
                                const IntrospectOptions& options = {}) {
        std::string description = dialect->describe_table(table_name);
        return build(table_name, description, std::move(dialect), options);
    }

private:
    // Locate "CREATE ... TABLE name (" and split the block on top-level commas.
    static std::vector<Tokens> column_block(const Tokens& tokens) {
        size_t i = 0;
        if (tokens.empty() || !tokens[0].is_keyword("CREATE")) {
            throw SchemaParseError("Table description is not a CREATE TABLE statement");
        }
        while (i < tokens.size() && !tokens[i].is_keyword("TABLE")) ++i;
        if (i == tokens.size()) {
            throw SchemaParseError("Table description is not a CREATE TABLE statement");
        }
        while (i < tokens.size() && !tokens[i].is_punct('(')) ++i;
        if (i == tokens.size()) {
            throw SchemaParseError("Missing column block in table description");
        }

        std::vector<Tokens> definitions(1);
        int depth = 0;
        for (++i; i < tokens.size(); ++i) {
            const DdlToken& t = tokens[i];
            if (t.is_punct('(')) {
                ++depth;
            } else if (t.is_punct(')')) {
                if (depth == 0) {
                    if (definitions.back().empty()) definitions.pop_back();
                    return definitions;
                }
                --depth;
            } else if (t.is_punct(',') && depth == 0) {
                definitions.emplace_back();
                continue;
            }
            definitions.back().push_back(t);
        }
        throw SchemaParseError("Unterminated column block in table description");
    }

    // Identifier list "( a, b COLLATE x, c DESC )" starting at tokens[i].
    static std::vector<std::string> identifier_list(const Tokens& def, size_t i) {
        std::vector<std::string> names;
        if (i >= def.size() || !def[i].is_punct('(')) {
            throw UnsupportedFieldDefinition("expected column list");
        }
        bool expect_name = true;
        for (++i; i < def.size() && !def[i].is_punct(')'); ++i) {
            if (def[i].is_punct(',')) {
                expect_name = true;
            } else if (expect_name && def[i].is_identifier()) {
                names.push_back(def[i].text);
                expect_name = false;
            }
        }
        if (names.empty()) {
            throw UnsupportedFieldDefinition("empty column list");
        }
        return names;
    }

    static Field* find(std::vector<Field>& fields, const std::string& name) {
        for (auto& f : fields) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    // Returns true if def is a table constraint (handled or skipped).
    static bool parse_table_constraint(const Tokens& def, std::vector<Field>& fields,
                                       const std::set<std::string>& excluded) {
        if (def.empty()) {
            throw UnsupportedFieldDefinition("empty definition");
        }
        size_t i = 0;
        if (def[0].is_keyword("CONSTRAINT")) {
            i = 2;
            if (i >= def.size()) throw UnsupportedFieldDefinition("incomplete CONSTRAINT");
        }
        const DdlToken& head = def[i];

        if (head.is_keyword("PRIMARY") && i + 1 < def.size() && def[i + 1].is_keyword("KEY")) {
            for (const auto& name : identifier_list(def, i + 2)) {
                if (excluded.count(name)) {
                    throw SchemaParseError("Primary key field '" + name + "' can not be excluded");
                }
                Field* field = find(fields, name);
                if (!field) {
                    throw SchemaParseError("Primary key field '" + name + "' not found");
                }
                field->is_primary_key = true;
                field->is_not_null = true;
            }
            return true;
        }
        if (head.is_keyword("FOREIGN") && i + 1 < def.size() && def[i + 1].is_keyword("KEY")) {
            for (const auto& name : identifier_list(def, i + 2)) {
                if (Field* field = find(fields, name)) field->is_foreign_key = true;
            }
            return true;
        }
        if (head.is_keyword("UNIQUE") || head.is_keyword("CHECK") || i > 0) {
            throw UnsupportedFieldDefinition("table constraint " + head.text + " ignored");
        }
        return false;
    }

    static bool is_constraint_keyword(const DdlToken& t) {
        static const char* const keywords[] = {
            "CONSTRAINT", "PRIMARY", "NOT", "NULL", "UNIQUE", "CHECK", "DEFAULT",
            "COLLATE", "REFERENCES", "GENERATED", "AS", "AUTOINCREMENT", "AUTO_INCREMENT"
        };
        for (const char* kw : keywords) {
            if (t.is_keyword(kw)) return true;
        }
        return false;
    }

    static Field parse_column(const Tokens& def, const SqlDialect& dialect) {
        if (!def[0].is_identifier()) {
            throw UnsupportedFieldDefinition("unsupported definition starting with '" + def[0].text + "'");
        }
        Field field;
        field.name = def[0].text;

        size_t i = 1;
        std::string native;
        while (i < def.size() && def[i].kind == DdlToken::Word && !is_constraint_keyword(def[i])) {
            if (!native.empty()) native += ' ';
            native += to_upper(def[i].text);
            ++i;
        }
        field.native_type = native;

        if (i < def.size() && def[i].is_punct('(')) {
            // (length) or (precision, scale)
            if (i + 2 < def.size() && def[i + 1].kind == DdlToken::Number && def[i + 2].is_punct(')')) {
                field.max_length = std::atoi(def[i + 1].text.c_str());
                i += 3;
            } else if (i + 4 < def.size() && def[i + 1].kind == DdlToken::Number &&
                       def[i + 2].is_punct(',') && def[i + 3].kind == DdlToken::Number &&
                       def[i + 4].is_punct(')')) {
                field.max_length = std::atoi(def[i + 1].text.c_str());
                i += 5;
            } else {
                throw UnsupportedFieldDefinition("column '" + field.name + "' has unsupported type parameters");
            }
        }

        int depth = 0;
        for (; i < def.size(); ++i) {
            const DdlToken& t = def[i];
            if (t.is_punct('(')) { ++depth; continue; }
            if (t.is_punct(')')) { --depth; continue; }
            if (depth > 0) continue;

            if (t.is_keyword("PRIMARY") && i + 1 < def.size() && def[i + 1].is_keyword("KEY")) {
                field.is_primary_key = true;
                field.is_not_null = true;
                ++i;
            } else if (t.is_keyword("NOT") && i + 1 < def.size() && def[i + 1].is_keyword("NULL")) {
                field.is_not_null = true;
                ++i;
            } else if (t.is_keyword("AUTOINCREMENT") || t.is_keyword("AUTO_INCREMENT")) {
                field.is_auto_increment = true;
            } else if (t.is_keyword("REFERENCES")) {
                field.is_foreign_key = true;
            } else if (t.is_keyword("DEFAULT") && i + 1 < def.size() && !def[i + 1].is_punct('(')) {
                ++i;    // bracketed defaults are skipped by depth
            }
        }

        // An INTEGER PRIMARY KEY is the rowid and gets a value when omitted
        if (field.is_primary_key && field.native_type == "INTEGER" && dialect.name == "sqlite") {
            field.is_auto_increment = true;
        }

        field.type = native.empty() ? LogicalType::String : dialect.logical_type(native);
        return field;
    }
};

} // namespace oino
