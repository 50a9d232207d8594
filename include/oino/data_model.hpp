/**
 * oino/data_model.hpp - Typed, ordered description of a table's columns
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * A DataModel is produced once by SchemaIntrospector and never changes
 * afterwards, so any number of requests may read it concurrently.
 */

#pragma once

#include "dialect.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace oino {

// ============================================================================
// Field
// ============================================================================

struct Field {
    std::string name;
    LogicalType type = LogicalType::String;
    std::string native_type;
    int max_length = 0;     // 0 = no declared limit
    bool is_primary_key = false;
    bool is_auto_increment = false;
    bool is_not_null = false;
    bool is_foreign_key = false;

    /// e.g. [number:id:INTEGER{PK AUTOINC NOTNUL}]
    std::string print_debug() const {
        std::string out = "[";
        out += logical_type_name(type);
        out += ":" + name + ":" + native_type;
        if (max_length > 0) out += "(" + std::to_string(max_length) + ")";
        std::string flags;
        if (is_primary_key) flags += "PK ";
        if (is_foreign_key) flags += "FK ";
        if (is_auto_increment) flags += "AUTOINC ";
        if (is_not_null) flags += "NOTNUL ";
        if (!flags.empty()) {
            flags.pop_back();
            out += "{" + flags + "}";
        }
        return out + "]";
    }
};

// ============================================================================
// DataModel
// ============================================================================

class DataModel {
public:
    DataModel(std::string table_name, std::vector<Field> fields,
              std::shared_ptr<const SqlDialect> dialect)
        : table_name_(std::move(table_name)),
          fields_(std::move(fields)),
          dialect_(std::move(dialect)) {
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (!index_.emplace(fields_[i].name, i).second) {
                throw SchemaParseError("Duplicate field '" + fields_[i].name +
                                       "' in table " + table_name_);
            }
            if (fields_[i].is_primary_key) {
                primary_keys_.push_back(i);
            }
        }
    }

    const std::string& table_name() const { return table_name_; }
    const SqlDialect& dialect() const { return *dialect_; }
    const std::shared_ptr<const SqlDialect>& dialect_ptr() const { return dialect_; }

    const std::vector<Field>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    const Field& operator[](size_t i) const { return fields_[i]; }

    auto begin() const { return fields_.begin(); }
    auto end() const { return fields_.end(); }

    /// Field by name, or nullptr
    const Field* find_field(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &fields_[it->second];
    }

    /// Field index by name, or -1
    int find_field_index(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? -1 : static_cast<int>(it->second);
    }

    const std::vector<size_t>& primary_key_indexes() const { return primary_keys_; }

    std::vector<std::string> primary_key_names() const {
        std::vector<std::string> names;
        for (size_t i : primary_keys_) names.push_back(fields_[i].name);
        return names;
    }

    std::string print_debug(const std::string& separator = "") const {
        std::string out;
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (i > 0) out += separator;
            out += fields_[i].print_debug();
        }
        return out;
    }

private:
    std::string table_name_;
    std::vector<Field> fields_;
    std::shared_ptr<const SqlDialect> dialect_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<size_t> primary_keys_;
};

} // namespace oino
