/**
 * oino/types.hpp - Core value types: logical types, cells and rows
 *
 * Part of oinosql - REST resources over SQL tables.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace oino {

// ============================================================================
// Logical Types
// ============================================================================

enum class LogicalType {
    String,
    Number,
    Boolean,
    Datetime,
    Blob
};

inline const char* logical_type_name(LogicalType t) {
    switch (t) {
        case LogicalType::String:   return "string";
        case LogicalType::Number:   return "number";
        case LogicalType::Boolean:  return "boolean";
        case LogicalType::Datetime: return "datetime";
        case LogicalType::Blob:     return "blob";
    }
    return "string";
}

// ============================================================================
// Cells
// ============================================================================

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using Bytes = std::vector<uint8_t>;

/// Value not present in the input at all (different from an explicit null).
struct Unset {};
struct Null {};

inline bool operator==(Unset, Unset) { return true; }
inline bool operator!=(Unset, Unset) { return false; }
inline bool operator==(Null, Null) { return true; }
inline bool operator!=(Null, Null) { return false; }

using Cell = std::variant<Unset, Null, std::string, int64_t, double, bool, Timestamp, Bytes>;

inline bool is_unset(const Cell& c) { return std::holds_alternative<Unset>(c); }
inline bool is_null(const Cell& c) { return std::holds_alternative<Null>(c); }
inline bool has_value(const Cell& c) { return !is_unset(c) && !is_null(c); }

/// Fixed-length, aligned to DataModel field order.
using Row = std::vector<Cell>;

} // namespace oino
