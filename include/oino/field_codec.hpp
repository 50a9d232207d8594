/**
 * oino/field_codec.hpp - Per logical type text conversions
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Every wire format moves values as text (or null). The conversion
 * between a Cell and that text depends only on the field's logical type
 * and is looked up in a fixed table:
 *
 *   const auto& codec = oino::field_codec(field.type);
 *   oino::WireValue text = codec.serialize(cell);
 *   oino::Cell back = codec.deserialize(text);
 */

#pragma once

#include "datetime.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "str.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace oino {

/// Wire text of one value; nullopt is an explicit null
using WireValue = std::optional<std::string>;

struct FieldCodec {
    WireValue (*serialize)(const Cell& value);
    Cell (*deserialize)(const WireValue& text);
};

// ============================================================================
// Helpers
// ============================================================================

/// Empty, "false" or an all-zero digit string are false, anything else true.
inline bool decode_boolean(const std::string& s) {
    if (s.empty() || iequals(s, "false")) return false;
    return s.find_first_not_of('0') != std::string::npos;
}

/// Canonical text of a non-null cell regardless of field type.
inline std::string cell_to_text(const Cell& c) {
    struct Printer {
        std::string operator()(const Unset&) const { return ""; }
        std::string operator()(const Null&) const { return ""; }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return format_double(v); }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(const Timestamp& ts) const { return format_iso8601(ts); }
        std::string operator()(const Bytes& b) const { return base64_encode(b); }
    };
    return std::visit(Printer{}, c);
}

namespace detail {

// ============================================================================
// Serializers
// ============================================================================

inline WireValue serialize_string(const Cell& c) {
    if (!has_value(c)) return std::nullopt;
    return cell_to_text(c);
}

inline WireValue serialize_number(const Cell& c) {
    if (!has_value(c)) return std::nullopt;
    if (const auto* b = std::get_if<bool>(&c)) return std::string(*b ? "1" : "0");
    return cell_to_text(c);
}

inline WireValue serialize_boolean(const Cell& c) {
    if (!has_value(c)) return std::nullopt;
    bool v;
    if (const auto* b = std::get_if<bool>(&c)) {
        v = *b;
    } else if (const auto* i = std::get_if<int64_t>(&c)) {
        v = *i != 0;
    } else if (const auto* d = std::get_if<double>(&c)) {
        v = *d != 0.0;
    } else {
        v = decode_boolean(cell_to_text(c));
    }
    return std::string(v ? "true" : "false");
}

inline WireValue serialize_datetime(const Cell& c) {
    if (!has_value(c)) return std::nullopt;
    return cell_to_text(c);
}

inline WireValue serialize_blob(const Cell& c) {
    if (!has_value(c)) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&c)) {
        return base64_encode(reinterpret_cast<const uint8_t*>(s->data()), s->size());
    }
    return cell_to_text(c);
}

// ============================================================================
// Deserializers
// ============================================================================

inline Cell deserialize_string(const WireValue& text) {
    if (!text) return Null{};
    return *text;
}

inline Cell deserialize_number(const WireValue& text) {
    if (!text) return Null{};
    const std::string s = trim(*text);
    if (s.empty()) return int64_t{0};
    int64_t i;
    if (parse_int64(s, i)) return i;
    double d;
    if (parse_double(s, d)) return d;
    throw SerializationError("Invalid number", *text);
}

inline Cell deserialize_boolean(const WireValue& text) {
    if (!text) return Null{};
    return decode_boolean(*text);
}

inline Cell deserialize_datetime(const WireValue& text) {
    if (!text || text->empty()) return Null{};
    if (auto ts = parse_datetime(trim(*text))) return *ts;
    throw SerializationError("Invalid date", *text);
}

inline Cell deserialize_blob(const WireValue& text) {
    if (!text) return Bytes{};
    return base64_decode(*text);
}

} // namespace detail

// ============================================================================
// Lookup
// ============================================================================

inline const FieldCodec& field_codec(LogicalType type) {
    static const FieldCodec table[] = {
        {detail::serialize_string,   detail::deserialize_string},     // String
        {detail::serialize_number,   detail::deserialize_number},     // Number
        {detail::serialize_boolean,  detail::deserialize_boolean},    // Boolean
        {detail::serialize_datetime, detail::deserialize_datetime},   // Datetime
        {detail::serialize_blob,     detail::deserialize_blob},       // Blob
    };
    return table[static_cast<size_t>(type)];
}

} // namespace oino
