/**
 * oino/row_codec.hpp - Rows to and from JSON, CSV, form-data and url-encoded text
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Output rows always start with the synthetic id field (Config::id_field)
 * holding the composite primary key. With an IdCodec, numeric primary
 * keys are written as tokens and read back through the same codec.
 *
 *   oino::RowCodec codec(model, config);
 *   std::string body = codec.encode(rows, oino::ContentType::Json);
 *   std::vector<oino::Row> input = codec.decode(request_body, oino::ContentType::Csv);
 */

#pragma once

#include "config.hpp"
#include "data_model.hpp"
#include "errors.hpp"
#include "field_codec.hpp"
#include "id_codec.hpp"
#include "json.hpp"
#include "log.hpp"
#include "row_set.hpp"
#include "str.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace oino {

// ============================================================================
// Content Types
// ============================================================================

enum class ContentType {
    Json,
    Csv,
    FormData,
    UrlEncode
};

inline const char* content_type_mime(ContentType t) {
    switch (t) {
        case ContentType::Json:      return "application/json";
        case ContentType::Csv:       return "text/csv";
        case ContentType::FormData:  return "multipart/form-data";
        case ContentType::UrlEncode: return "application/x-www-form-urlencoded";
    }
    return "application/json";
}

/// Media type of a Content-Type/Accept entry, parameters ignored.
inline std::optional<ContentType> parse_content_type(const std::string& value) {
    const std::string mime = to_lower(trim(value.substr(0, value.find(';'))));
    if (mime == "application/json") return ContentType::Json;
    if (mime == "text/csv") return ContentType::Csv;
    if (mime == "multipart/form-data") return ContentType::FormData;
    if (mime == "application/x-www-form-urlencoded") return ContentType::UrlEncode;
    return std::nullopt;
}

/// Value of a "; name=value" header parameter, quotes removed.
inline std::string header_parameter(const std::string& header, const std::string& name) {
    for (const auto& part : split(header, ';')) {
        std::string p = trim(part);
        size_t eq = p.find('=');
        if (eq == std::string::npos || !iequals(trim(p.substr(0, eq)), name)) continue;
        std::string value = trim(p.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return "";
}

// ============================================================================
// RowCodec
// ============================================================================

class RowCodec {
public:
    using RowSource = std::function<bool(Row&)>;

    RowCodec(std::shared_ptr<const DataModel> model, Config config = {},
             std::shared_ptr<const IdCodec> ids = nullptr)
        : model_(std::move(model)), config_(std::move(config)), ids_(std::move(ids)) {}

    const DataModel& model() const { return *model_; }
    const Config& config() const { return config_; }

    // ========================================================================
    // Values
    // ========================================================================

    /// Numeric primary keys are written as id tokens when a codec is set
    bool is_hashed(const Field& field) const {
        return ids_ && field.is_primary_key && field.type == LogicalType::Number;
    }

    /// Primary key values as plain text, in model order
    std::vector<std::string> primary_key_values(const Row& row) const {
        std::vector<std::string> values;
        for (size_t i : model_->primary_key_indexes()) {
            values.push_back(cell_to_text(row[i]));
        }
        return values;
    }

    /// Wire text of one field of a row
    WireValue print_value(const Row& row, size_t index) const {
        const Field& field = (*model_)[index];
        WireValue text = field_codec(field.type).serialize(row[index]);
        if (text && is_hashed(field)) {
            text = ids_->encode(*text, field.name + " " + join(primary_key_values(row), " "));
        }
        return text;
    }

    /// Cell for one field from wire text
    Cell parse_value(const WireValue& text, size_t index) const {
        const Field& field = (*model_)[index];
        if (text && is_hashed(field)) {
            return field_codec(field.type).deserialize(ids_->decode(*text));
        }
        return field_codec(field.type).deserialize(text);
    }

    /// Synthetic id of a row: its primary key values joined by the separator
    std::string row_id(const Row& row) const {
        std::vector<std::string> parts;
        for (size_t i : model_->primary_key_indexes()) {
            WireValue v = print_value(row, i);
            parts.push_back(v ? *v : "");
        }
        return config_.print_id(parts);
    }

    // ========================================================================
    // Encoding
    // ========================================================================

    /// Encode everything left in the row set. Output is built fully before returning.
    std::string encode(RowSet& rows, ContentType type) const {
        return encode_rows([&rows](Row& row) { return rows.fetch(row); },
                           rows.selected_fields(), type);
    }

    std::string encode(const std::vector<Row>& rows, ContentType type) const {
        std::vector<size_t> all(model_->size());
        for (size_t i = 0; i < all.size(); ++i) all[i] = i;
        size_t next = 0;
        return encode_rows([&rows, &next](Row& row) {
                               if (next >= rows.size()) return false;
                               row = rows[next++];
                               return true;
                           },
                           all, type);
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    /**
     * Decode a request body into rows aligned to the model. Fields absent
     * from the input stay Unset.
     *
     * @param boundary multipart boundary (form-data only)
     * @throws SerializationError for malformed input
     */
    std::vector<Row> decode(const std::string& body, ContentType type,
                            const std::string& boundary = "") const {
        switch (type) {
            case ContentType::Json:      return decode_json(body);
            case ContentType::Csv:       return decode_csv(body);
            case ContentType::FormData:  return decode_formdata(body, boundary);
            case ContentType::UrlEncode: return decode_urlencoded(body);
        }
        return {};
    }

private:
    std::shared_ptr<const DataModel> model_;
    Config config_;
    std::shared_ptr<const IdCodec> ids_;

    Row empty_row() const {
        return Row(model_->size(), Cell(Unset{}));
    }

    std::string encode_rows(const RowSource& next, const std::vector<size_t>& fields,
                            ContentType type) const {
        std::string out;
        Row row;
        size_t count = 0;

        switch (type) {
            case ContentType::Json:
                out = "[\r\n";
                while (next(row)) {
                    if (count++ > 0) out += ",\r\n";
                    out += json_row(row, fields);
                }
                out += "\r\n]";
                break;

            case ContentType::Csv:
                out = csv_header(fields);
                while (next(row)) {
                    out += "\r\n" + csv_row(row, fields);
                }
                break;

            case ContentType::FormData:
                while (next(row)) {
                    out += formdata_row(row, fields);
                }
                out += "--" + config_.multipart_boundary + "--\r\n";
                break;

            case ContentType::UrlEncode:
                while (next(row)) {
                    if (count++ > 0) out += "\r\n";
                    out += urlencoded_row(row, fields);
                }
                if (count > 1) {
                    OINO_LOG_INFO("codec", "url-encoded output holds %zu rows, one per line", count);
                }
                break;
        }
        return out;
    }

    // ========================================================================
    // JSON
    // ========================================================================

    static std::string json_string(const std::string& s) {
        return json(s).dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string json_value(const Row& row, size_t index) const {
        WireValue text = print_value(row, index);
        if (!text) return "null";
        const Field& field = (*model_)[index];
        if (!is_hashed(field)) {
            double d;
            if (field.type == LogicalType::Boolean ||
                (field.type == LogicalType::Number && parse_double(*text, d))) {
                return *text;
            }
        }
        return json_string(*text);
    }

    std::string json_row(const Row& row, const std::vector<size_t>& fields) const {
        std::string out = "{" + json_string(config_.id_field) + ":" + json_string(row_id(row));
        for (size_t i : fields) {
            if (is_unset(row[i])) continue;
            out += "," + json_string((*model_)[i].name) + ":" + json_value(row, i);
        }
        return out + "}";
    }

    static WireValue json_to_wire(const json& value) {
        if (value.is_null()) return std::nullopt;
        if (value.is_string()) return value.get<std::string>();
        if (value.is_boolean()) return std::string(value.get<bool>() ? "true" : "false");
        return value.dump();
    }

    std::vector<Row> decode_json(const std::string& body) const {
        json doc;
        try {
            doc = json::parse(body);
        } catch (const json::parse_error& e) {
            throw SerializationError(std::string("Invalid JSON (") + e.what() + ")", body.substr(0, 64));
        }

        std::vector<const json*> objects;
        if (doc.is_object()) {
            objects.push_back(&doc);
        } else if (doc.is_array()) {
            for (const auto& item : doc) {
                if (!item.is_object()) {
                    throw SerializationError("JSON row is not an object", item.dump().substr(0, 64));
                }
                objects.push_back(&item);
            }
        } else {
            throw SerializationError("JSON body must be an object or an array", body.substr(0, 64));
        }

        std::vector<Row> rows;
        for (const json* object : objects) {
            Row row = empty_row();
            for (auto it = object->begin(); it != object->end(); ++it) {
                int index = model_->find_field_index(it.key());
                if (index < 0) {
                    if (it.key() != config_.id_field) {
                        OINO_LOG_DEBUG("codec", "ignoring unknown JSON field '%s'", it.key().c_str());
                    }
                    continue;
                }
                row[static_cast<size_t>(index)] = parse_value(json_to_wire(it.value()),
                                                              static_cast<size_t>(index));
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    // ========================================================================
    // CSV
    // ========================================================================

    static std::string csv_escape(const WireValue& text) {
        if (!text) return "null";
        return "\"" + replace_all(*text, "\"", "\"\"") + "\"";
    }

    std::string csv_header(const std::vector<size_t>& fields) const {
        std::string out = csv_escape(config_.id_field);
        for (size_t i : fields) {
            out += "," + csv_escape((*model_)[i].name);
        }
        return out;
    }

    std::string csv_row(const Row& row, const std::vector<size_t>& fields) const {
        std::string out = csv_escape(row_id(row));
        for (size_t i : fields) {
            out += ",";
            if (!is_unset(row[i])) out += csv_escape(print_value(row, i));
        }
        return out;
    }

    struct CsvCell {
        bool quoted = false;
        std::string text;
    };

    // Records split on \r\n, \n or \r outside quotes. Blank lines are skipped.
    static std::vector<std::vector<CsvCell>> parse_csv(const std::string& body) {
        std::vector<std::vector<CsvCell>> records;
        std::vector<CsvCell> record;
        CsvCell cell;
        bool pending = false;
        size_t record_start = 0;
        size_t i = 0;
        const size_t n = body.size();

        auto end_record = [&]() {
            if (pending) {
                record.push_back(std::move(cell));
                records.push_back(std::move(record));
            }
            record.clear();
            cell = CsvCell();
            pending = false;
        };

        while (i < n) {
            char c = body[i];
            if (c == '"' && !cell.quoted && cell.text.empty()) {
                cell.quoted = true;
                pending = true;
                bool closed = false;
                for (++i; i < n; ++i) {
                    if (body[i] != '"') {
                        cell.text += body[i];
                    } else if (i + 1 < n && body[i + 1] == '"') {
                        cell.text += '"';
                        ++i;
                    } else {
                        closed = true;
                        ++i;
                        break;
                    }
                }
                if (!closed) {
                    throw SerializationError("Unterminated quoted CSV value", body.substr(record_start, 64));
                }
                if (i < n && body[i] != ',' && body[i] != '\r' && body[i] != '\n') {
                    throw SerializationError("Unexpected character after quoted CSV value",
                                             body.substr(record_start, 64));
                }
            } else if (c == ',') {
                record.push_back(std::move(cell));
                cell = CsvCell();
                pending = true;
                ++i;
            } else if (c == '\r' || c == '\n') {
                end_record();
                if (c == '\r' && i + 1 < n && body[i + 1] == '\n') ++i;
                ++i;
                record_start = i;
            } else {
                cell.text += c;
                pending = true;
                ++i;
            }
        }
        end_record();
        return records;
    }

    std::vector<Row> decode_csv(const std::string& body) const {
        auto records = parse_csv(body);
        if (records.empty()) return {};

        std::vector<int> columns;
        bool any_known = false;
        for (const auto& name : records[0]) {
            int index = model_->find_field_index(name.text);
            if (index < 0 && name.text != config_.id_field) {
                OINO_LOG_DEBUG("codec", "ignoring unknown CSV column '%s'", name.text.c_str());
            }
            any_known = any_known || index >= 0;
            columns.push_back(index);
        }
        if (!any_known) {
            throw SerializationError("CSV header has no known fields", body.substr(0, body.find('\n')));
        }

        std::vector<Row> rows;
        for (size_t r = 1; r < records.size(); ++r) {
            const auto& record = records[r];
            if (record.size() != columns.size()) {
                std::string fragment;
                for (const auto& c : record) fragment += (fragment.empty() ? "" : ",") + c.text;
                throw SerializationError("CSV row " + std::to_string(r) + " has " +
                                         std::to_string(record.size()) + " values, expected " +
                                         std::to_string(columns.size()), fragment.substr(0, 64));
            }
            Row row = empty_row();
            for (size_t c = 0; c < record.size(); ++c) {
                if (columns[c] < 0) continue;
                const CsvCell& cell = record[c];
                if (!cell.quoted && cell.text.empty()) continue;    // unset
                WireValue text;
                if (cell.quoted || cell.text != "null") text = cell.text;
                row[static_cast<size_t>(columns[c])] = parse_value(text, static_cast<size_t>(columns[c]));
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    // ========================================================================
    // multipart/form-data
    // ========================================================================

    std::string formdata_part(const std::string& name, const std::string& value, bool file) const {
        std::string out = "--" + config_.multipart_boundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + name + "\"";
        if (file) {
            out += "; filename=\"" + name + "\"\r\n";
            out += "Content-Type: application/octet-stream\r\n";
            out += "Content-Transfer-Encoding: BASE64\r\n";
        } else {
            out += "\r\n";
        }
        return out + "\r\n" + value + "\r\n";
    }

    std::string formdata_row(const Row& row, const std::vector<size_t>& fields) const {
        std::string out = formdata_part(config_.id_field, row_id(row), false);
        for (size_t i : fields) {
            if (is_unset(row[i])) continue;
            const Field& field = (*model_)[i];
            WireValue text = print_value(row, i);
            out += formdata_part(field.name, text ? *text : "",
                                 text && field.type == LogicalType::Blob);
        }
        return out;
    }

    std::vector<Row> decode_formdata(const std::string& body, const std::string& boundary) const {
        static const std::regex disposition_re(
            R"re(Content-Disposition:\s*(form-data|file);\s*name="([^"]+)"(;\s*filename=.*)?)re",
            std::regex::ECMAScript | std::regex::icase);

        if (boundary.empty()) {
            throw SerializationError("Missing multipart boundary", "");
        }
        const std::string delimiter = "--" + boundary;
        size_t pos = body.find(delimiter);
        if (pos == std::string::npos) {
            throw SerializationError("Multipart boundary not found", boundary);
        }

        std::vector<Row> rows;
        Row row = empty_row();
        std::set<std::string> seen;

        while (true) {
            pos += delimiter.size();
            if (body.compare(pos, 2, "--") == 0) break;
            if (body.compare(pos, 2, "\r\n") == 0) {
                pos += 2;
            } else if (body.compare(pos, 1, "\n") == 0) {
                pos += 1;
            }

            size_t next = body.find("\r\n" + delimiter, pos);
            size_t gap = 2;
            if (next == std::string::npos) {
                next = body.find("\n" + delimiter, pos);
                gap = 1;
            }
            if (next == std::string::npos) {
                throw SerializationError("Unterminated multipart body", body.substr(pos, 64));
            }
            const std::string part = body.substr(pos, next - pos);
            pos = next + gap;

            size_t header_end = part.find("\r\n\r\n");
            size_t value_start = header_end + 4;
            if (header_end == std::string::npos) {
                header_end = part.find("\n\n");
                value_start = header_end + 2;
            }
            if (header_end == std::string::npos) {
                throw SerializationError("Multipart part without headers", part.substr(0, 64));
            }
            const std::string headers = part.substr(0, header_end);
            std::string value = part.substr(value_start);

            std::string content_type;
            bool base64 = false;
            for (auto line : split(replace_all(headers, "\r\n", "\n"), '\n')) {
                size_t colon = line.find(':');
                if (colon == std::string::npos) continue;
                std::string name = trim(line.substr(0, colon));
                std::string header_value = trim(line.substr(colon + 1));
                if (iequals(name, "Content-Type")) content_type = to_lower(header_value);
                if (iequals(name, "Content-Transfer-Encoding")) base64 = iequals(header_value, "base64");
            }
            if (starts_with(content_type, "multipart/mixed")) {
                throw SerializationError("multipart/mixed parts are not supported", headers.substr(0, 64));
            }

            std::smatch m;
            if (!std::regex_search(headers, m, disposition_re)) {
                throw SerializationError("Multipart part without Content-Disposition", headers.substr(0, 64));
            }
            const std::string name = m[2].str();
            const bool is_file = m[3].matched;

            if (seen.count(name)) {
                rows.push_back(std::move(row));
                row = empty_row();
                seen.clear();
            }
            seen.insert(name);

            int index = model_->find_field_index(name);
            if (index < 0) {
                if (name != config_.id_field) {
                    OINO_LOG_WARN("codec", "ignoring unknown multipart field '%s'", name.c_str());
                }
                continue;
            }
            const Field& field = (*model_)[static_cast<size_t>(index)];
            Cell cell;
            if (value.empty()) {
                cell = parse_value(std::nullopt, static_cast<size_t>(index));
            } else if (field.type == LogicalType::Blob && is_file && !base64) {
                cell = Bytes(value.begin(), value.end());
            } else if (field.type != LogicalType::Blob && base64) {
                Bytes raw = base64_decode(value);
                cell = parse_value(std::string(raw.begin(), raw.end()), static_cast<size_t>(index));
            } else {
                cell = parse_value(value, static_cast<size_t>(index));
            }
            row[static_cast<size_t>(index)] = std::move(cell);
        }
        if (!seen.empty()) rows.push_back(std::move(row));
        return rows;
    }

    // ========================================================================
    // application/x-www-form-urlencoded
    // ========================================================================

    std::string urlencoded_row(const Row& row, const std::vector<size_t>& fields) const {
        std::string out = url_encode(config_.id_field) + "=" + url_encode(row_id(row));
        for (size_t i : fields) {
            if (is_unset(row[i])) continue;
            out += "&" + url_encode((*model_)[i].name);
            WireValue text = print_value(row, i);
            if (text) out += "=" + url_encode(*text);
        }
        return out;
    }

    std::vector<Row> decode_urlencoded(const std::string& body) const {
        std::vector<Row> rows;
        for (auto line : split(replace_all(body, "\r\n", "\n"), '\n')) {
            if (trim(line).empty()) continue;
            Row row = empty_row();
            for (const auto& pair : split(line, '&')) {
                if (pair.empty()) continue;
                size_t eq = pair.find('=');
                const std::string name = url_decode(pair.substr(0, eq), true);
                int index = model_->find_field_index(name);
                if (index < 0) {
                    if (name != config_.id_field) {
                        OINO_LOG_DEBUG("codec", "ignoring unknown url-encoded field '%s'", name.c_str());
                    }
                    continue;
                }
                WireValue text;
                if (eq != std::string::npos) text = url_decode(pair.substr(eq + 1), true);
                row[static_cast<size_t>(index)] = parse_value(text, static_cast<size_t>(index));
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }
};

} // namespace oino
