/**
 * oino/query_engine.hpp - REST requests against one table
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * A QueryEngine owns the DataModel of one table and serves GET, POST,
 * PUT and DELETE against it. Each request runs
 *
 *   Validate -> BuildSql -> Execute -> Materialize -> Encode
 *
 * and any failure stops the remaining stages. Errors never escape
 * handle(); they come back as an ApiResult with an HTTP status.
 *
 * Example:
 *
 *   auto dialect = oino::DialectRegistry::with_builtins().create({"sqlite", "shop.db", "shop"});
 *
 *   oino::ApiParams params;
 *   params.table_name = "orders";
 *   params.hashid_key = "000102030405060708090a0b0c0d0e0f";
 *   auto engine = oino::QueryEngine::create(dialect, params);
 *
 *   oino::Request req;
 *   req.method = "GET";
 *   req.params["oinosqlfilter"] = "(total)-gt(100)";
 *   oino::ApiResult res = engine.handle(req);
 */

#pragma once

#include "config.hpp"
#include "data_model.hpp"
#include "dialect.hpp"
#include "errors.hpp"
#include "field_codec.hpp"
#include "filter.hpp"
#include "id_codec.hpp"
#include "json.hpp"
#include "log.hpp"
#include "row_codec.hpp"
#include "row_set.hpp"
#include "schema.hpp"
#include "str.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oino {

// ============================================================================
// Parameters
// ============================================================================

struct ApiParams {
    std::string api_name;
    std::string table_name;

    bool fail_on_oversized_values = false;
    bool fail_on_update_on_autoinc = false;
    bool fail_on_insert_without_key = false;
    bool fail_on_any_invalid_rows = false;
    bool use_dates_as_string = false;

    std::vector<std::string> include_fields;
    std::vector<std::string> exclude_fields;
    std::string exclude_field_prefix;

    // Numeric primary keys are obfuscated when a key is set
    std::string hashid_key;
    int hashid_length = IdCodec::kMinLength;
    bool hashid_static_ids = false;
};

// ============================================================================
// Result
// ============================================================================

constexpr const char* kErrorPrefix = "OINO ERROR";
constexpr const char* kWarningPrefix = "OINO WARNING";
constexpr const char* kInfoPrefix = "OINO INFO";
constexpr const char* kDebugPrefix = "OINO DEBUG";

struct ApiResult {
    bool success = true;
    int status_code = 200;
    std::string status_message = "OK";
    std::vector<std::string> messages;

    std::string body;
    std::string content_type = "application/json";
    int64_t affected_rows = 0;

    bool ok() const { return success; }

    void set_error(int code, const std::string& message, const std::string& operation) {
        success = false;
        status_code = code;
        status_message = std::string(kErrorPrefix) + " (" + operation + "): " + message;
        messages.push_back(status_message);
        OINO_LOG_ERROR("api", "%d %s", code, status_message.c_str());
    }

    void add_warning(const std::string& message, const std::string& operation) {
        add_message(kWarningPrefix, message, operation);
    }

    void add_info(const std::string& message, const std::string& operation) {
        add_message(kInfoPrefix, message, operation);
    }

    void add_debug(const std::string& message, const std::string& operation) {
        add_message(kDebugPrefix, message, operation);
    }

    /**
     * Messages as X-OINO-MESSAGE-n headers, numbered from 1, filtered by
     * severity. Line breaks are flattened to spaces.
     */
    std::vector<std::pair<std::string, std::string>> message_headers(bool errors = true,
                                                                     bool warnings = false,
                                                                     bool infos = false,
                                                                     bool debug = false) const {
        std::vector<std::pair<std::string, std::string>> headers;
        for (const auto& m : messages) {
            if ((errors && starts_with(m, kErrorPrefix)) ||
                (warnings && starts_with(m, kWarningPrefix)) ||
                (infos && starts_with(m, kInfoPrefix)) ||
                (debug && starts_with(m, kDebugPrefix))) {
                std::string value = replace_all(replace_all(m, "\r", " "), "\n", " ");
                headers.emplace_back("X-OINO-MESSAGE-" + std::to_string(headers.size() + 1), value);
            }
        }
        return headers;
    }

    std::string to_json() const {
        ordered_json j;
        j["success"] = success;
        j["statusCode"] = status_code;
        j["statusMessage"] = status_message;
        j["messages"] = messages;
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

private:
    void add_message(const char* prefix, const std::string& message, const std::string& operation) {
        std::string m = trim(message);
        if (!m.empty()) {
            messages.push_back(std::string(prefix) + " (" + operation + "): " + m);
        }
    }
};

// ============================================================================
// Request
// ============================================================================

struct Request {
    std::string method = "GET";
    std::string id;
    std::string body;
    std::map<std::string, std::string> params;     // URL query parameters
    std::map<std::string, std::string> headers;

    /// Header value by case-insensitive name, or ""
    std::string header(const std::string& name) const {
        for (const auto& kv : headers) {
            if (iequals(kv.first, name)) return kv.second;
        }
        return "";
    }

    std::string param(const std::string& name) const {
        auto it = params.find(name);
        return it == params.end() ? "" : it->second;
    }
};

/**
 * Fill a Request from an URL target "/resource[/id][?query]" and return
 * the resource name. Query parameters are decoded; the id is kept as
 * sent because composite ids carry their own escaping.
 */
inline std::string parse_target(const std::string& target, Request& request) {
    const size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    if (q != std::string::npos) {
        for (const auto& pair : split(target.substr(q + 1), '&')) {
            if (pair.empty()) continue;
            const size_t eq = pair.find('=');
            const std::string key = url_decode(pair.substr(0, eq), true);
            request.params[key] = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1), true);
        }
    }

    std::vector<std::string> segments;
    for (const auto& segment : split(path, '/')) {
        if (!segment.empty()) segments.push_back(segment);
    }
    if (segments.size() > 1) request.id = segments[1];
    return segments.empty() ? "" : segments[0];
}

/// Validated, request-scoped query parameters
struct RequestParams {
    FilterExpr filter;
    OrderSpec order;
    LimitSpec limit;
    SelectSpec select;
    AggregateSpec aggregate;

    ContentType request_type = ContentType::Json;
    ContentType response_type = ContentType::Json;
    std::string boundary;
};

// ============================================================================
// QueryEngine
// ============================================================================

class QueryEngine {
public:
    /**
     * Introspect params.table_name through the dialect and build the engine.
     *
     * @throws SchemaParseError, CryptoConfigError, DataSourceError
     */
    static QueryEngine create(std::shared_ptr<const SqlDialect> dialect, ApiParams params,
                              Config config = {}) {
        if (params.table_name.empty()) {
            throw SchemaParseError("ApiParams needs to define a table name");
        }
        IntrospectOptions options;
        options.exclude_field_prefix = params.exclude_field_prefix;
        options.include_fields = params.include_fields;
        options.exclude_fields = params.exclude_fields;
        options.use_dates_as_string = params.use_dates_as_string;

        auto model = std::make_shared<const DataModel>(
            SchemaIntrospector::introspect(params.table_name, dialect, options));

        std::shared_ptr<const IdCodec> ids;
        if (!params.hashid_key.empty()) {
            ids = std::make_shared<const IdCodec>(params.hashid_key, dialect->database,
                                                  params.hashid_length, params.hashid_static_ids);
        }
        OINO_LOG_INFO("api", "%s: %zu fields", params.table_name.c_str(), model->size());
        return QueryEngine(std::move(model), std::move(params), std::move(config), std::move(ids));
    }

    QueryEngine(std::shared_ptr<const DataModel> model, ApiParams params, Config config,
                std::shared_ptr<const IdCodec> ids = nullptr)
        : model_(std::move(model)),
          params_(std::move(params)),
          config_(std::move(config)),
          codec_(model_, config_, std::move(ids)) {}

    const DataModel& model() const { return *model_; }
    const ApiParams& params() const { return params_; }
    const Config& config() const { return config_; }
    const RowCodec& codec() const { return codec_; }

    // ========================================================================
    // Validate
    // ========================================================================

    /**
     * Parse and check the query parameters and content types of a request.
     *
     * @throws FilterSyntaxError, UnknownFieldError,
     *         UnsupportedMediaTypeError
     */
    RequestParams parse_params(const Request& request) const {
        RequestParams rp;
        rp.filter = FilterExpr::parse(request.param(config_.filter_param));
        rp.order = OrderSpec::parse(request.param(config_.order_param));
        rp.limit = LimitSpec::parse(request.param(config_.limit_param));
        rp.select = SelectSpec::parse(request.param(config_.select_param));
        rp.aggregate = AggregateSpec::parse(request.param(config_.aggregate_param));
        rp.select.validate(*model_);
        rp.aggregate.validate(*model_);
        if (config_.strict_filter_fields) {
            for (const auto& name : rp.filter.fields()) {
                if (!model_->find_field(name)) throw UnknownFieldError(name);
            }
        }

        const std::string content_type = request.header("Content-Type");
        if (!content_type.empty()) {
            auto type = parse_content_type(content_type);
            if (!type) throw UnsupportedMediaTypeError(content_type, false);
            rp.request_type = *type;
            rp.boundary = header_parameter(content_type, "boundary");
        }
        rp.response_type = negotiate_response_type(request);
        return rp;
    }

    // ========================================================================
    // BuildSql
    // ========================================================================

    /// "(pk1=v1 AND pk2=v2)" for a composite id
    std::string print_id_condition(const std::string& id) const {
        const auto& pks = model_->primary_key_indexes();
        if (pks.empty()) {
            throw InvalidIdError("Table has no primary key", model_->table_name());
        }
        std::vector<std::string> parts;
        try {
            parts = config_.parse_id(id);
        } catch (const SerializationError&) {
            throw InvalidIdError("Invalid id", id);
        }
        if (parts.size() != pks.size()) {
            throw InvalidIdError("Id has " + std::to_string(parts.size()) + " parts, expected " +
                                 std::to_string(pks.size()), id);
        }

        const SqlDialect& dialect = model_->dialect();
        std::string sql;
        for (size_t i = 0; i < pks.size(); ++i) {
            const Field& field = (*model_)[pks[i]];
            Cell value;
            try {
                value = codec_.parse_value(parts[i], pks[i]);
            } catch (const CryptoIntegrityError&) {
                throw InvalidIdError("Invalid id", id);
            } catch (const SerializationError&) {
                throw InvalidIdError("Invalid id", id);
            }
            if (!sql.empty()) sql += " AND ";
            sql += dialect.quote_identifier(field.name) + "=" + dialect.print_literal(value, field.native_type);
        }
        return "(" + sql + ")";
    }

    std::string print_select(const RequestParams& rp, const std::string& id = "") const {
        const SqlDialect& dialect = model_->dialect();
        SelectParts parts;
        parts.table = dialect.quote_table(model_->table_name());

        for (const auto& field : *model_) {
            if (!rp.select.is_selected(field)) continue;
            if (!parts.columns.empty()) parts.columns += ",";
            parts.columns += rp.aggregate.print_column(field, dialect);
        }

        std::string filter_sql = rp.filter.to_sql(*model_, config_.strict_filter_fields);
        if (!id.empty()) parts.where = print_id_condition(id);
        if (!filter_sql.empty()) {
            parts.where = parts.where.empty() ? filter_sql : parts.where + " AND " + filter_sql;
        }
        parts.group_by = rp.aggregate.to_sql(*model_, rp.select);
        parts.order_by = rp.order.to_sql(*model_);
        parts.limit = rp.limit.to_sql(*model_);
        return dialect.print_select(parts);
    }

    std::string print_insert(const Row& row) const {
        const SqlDialect& dialect = model_->dialect();
        std::string columns;
        std::string values;
        for (size_t i = 0; i < model_->size(); ++i) {
            if (is_unset(row[i])) continue;
            const Field& field = (*model_)[i];
            if (!columns.empty()) {
                columns += ",";
                values += ",";
            }
            columns += dialect.quote_identifier(field.name);
            values += dialect.print_literal(row[i], field.native_type);
        }
        const std::string table = dialect.quote_table(model_->table_name());
        if (columns.empty()) {
            return "INSERT INTO " + table + " DEFAULT VALUES;";
        }
        return "INSERT INTO " + table + " (" + columns + ") VALUES (" + values + ");";
    }

    /// Primary key fields are not updated, they select the row.
    std::string print_update(const std::string& id, const Row& row) const {
        const SqlDialect& dialect = model_->dialect();
        std::string assignments;
        for (size_t i = 0; i < model_->size(); ++i) {
            const Field& field = (*model_)[i];
            if (is_unset(row[i]) || field.is_primary_key) continue;
            if (!assignments.empty()) assignments += ",";
            assignments += dialect.quote_identifier(field.name) + "=" +
                           dialect.print_literal(row[i], field.native_type);
        }
        if (assignments.empty()) {
            throw InputError("No values to update", id);
        }
        return "UPDATE " + dialect.quote_table(model_->table_name()) + " SET " + assignments +
               " WHERE " + print_id_condition(id) + ";";
    }

    std::string print_delete(const std::string& id) const {
        return "DELETE FROM " + model_->dialect().quote_table(model_->table_name()) +
               " WHERE " + print_id_condition(id) + ";";
    }

    // ========================================================================
    // Execute / Materialize / Encode
    // ========================================================================

    RowSet select(const RequestParams& rp, const std::string& id = "") const {
        const std::string sql = print_select(rp, id);
        return RowSet(model_, model_->dialect().execute(sql));
    }

    std::string encode(RowSet& rows, ContentType type) const {
        return codec_.encode(rows, type);
    }

    // ========================================================================
    // Request Handling
    // ========================================================================

    ApiResult handle(const Request& request) const {
        ApiResult result;
        const std::string method = to_upper(request.method);
        OINO_LOG_DEBUG("api", "%s %s/%s", method.c_str(), model_->table_name().c_str(), request.id.c_str());

        if (method != "GET" && method != "POST" && method != "PUT" && method != "DELETE") {
            result.set_error(405, "Unsupported HTTP method '" + request.method + "'", "DoRequest");
            return result;
        }

        std::string sql;
        try {
            RequestParams rp = parse_params(request);
            result.content_type = content_type_mime(rp.response_type);
            warn_unknown_filter_fields(result, rp);

            if (method == "GET") {
                sql = print_select(rp, request.id);
                RowSet rows(model_, model_->dialect().execute(sql));
                result.body = codec_.encode(rows, rp.response_type);
                result.affected_rows = static_cast<int64_t>(rows.count());
                if (rp.response_type == ContentType::FormData) {
                    result.content_type += "; boundary=" + config_.multipart_boundary;
                }
            } else if (method == "POST") {
                do_post(result, request, rp, sql);
            } else if (method == "PUT") {
                do_put(result, request, rp, sql);
            } else {
                do_delete(result, request, sql);
            }
        } catch (const UnsupportedMediaTypeError& e) {
            result.set_error(e.for_response() ? 406 : 415, e.what(), "Validate");
        } catch (const InputError& e) {
            result.set_error(400, e.what(), "Validate");
        } catch (const CryptoIntegrityError& e) {
            result.set_error(400, std::string("Invalid id: ") + e.what(), "Validate");
        } catch (const DataSourceError& e) {
            result.set_error(500, e.what(), "Execute");
            result.add_debug("OINO SQL [" + sql + "]", "Execute");
        } catch (const std::exception& e) {
            result.set_error(500, std::string("Unhandled exception: ") + e.what(), "DoRequest");
        }
        return result;
    }

private:
    std::shared_ptr<const DataModel> model_;
    ApiParams params_;
    Config config_;
    RowCodec codec_;

    static std::optional<ContentType> parse_response_type(const std::string& value) {
        const std::string v = to_lower(trim(value));
        if (v == "json") return ContentType::Json;
        if (v == "csv") return ContentType::Csv;
        if (v == "formdata") return ContentType::FormData;
        if (v == "urlencode") return ContentType::UrlEncode;
        return parse_content_type(v);
    }

    // Override parameter first, then Accept, then JSON
    ContentType negotiate_response_type(const Request& request) const {
        const std::string override_type = request.param(config_.response_type_param);
        if (!override_type.empty()) {
            auto type = parse_response_type(override_type);
            if (!type) throw UnsupportedMediaTypeError(override_type, true);
            return *type;
        }
        const std::string accept = trim(request.header("Accept"));
        if (accept.empty()) return ContentType::Json;
        for (const auto& entry : split(accept, ',')) {
            const std::string mime = to_lower(trim(entry.substr(0, entry.find(';'))));
            if (mime == "*/*" || mime == "application/*") return ContentType::Json;
            if (mime == "text/*") return ContentType::Csv;
            if (auto type = parse_content_type(mime)) return *type;
        }
        throw UnsupportedMediaTypeError(accept, true);
    }

    void warn_unknown_filter_fields(ApiResult& result, const RequestParams& rp) const {
        for (const auto& name : rp.filter.fields()) {
            if (!model_->find_field(name)) {
                result.add_warning("Unknown field '" + name + "' in filter", "Validate");
            }
        }
    }

    std::vector<Row> decode_rows(const Request& request, const RequestParams& rp) const {
        return codec_.decode(request.body, rp.request_type, rp.boundary);
    }

    // Returns the errors of a row; warnings go straight into the result.
    std::vector<std::string> validate_row(ApiResult& result, const Row& row, bool require_key) const {
        std::vector<std::string> errors;
        for (size_t i = 0; i < model_->size(); ++i) {
            const Field& field = (*model_)[i];
            const Cell& value = row[i];
            if (is_null(value) && (field.is_not_null || field.is_primary_key)) {
                errors.push_back("Field '" + field.name + "' is not allowed to be NULL!");
            } else if (is_unset(value) && require_key && field.is_primary_key && !field.is_auto_increment) {
                errors.push_back("Primary key '" + field.name + "' is not autoinc and missing from the data!");
            } else if (!is_unset(value) && params_.fail_on_update_on_autoinc && field.is_auto_increment) {
                errors.push_back("Autoinc field '" + field.name + "' can't be updated!");
            } else if (field.type == LogicalType::String && field.max_length > 0) {
                const auto* s = std::get_if<std::string>(&value);
                if (s && s->size() > static_cast<size_t>(field.max_length)) {
                    std::string message = "Field '" + field.name + "' length (" + std::to_string(s->size()) +
                                          ") exceeds maximum (" + std::to_string(field.max_length) + ")";
                    if (params_.fail_on_oversized_values) {
                        errors.push_back(message + " and can't be set!");
                    } else {
                        result.add_warning(message + " and might truncate or fail.", "ValidateRowValues");
                    }
                }
            }
        }
        return errors;
    }

    void do_post(ApiResult& result, const Request& request, const RequestParams& rp, std::string& sql) const {
        if (!request.id.empty()) {
            result.set_error(400, "HTTP POST method must not have an URL ID as it does not target an existing row but creates a new one!", "DoPost");
            return;
        }
        std::vector<Row> rows = decode_rows(request, rp);
        if (rows.empty()) {
            result.set_error(400, "HTTP POST method requires at least one row in the body data!", "DoPost");
            return;
        }

        std::vector<std::string> statements;
        for (size_t r = 0; r < rows.size(); ++r) {
            auto errors = validate_row(result, rows[r], params_.fail_on_insert_without_key);
            if (errors.empty()) {
                statements.push_back(print_insert(rows[r]));
                continue;
            }
            if (params_.fail_on_any_invalid_rows) {
                result.set_error(405, errors.front(), "ValidateRowValues");
                return;
            }
            for (const auto& e : errors) {
                result.add_warning("Row " + std::to_string(r + 1) + " skipped: " + e, "ValidateRowValues");
            }
        }
        if (statements.empty()) {
            result.set_error(405, "No valid rows for POST!", "DoPost");
            return;
        }
        for (const auto& statement : statements) {
            sql = statement;
            result.affected_rows += model_->dialect().execute(sql).changes;
        }
    }

    void do_put(ApiResult& result, const Request& request, const RequestParams& rp, std::string& sql) const {
        if (request.id.empty()) {
            result.set_error(400, "HTTP PUT method requires an URL ID for the row that is updated!", "DoPut");
            return;
        }
        std::vector<Row> rows = decode_rows(request, rp);
        if (rows.size() != 1) {
            result.set_error(400, "HTTP PUT method requires exactly one row in the body data!", "DoPut");
            return;
        }
        auto errors = validate_row(result, rows[0], false);
        if (!errors.empty()) {
            result.set_error(405, errors.front(), "ValidateRowValues");
            return;
        }
        sql = print_update(request.id, rows[0]);
        result.affected_rows = model_->dialect().execute(sql).changes;
        if (result.affected_rows == 0) {
            result.add_warning("No row matched id '" + request.id + "'", "DoPut");
        }
    }

    void do_delete(ApiResult& result, const Request& request, std::string& sql) const {
        if (request.id.empty()) {
            result.set_error(400, "HTTP DELETE method requires an id!", "DoDelete");
            return;
        }
        sql = print_delete(request.id);
        result.affected_rows = model_->dialect().execute(sql).changes;
        if (result.affected_rows == 0) {
            result.add_warning("No row matched id '" + request.id + "'", "DoDelete");
        }
    }
};

} // namespace oino
