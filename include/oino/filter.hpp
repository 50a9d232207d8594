/**
 * oino/filter.hpp - Query language: filter, order, limit, select and aggregate
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Filters are small bracketed expressions supplied by the client:
 *
 *   (name)-eq(John)                       ("name" = 'John')
 *   -not((age)-gt(30))                    NOT (("age" > 30))
 *   ((a)-eq(1))-and((b)-like(x%))         (("a" = 1) AND ("b" LIKE 'x%'))
 *
 * Orders take "age DESC,name" or "age-,name+", limits "10", "10 page 2"
 * or "10.2", aggregates "count(id),sum(total)".
 *
 * Parsing only checks syntax. Field names are resolved against the
 * DataModel when rendering, so the same parsed value renders the same
 * SQL every time for a given model.
 */

#pragma once

#include "data_model.hpp"
#include "errors.hpp"
#include "field_codec.hpp"
#include "log.hpp"
#include "str.hpp"
#include <algorithm>
#include <memory>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace oino {

// ============================================================================
// Operators
// ============================================================================

enum class CompareOp { Lt, Le, Eq, Ge, Gt, Like };
enum class BoolOp { And, Or, Not };

inline const char* compare_op_sql(CompareOp op) {
    switch (op) {
        case CompareOp::Lt:   return " < ";
        case CompareOp::Le:   return " <= ";
        case CompareOp::Eq:   return " = ";
        case CompareOp::Ge:   return " >= ";
        case CompareOp::Gt:   return " > ";
        case CompareOp::Like: return " LIKE ";
    }
    return " = ";
}

inline CompareOp parse_compare_op(const std::string& s) {
    const std::string op = to_lower(s);
    if (op == "lt") return CompareOp::Lt;
    if (op == "le") return CompareOp::Le;
    if (op == "ge") return CompareOp::Ge;
    if (op == "gt") return CompareOp::Gt;
    if (op == "like") return CompareOp::Like;
    return CompareOp::Eq;
}

// ============================================================================
// FilterExpr
// ============================================================================

class FilterExpr {
public:
    /// (field)-op(literal)
    struct Leaf {
        std::string field;
        CompareOp op;
        std::string literal;
    };

    /// left AND/OR right, or NOT left (right is null)
    struct Node {
        std::shared_ptr<const FilterExpr> left;
        BoolOp op;
        std::shared_ptr<const FilterExpr> right;
    };

    FilterExpr() = default;
    explicit FilterExpr(Leaf leaf) : value_(std::move(leaf)) {}
    explicit FilterExpr(Node node) : value_(std::move(node)) {}

    /**
     * Parse a filter string. An empty or blank string gives the empty
     * filter.
     *
     * @throws FilterSyntaxError carrying the part that did not parse
     */
    static FilterExpr parse(const std::string& text) {
        static const std::regex condition_re(
            R"re(^\(\s?"?([^'"\(\)]+?)"?\s?\)\s?-(lt|le|eq|ge|gt|like)\s?\(([^'"\(\)]+)\)$)re",
            std::regex::ECMAScript | std::regex::icase);
        static const std::regex negation_re(R"(^-not\((.+)\)$)",
            std::regex::ECMAScript | std::regex::icase);
        static const std::regex bool_op_re(R"(^\s?-(and|or)\s?$)",
            std::regex::ECMAScript | std::regex::icase);

        const std::string s = trim(text);
        if (s.empty()) return FilterExpr();

        std::smatch m;
        if (std::regex_match(s, m, condition_re)) {
            return FilterExpr(Leaf{trim(m[1].str()), parse_compare_op(m[2].str()), m[3].str()});
        }
        if (std::regex_match(s, m, negation_re)) {
            auto inner = std::make_shared<const FilterExpr>(parse(m[1].str()));
            return FilterExpr(Node{std::move(inner), BoolOp::Not, nullptr});
        }

        auto parts = split_by_brackets(s, true, false, '(', ')');
        if (parts.size() == 3 && std::regex_match(parts[1], m, bool_op_re)) {
            BoolOp op = iequals(m[1].str(), "and") ? BoolOp::And : BoolOp::Or;
            auto left = std::make_shared<const FilterExpr>(parse(parts[0]));
            auto right = std::make_shared<const FilterExpr>(parse(parts[2]));
            return FilterExpr(Node{std::move(left), op, std::move(right)});
        }
        if (parts.size() == 1 && s.front() == '(' && s.back() == ')' && parts[0].size() + 2 == s.size()) {
            return parse(parts[0]);     // redundant outer brackets
        }
        throw FilterSyntaxError("Invalid filter", s);
    }

    bool empty() const { return std::holds_alternative<std::monostate>(value_); }
    const Leaf* leaf() const { return std::get_if<Leaf>(&value_); }
    const Node* node() const { return std::get_if<Node>(&value_); }

    /// Field names referenced anywhere in the expression
    std::vector<std::string> fields() const {
        std::vector<std::string> out;
        collect_fields(out);
        return out;
    }

    /**
     * Render as an SQL predicate without WHERE. The empty filter renders
     * as "". A condition on a field the model does not know is rendered
     * with the raw literal, unless strict is set, in which case it throws
     * UnknownFieldError.
     */
    std::string to_sql(const DataModel& model, bool strict = false) const {
        if (const Leaf* l = leaf()) return leaf_sql(*l, model, strict);
        const Node* n = node();
        if (!n) return "";

        std::string left = n->left ? n->left->to_sql(model, strict) : "";
        if (n->op == BoolOp::Not) {
            return left.empty() ? "" : "NOT (" + left + ")";
        }
        std::string right = n->right ? n->right->to_sql(model, strict) : "";
        if (left.empty()) return right;
        if (right.empty()) return left;
        return "(" + left + (n->op == BoolOp::And ? " AND " : " OR ") + right + ")";
    }

private:
    std::variant<std::monostate, Leaf, Node> value_;

    void collect_fields(std::vector<std::string>& out) const {
        if (const Leaf* l = leaf()) {
            out.push_back(l->field);
        } else if (const Node* n = node()) {
            if (n->left) n->left->collect_fields(out);
            if (n->right) n->right->collect_fields(out);
        }
    }

    static std::string leaf_sql(const Leaf& l, const DataModel& model, bool strict) {
        const SqlDialect& dialect = model.dialect();
        const Field* field = model.find_field(l.field);
        if (!field) {
            if (strict) throw UnknownFieldError(l.field);
            OINO_LOG_WARN("filter", "unknown field '%s' rendered without type checks", l.field.c_str());
            return "(" + dialect.quote_identifier(l.field) + compare_op_sql(l.op) + l.literal + ")";
        }

        std::string literal;
        if (l.op == CompareOp::Like) {
            literal = dialect.print_literal(Cell(l.literal), field->native_type);
        } else {
            try {
                Cell value = field_codec(field->type).deserialize(l.literal);
                literal = dialect.print_literal(value, field->native_type);
            } catch (const SerializationError&) {
                throw FilterSyntaxError("Invalid value for field " + field->name, l.literal);
            }
        }
        return "(" + dialect.quote_identifier(field->name) + compare_op_sql(l.op) + literal + ")";
    }
};

// ============================================================================
// OrderSpec
// ============================================================================

class OrderSpec {
public:
    struct Item {
        std::string field;
        bool descending = false;
    };

    /**
     * Parse "name[ ASC|DESC|+|-][,...]". Tokens that do not match are
     * dropped, so any text parses.
     */
    static OrderSpec parse(const std::string& text) {
        static const std::regex item_re(R"re(^\s*"?(\w+)"?\s*(ASC|DESC|\+|-)?\s*$)re",
            std::regex::ECMAScript | std::regex::icase);
        OrderSpec spec;
        if (trim(text).empty()) return spec;

        for (const auto& token : split(text, ',')) {
            std::smatch m;
            if (std::regex_match(token, m, item_re)) {
                const std::string dir = m[2].str();
                spec.items_.push_back({m[1].str(), iequals(dir, "DESC") || dir == "-"});
            } else {
                OINO_LOG_DEBUG("order", "dropping order token '%s'", token.c_str());
            }
        }
        return spec;
    }

    bool empty() const { return items_.empty(); }
    const std::vector<Item>& items() const { return items_; }

    /// e.g. "age" DESC,"name" ASC. Fields missing from the model are dropped.
    std::string to_sql(const DataModel& model) const {
        std::string sql;
        for (const auto& item : items_) {
            const Field* field = model.find_field(item.field);
            if (!field) {
                OINO_LOG_DEBUG("order", "dropping unknown field '%s'", item.field.c_str());
                continue;
            }
            if (!sql.empty()) sql += ",";
            sql += model.dialect().quote_identifier(field->name);
            sql += item.descending ? " DESC" : " ASC";
        }
        return sql;
    }

private:
    std::vector<Item> items_;
};

// ============================================================================
// LimitSpec
// ============================================================================

class LimitSpec {
public:
    LimitSpec() = default;
    explicit LimitSpec(int64_t limit, int64_t page = 0) : limit_(limit), page_(page) {}

    /**
     * Parse "n", "n page p" or "n.p", pages counted from 1. Anything else
     * means no limit.
     */
    static LimitSpec parse(const std::string& text) {
        static const std::regex limit_re(R"re(^(\d+)(\s+page\s+|\.)?(\d+)?$)re",
            std::regex::ECMAScript | std::regex::icase);
        std::smatch m;
        const std::string s = trim(text);
        int64_t limit = 0;
        int64_t page = 0;
        if (!std::regex_match(s, m, limit_re) || !parse_int64(m[1].str(), limit)) {
            return LimitSpec();
        }
        if (m[3].matched) {
            // "10.2" and "10 page 2" carry a page, "102" does not
            if (m[2].length() == 0 || !parse_int64(m[3].str(), page)) return LimitSpec(limit);
        }
        return LimitSpec(limit, page);
    }

    bool empty() const { return limit_ <= 0; }
    int64_t value() const { return limit_; }
    int64_t page() const { return page_; }

    /// "n" without a page, "n OFFSET n*(p-1)" with one
    std::string to_sql(const DataModel&) const {
        if (empty()) return "";
        std::string sql = std::to_string(limit_);
        if (page_ > 0) sql += " OFFSET " + std::to_string(limit_ * (page_ - 1));
        return sql;
    }

private:
    int64_t limit_ = 0;
    int64_t page_ = 0;
};

// ============================================================================
// SelectSpec
// ============================================================================

/// Column projection. Empty selects every field.
class SelectSpec {
public:
    static SelectSpec parse(const std::string& text) {
        SelectSpec spec;
        for (const auto& token : split(text, ',')) {
            std::string name = trim(token);
            if (!name.empty()) spec.fields_.push_back(name);
        }
        return spec;
    }

    bool empty() const { return fields_.empty(); }
    const std::vector<std::string>& fields() const { return fields_; }

    /// @throws UnknownFieldError for a name missing from the model
    void validate(const DataModel& model) const {
        for (const auto& name : fields_) {
            if (!model.find_field(name)) throw UnknownFieldError(name);
        }
    }

    /// Primary keys are always selected.
    bool is_selected(const Field& field) const {
        if (fields_.empty() || field.is_primary_key) return true;
        return std::find(fields_.begin(), fields_.end(), field.name) != fields_.end();
    }

private:
    std::vector<std::string> fields_;
};

// ============================================================================
// AggregateSpec
// ============================================================================

enum class AggregateFunction { Count, Sum, Avg, Min, Max };

inline const char* aggregate_function_sql(AggregateFunction f) {
    switch (f) {
        case AggregateFunction::Count: return "count";
        case AggregateFunction::Sum:   return "sum";
        case AggregateFunction::Avg:   return "avg";
        case AggregateFunction::Min:   return "min";
        case AggregateFunction::Max:   return "max";
    }
    return "count";
}

/**
 * Aggregates "count(a),sum(b)". Selected fields that are not aggregated
 * become the GROUP BY columns. Tokens that do not match are dropped.
 */
class AggregateSpec {
public:
    struct Item {
        AggregateFunction function;
        std::string field;
    };

    static AggregateSpec parse(const std::string& text) {
        static const std::regex item_re(R"re(^\s*(count|sum|avg|min|max)\((\w+)\)\s*$)re",
            std::regex::ECMAScript | std::regex::icase);
        AggregateSpec spec;
        for (const auto& token : split(text, ',')) {
            std::smatch m;
            if (!std::regex_match(token, m, item_re)) {
                if (!trim(token).empty()) {
                    OINO_LOG_DEBUG("aggregate", "dropping aggregate token '%s'", token.c_str());
                }
                continue;
            }
            const std::string fn = to_lower(m[1].str());
            AggregateFunction f = AggregateFunction::Count;
            if (fn == "sum") f = AggregateFunction::Sum;
            else if (fn == "avg") f = AggregateFunction::Avg;
            else if (fn == "min") f = AggregateFunction::Min;
            else if (fn == "max") f = AggregateFunction::Max;
            spec.items_.push_back({f, m[2].str()});
        }
        return spec;
    }

    bool empty() const { return items_.empty(); }
    const std::vector<Item>& items() const { return items_; }

    /// @throws UnknownFieldError for a name missing from the model
    void validate(const DataModel& model) const {
        for (const auto& item : items_) {
            if (!model.find_field(item.field)) throw UnknownFieldError(item.field);
        }
    }

    const Item* find(const Field& field) const {
        for (const auto& item : items_) {
            if (item.field == field.name) return &item;
        }
        return nullptr;
    }

    bool is_aggregated(const Field& field) const { return find(field) != nullptr; }

    /// Column expression for a selected field, e.g. sum("total") AS "total"
    std::string print_column(const Field& field, const SqlDialect& dialect) const {
        const std::string column = dialect.quote_identifier(field.name);
        const Item* item = find(field);
        if (!item) return column;
        return std::string(aggregate_function_sql(item->function)) + "(" + column + ") AS " + column;
    }

    /// GROUP BY list: the selected fields that are not aggregated
    std::string to_sql(const DataModel& model, const SelectSpec& select) const {
        if (empty()) return "";
        std::string sql;
        for (const auto& field : model) {
            if (!select.is_selected(field) || is_aggregated(field)) continue;
            if (!sql.empty()) sql += ",";
            sql += model.dialect().quote_identifier(field.name);
        }
        return sql;
    }

private:
    std::vector<Item> items_;
};

} // namespace oino
