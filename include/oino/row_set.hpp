/**
 * oino/row_set.hpp - Forward-only typed rows over a dialect cursor
 *
 * Part of oinosql - REST resources over SQL tables.
 */

#pragma once

#include "data_model.hpp"
#include "dialect.hpp"
#include "field_codec.hpp"
#include <algorithm>
#include <memory>
#include <vector>

namespace oino {

/**
 * Rows produced by one query, aligned to the DataModel field order.
 * Columns the query did not select are left Unset. The set can be read
 * once; abandoning it midway only leaves the driver cursor to the
 * dialect's cleanup.
 *
 *   oino::Row row;
 *   while (rows.fetch(row)) {
 *       ...
 *   }
 */
class RowSet {
public:
    RowSet(std::shared_ptr<const DataModel> model, Cursor cursor)
        : model_(std::move(model)), cursor_(std::move(cursor)) {
        for (const auto& column : cursor_.columns) {
            int index = model_->find_field_index(column);
            column_fields_.push_back(index);
            if (index >= 0) selected_.push_back(static_cast<size_t>(index));
        }
        std::sort(selected_.begin(), selected_.end());
    }

    const DataModel& model() const { return *model_; }

    /// Field indexes present in every row, in model order
    const std::vector<size_t>& selected_fields() const { return selected_; }

    /// Rows delivered so far
    size_t count() const { return count_; }

    bool fetch(Row& row) {
        if (done_) return false;
        if (!cursor_.next(raw_)) {
            done_ = true;
            return false;
        }

        row.assign(model_->size(), Cell(Unset{}));
        const SqlDialect& dialect = model_->dialect();
        for (size_t c = 0; c < column_fields_.size() && c < raw_.size(); ++c) {
            int index = column_fields_[c];
            if (index < 0) continue;
            const Field& field = (*model_)[static_cast<size_t>(index)];
            Cell value = dialect.parse_literal(raw_[c], field.native_type);
            if (field.type == LogicalType::String && has_value(value) &&
                !std::holds_alternative<std::string>(value)) {
                value = cell_to_text(value);
            }
            row[static_cast<size_t>(index)] = std::move(value);
        }
        ++count_;
        return true;
    }

private:
    std::shared_ptr<const DataModel> model_;
    Cursor cursor_;
    std::vector<int> column_fields_;
    std::vector<size_t> selected_;
    std::vector<Cell> raw_;
    size_t count_ = 0;
    bool done_ = false;
};

} // namespace oino
