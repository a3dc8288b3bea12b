/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "data_table.hpp"

// standard
#include <cmath>
#include <cstdint>
#include <stdexcept>

// class
#include "utility.hpp"

table_column table_column::numeric_column(std::string name, std::vector<double> values) {
    table_column col;
    col.name = std::move(name);
    col.numeric = true;
    col.numbers = std::move(values);
    return col;
}

table_column table_column::text_column(std::string name, std::vector<std::string> values) {
    table_column col;
    col.name = std::move(name);
    col.numeric = false;
    col.text = std::move(values);
    return col;
}

bool table_column::is_missing(size_t row) const {
    if (numeric) {
        return std::isnan(numbers.at(row));
    }
    return text.at(row).empty();
}

std::optional<std::string> table_column::text_at(size_t row) const {
    if (is_missing(row)) {
        return std::nullopt;
    }
    if (!numeric) {
        return text[row];
    }

    double value = numbers[row];
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<int64_t>(value));
    }
    return utility::format_number(value);
}

double table_column::number_at(size_t row) const {
    if (numeric) {
        return numbers.at(row);
    }
    return utility::parse_number(text.at(row));
}

bool data_table::has_column(const std::string& name) const {
    return index_.find(name) != index_.end();
}

const table_column& data_table::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::runtime_error("Table has no column '" + name + "'");
    }
    return columns_[it->second];
}

std::vector<std::string> data_table::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) {
        names.push_back(col.name);
    }
    return names;
}

void data_table::add_column(table_column col) {
    if (!columns_.empty() && col.size() != rows_) {
        throw std::runtime_error("Column '" + col.name + "' has " +
                                 std::to_string(col.size()) + " rows, table has " +
                                 std::to_string(rows_));
    }
    rows_ = col.size();

    auto it = index_.find(col.name);
    if (it != index_.end()) {
        columns_[it->second] = std::move(col);
        return;
    }
    index_[col.name] = columns_.size();
    columns_.push_back(std::move(col));
}
