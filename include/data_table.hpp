/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_DATA_TABLE_HPP
#define CAGSTAT_DATA_TABLE_HPP

// standard
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * One named column of a data_table. A column is either numeric (missing
 * cells are NaN) or text (missing cells are empty strings).
 */
struct table_column {
    std::string name;
    bool numeric = false;
    std::vector<double> numbers;
    std::vector<std::string> text;

    static table_column numeric_column(std::string name, std::vector<double> values);
    static table_column text_column(std::string name, std::vector<std::string> values);

    size_t size() const { return numeric ? numbers.size() : text.size(); }

    bool is_missing(size_t row) const;

    /**
     * Cell rendered as text. Integral numbers are written without a
     * fractional part (562.0 -> "562").
     * @return std::nullopt for a missing cell
     */
    std::optional<std::string> text_at(size_t row) const;

    /**
     * Cell as a number, NaN when missing
     * @throws std::invalid_argument for a text cell that is not a number
     */
    double number_at(size_t row) const;
};

/**
 * In-memory columnar table with equally sized, uniquely named columns.
 * Column order is insertion order.
 */
class data_table {
public:
    size_t num_rows() const { return rows_; }
    size_t num_columns() const { return columns_.size(); }

    bool has_column(const std::string& name) const;

    /**
     * @throws std::runtime_error if the column does not exist
     */
    const table_column& column(const std::string& name) const;

    const std::vector<table_column>& columns() const { return columns_; }
    std::vector<std::string> column_names() const;

    /**
     * Append a column, or replace the one with the same name in place.
     * @throws std::runtime_error if its length differs from the table's
     */
    void add_column(table_column col);

private:
    std::vector<table_column> columns_;
    std::unordered_map<std::string, size_t> index_;
    size_t rows_ = 0;
};

#endif //CAGSTAT_DATA_TABLE_HPP
