/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_RESULT_RESHAPER_HPP
#define CAGSTAT_RESULT_RESHAPER_HPP

// standard
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

// class
#include "data_table.hpp"
#include "file_entries.hpp"

/**
 * One (feature, parameter) row of the wide result table
 */
struct wide_row {
    std::string feature;
    std::string parameter;                  // prefix stripped ("mu.group" -> "group")
    std::map<std::string, double> values;   // by type; absent key = missing value
    std::optional<double> q_value;          // set by fdr_corrector
    double wald = std::numeric_limits<double>::quiet_NaN();  // estimate / std_error

    std::optional<double> value(const std::string& type) const;
    std::optional<double> estimate() const { return value("estimate"); }
    std::optional<double> std_error() const { return value("std_error"); }
    std::optional<double> p_value() const { return value("p_value"); }
};

/**
 * Wide result table: one row per (feature, parameter), one value column
 * per statistic type that has at least one value
 */
struct wide_table {
    std::vector<std::string> value_columns;   // sorted
    std::vector<wide_row> rows;
    bool has_q_value = false;

    bool has_column(const std::string& type) const;

    // Copy of the table without rows of the given parameter
    wide_table without_parameter(const std::string& parameter) const;

    /**
     * Columnar form: feature, parameter, value columns, [q_value], wald
     * @param feature_column name of the feature key column
     */
    data_table to_table(const std::string& feature_column) const;
};

/**
 * Pivots long-format regression output (one row per feature, parameter and
 * statistic) into a wide_table, keeping only parameters with a given prefix.
 *
 * Duplicate (feature, parameter, type) cells are averaged and NaN cells
 * ignored; a pair without any value is dropped. Rows are sorted by feature
 * (numerically for numeric ids) and then by parameter.
 */
class result_reshaper {
public:
    struct config {
        std::string prefix = "mu.";
    };

    result_reshaper() : result_reshaper(config{}) {}
    explicit result_reshaper(const config& cfg);

    /**
     * @throws malformed_input_error if no parameter carries the prefix
     */
    wide_table reshape(const std::vector<stat_row>& rows) const;

    // estimate / std_error; NaN when either is missing or the error is zero
    static double wald(const wide_row& row);

private:
    config cfg;
};

#endif //CAGSTAT_RESULT_RESHAPER_HPP
