/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "result_reshaper.hpp"

// standard
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <set>
#include <utility>

// class
#include "errors.hpp"
#include "utility.hpp"

namespace {

// Feature ids order numerically when both are numbers ("2" < "10"), otherwise
// as text; numbers sort before text
bool feature_less(const std::string& a, const std::string& b) {
    auto number = [](const std::string& id) -> std::optional<double> {
        try {
            double value = utility::parse_number(id);
            if (std::isnan(value)) return std::nullopt;
            return value;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    };

    auto na = number(a);
    auto nb = number(b);
    if (na && nb && *na != *nb) return *na < *nb;
    if (na.has_value() != nb.has_value()) return na.has_value();
    return a < b;
}

} // namespace

std::optional<double> wide_row::value(const std::string& type) const {
    auto it = values.find(type);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool wide_table::has_column(const std::string& type) const {
    return std::find(value_columns.begin(), value_columns.end(), type) != value_columns.end();
}

wide_table wide_table::without_parameter(const std::string& parameter) const {
    wide_table filtered;
    filtered.value_columns = value_columns;
    filtered.has_q_value = has_q_value;
    for (const auto& row : rows) {
        if (row.parameter != parameter) {
            filtered.rows.push_back(row);
        }
    }
    return filtered;
}

data_table wide_table::to_table(const std::string& feature_column) const {
    std::vector<std::string> features;
    std::vector<std::string> parameters;
    std::vector<double> q_values;
    std::vector<double> walds;
    std::vector<std::vector<double>> value_data(value_columns.size());

    for (const auto& row : rows) {
        features.push_back(row.feature);
        parameters.push_back(row.parameter);
        for (size_t i = 0; i < value_columns.size(); ++i) {
            value_data[i].push_back(row.value(value_columns[i]).value_or(std::nan("")));
        }
        q_values.push_back(row.q_value.value_or(std::nan("")));
        walds.push_back(row.wald);
    }

    data_table table;
    table.add_column(table_column::text_column(feature_column, std::move(features)));
    table.add_column(table_column::text_column("parameter", std::move(parameters)));
    for (size_t i = 0; i < value_columns.size(); ++i) {
        table.add_column(table_column::numeric_column(value_columns[i], std::move(value_data[i])));
    }
    if (has_q_value) {
        table.add_column(table_column::numeric_column("q_value", std::move(q_values)));
    }
    table.add_column(table_column::numeric_column("wald", std::move(walds)));
    return table;
}

result_reshaper::result_reshaper(const config& cfg) : cfg(cfg) {}

double result_reshaper::wald(const wide_row& row) {
    auto estimate = row.estimate();
    auto std_error = row.std_error();
    if (!estimate || !std_error || *std_error == 0.0) {
        return std::nan("");
    }
    return *estimate / *std_error;
}

wide_table result_reshaper::reshape(const std::vector<stat_row>& rows) const {
    struct cell {
        double sum = 0.0;
        size_t count = 0;
    };

    std::vector<std::pair<std::string, std::string>> keys;
    std::map<std::pair<std::string, std::string>, size_t> key_index;
    std::vector<std::map<std::string, cell>> cells;
    size_t matched = 0;

    for (const auto& row : rows) {
        if (!row.parameter.starts_with(cfg.prefix)) {
            continue;
        }
        matched++;

        auto key = std::make_pair(row.feature, row.parameter.substr(cfg.prefix.size()));
        auto [it, inserted] = key_index.emplace(key, keys.size());
        if (inserted) {
            keys.push_back(key);
            cells.emplace_back();
        }

        if (!std::isnan(row.value)) {
            cell& c = cells[it->second][row.type];
            c.sum += row.value;
            c.count++;
        }
    }

    if (matched == 0) {
        throw malformed_input_error("None of the " + std::to_string(rows.size()) +
                                    " result rows has a parameter starting with '" +
                                    cfg.prefix + "'");
    }

    // sorted by feature, then parameter
    std::vector<size_t> order(keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&keys](size_t a, size_t b) {
        if (keys[a].first != keys[b].first) {
            return feature_less(keys[a].first, keys[b].first);
        }
        return keys[a].second < keys[b].second;
    });

    wide_table table;
    std::set<std::string> types;

    for (size_t i : order) {
        wide_row row;
        row.feature = keys[i].first;
        row.parameter = keys[i].second;
        for (const auto& [type, c] : cells[i]) {
            if (c.count > 0) {
                row.values[type] = c.sum / static_cast<double>(c.count);
                types.insert(type);
            }
        }
        // all-missing pairs are dropped like an all-NaN pivot row
        if (row.values.empty()) {
            continue;
        }
        row.wald = wald(row);
        table.rows.push_back(std::move(row));
    }

    table.value_columns.assign(types.begin(), types.end());
    return table;
}
