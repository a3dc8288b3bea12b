/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "stat_reader.hpp"

// standard
#include <algorithm>
#include <stdexcept>

// class
#include "errors.hpp"
#include "utility.hpp"

stat_reader::stat_reader(const std::filesystem::path& filepath,
                         const std::string& feature_column)
    : file_reader<stat_row>(filepath),
      idx_feature(0), idx_parameter(0), idx_type(0), idx_value(0), min_fields(0) {

    std::string line;
    if (!read_line(line)) {
        throw malformed_input_error("Results file is empty: " + get_path());
    }
    parse_header(line, feature_column);
}

void stat_reader::parse_header(const std::string& line, const std::string& feature_column) {
    std::vector<std::string> header = utility::split_csv(line);
    for (auto& col : header) {
        col = utility::trim(col);
    }

    auto find_col = [&header, this](const std::string& name) -> size_t {
        auto it = std::find(header.begin(), header.end(), name);
        if (it == header.end()) {
            throw malformed_input_error("Results file " + get_path() +
                                        " is missing required column '" + name + "'");
        }
        return static_cast<size_t>(std::distance(header.begin(), it));
    };

    idx_feature = find_col(feature_column);
    idx_parameter = find_col("parameter");
    idx_type = find_col("type");
    idx_value = find_col("value");
    min_fields = std::max({idx_feature, idx_parameter, idx_type, idx_value}) + 1;
}

bool stat_reader::read_next(stat_row& entry) {
    std::string line;

    while (read_line(line)) {
        // Skip empty lines
        if (utility::trim(line).empty()) {
            continue;
        }

        auto fields = utility::split_csv(line);
        if (fields.size() < min_fields) {
            throw malformed_input_error("Results line " + std::to_string(get_current_line()) +
                                        " has " + std::to_string(fields.size()) +
                                        " fields, expected at least " +
                                        std::to_string(min_fields));
        }

        entry.feature = utility::trim(fields[idx_feature]);
        entry.parameter = utility::trim(fields[idx_parameter]);
        entry.type = utility::trim(fields[idx_type]);

        try {
            entry.value = utility::parse_number(fields[idx_value]);
        } catch (const std::invalid_argument& e) {
            throw malformed_input_error("Results line " + std::to_string(get_current_line()) +
                                        ": " + e.what());
        }
        return true;
    }

    return false;
}

std::vector<stat_row> stat_reader::read_all(const std::filesystem::path& filepath,
                                            const std::string& feature_column) {
    std::vector<stat_row> rows;
    stat_reader reader(filepath, feature_column);

    stat_row entry;
    while (reader.read_next(entry)) {
        rows.push_back(entry);
    }
    return rows;
}
