/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_FILE_ENTRIES_HPP
#define CAGSTAT_FILE_ENTRIES_HPP

#include <cmath>
#include <string>
#include <utility>

// one row of long-format regression output (feature, parameter, type, value)
struct stat_row {
    std::string feature;
    std::string parameter;
    std::string type;     // estimate, std_error, p_value, ...
    double value;         // NaN when the cell is missing

    stat_row() : value(std::nan("")) {}
    stat_row(std::string feature, std::string parameter, std::string type, double value)
        : feature{std::move(feature)}, parameter{std::move(parameter)},
          type{std::move(type)}, value{value} {}
};

#endif //CAGSTAT_FILE_ENTRIES_HPP
