/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_UTILITY_HPP
#define CAGSTAT_UTILITY_HPP

// standard
#include <chrono>
#include <string>
#include <vector>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // only printed after set_progress_enabled(true) (--progress)
    void progress(const std::string& message);
    void set_progress_enabled(bool enabled);
}

namespace utility {
    /**
     * Split a comma separated option value, dropping empty items and
     * surrounding whitespace ("species, genus" -> {"species", "genus"})
     */
    std::vector<std::string> split_list(const std::string& value, char delim = ',');

    std::string trim(const std::string& str);

    /**
     * Split one CSV record. Double quotes group fields and "" inside a
     * quoted field is a literal quote. Records spanning lines are not supported.
     */
    std::vector<std::string> split_csv(const std::string& line, char delim = ',');

    // Quote a CSV field if it contains the delimiter, a quote or a line break
    std::string csv_field(const std::string& value, char delim = ',');

    /**
     * Parse a numeric cell. Empty cells and NA/NaN spellings give NaN.
     * @throws std::invalid_argument if the cell is not a number
     */
    double parse_number(const std::string& cell);

    // Shortest round-trip representation, empty string for NaN
    std::string format_number(double value);
}

#endif //CAGSTAT_UTILITY_HPP
