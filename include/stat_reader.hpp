/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_STAT_READER_HPP
#define CAGSTAT_STAT_READER_HPP

// standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// class
#include "file_reader.hpp"
#include "file_entries.hpp"

/**
 * Reader for long-format regression results (corncob output) in CSV.
 *
 * Required columns: <feature column>, parameter, type, value. Additional
 * columns (e.g. a leading row index) are ignored. Plain and gzip-compressed
 * files are both accepted.
 */
class stat_reader : public file_reader<stat_row> {
public:
    /**
     * @throws malformed_input_error if the file is empty or lacks a
     *         required column
     */
    explicit stat_reader(const std::filesystem::path& filepath,
                         const std::string& feature_column = "CAG");

    // Read next entry, false at end of file
    bool read_next(stat_row& entry) override;

    /**
     * Read all rows of a results file
     * @throws malformed_input_error if required columns are missing or a
     *         value cannot be parsed
     */
    static std::vector<stat_row> read_all(const std::filesystem::path& filepath,
                                          const std::string& feature_column = "CAG");

private:
    size_t idx_feature;
    size_t idx_parameter;
    size_t idx_type;
    size_t idx_value;
    size_t min_fields;

    void parse_header(const std::string& line, const std::string& feature_column);
};

#endif //CAGSTAT_STAT_READER_HPP
