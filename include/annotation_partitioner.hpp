/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_ANNOTATION_PARTITIONER_HPP
#define CAGSTAT_ANNOTATION_PARTITIONER_HPP

// standard
#include <cstddef>
#include <string>
#include <vector>

// class
#include "data_table.hpp"
#include "result_reshaper.hpp"
#include "shard_writer.hpp"

/**
 * Groups corrected results by annotation and writes them as shards for
 * the betta step.
 *
 * For every annotation column (in the given order) and every distinct label
 * of that column (sorted), the result rows of all features carrying the label
 * are written with two extra fields: label and annotation (the column name).
 * Intercept rows are never written. Labels shared by more than
 * max_group_features features are skipped with a warning. If nothing is
 * written, a placeholder shard 0 is produced instead.
 */
class annotation_partitioner {
public:
    static constexpr const char* INTERCEPT = "(Intercept)";

    struct config {
        std::string feature_column = "CAG";
        size_t max_group_features = 50000;
        shard_writer::config shards;
    };

    struct summary {
        size_t groups = 0;          // (column, label) pairs seen
        size_t skipped = 0;         // groups above max_group_features
        size_t rows = 0;            // records written, placeholder excluded
        size_t shards = 0;
        bool placeholder = false;
    };

    annotation_partitioner() : annotation_partitioner(config{}) {}
    explicit annotation_partitioner(const config& cfg);

    /**
     * @param results corrected wide table
     * @param features feature annotation table with the feature column and
     *        every column listed in columns
     * @param columns annotation columns to group by, may be empty
     * @throws std::runtime_error if a column is missing from features
     */
    summary partition(const wide_table& results, const data_table& features,
                      const std::vector<std::string>& columns) const;

    // feature, parameter, value columns, [q_value], wald, label, annotation
    std::vector<std::string> shard_header(const wide_table& results) const;

private:
    config cfg;

    std::vector<std::string> render(const wide_table& results, const wide_row& row,
                                    const std::string& label,
                                    const std::string& annotation) const;
};

#endif //CAGSTAT_ANNOTATION_PARTITIONER_HPP
