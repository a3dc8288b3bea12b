/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "annotation_partitioner.hpp"

// standard
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

// class
#include "utility.hpp"

annotation_partitioner::annotation_partitioner(const config& cfg) : cfg(cfg) {}

std::vector<std::string> annotation_partitioner::shard_header(const wide_table& results) const {
    std::vector<std::string> header = {cfg.feature_column, "parameter"};
    header.insert(header.end(), results.value_columns.begin(), results.value_columns.end());
    if (results.has_q_value) {
        header.push_back("q_value");
    }
    header.push_back("wald");
    header.push_back("label");
    header.push_back("annotation");
    return header;
}

std::vector<std::string> annotation_partitioner::render(const wide_table& results,
                                                        const wide_row& row,
                                                        const std::string& label,
                                                        const std::string& annotation) const {
    std::vector<std::string> fields = {row.feature, row.parameter};
    for (const auto& type : results.value_columns) {
        auto value = row.value(type);
        fields.push_back(value ? utility::format_number(*value) : "");
    }
    if (results.has_q_value) {
        fields.push_back(row.q_value ? utility::format_number(*row.q_value) : "");
    }
    fields.push_back(utility::format_number(row.wald));
    fields.push_back(label);
    fields.push_back(annotation);
    return fields;
}

annotation_partitioner::summary annotation_partitioner::partition(
    const wide_table& results, const data_table& features,
    const std::vector<std::string>& columns) const {

    for (const auto& column : columns) {
        if (!features.has_column(column)) {
            throw std::runtime_error("Annotation column '" + column +
                                     "' not found in the feature table");
        }
    }

    if (!columns.empty() && !features.has_column(cfg.feature_column)) {
        throw std::runtime_error("Feature column '" + cfg.feature_column +
                                 "' not found in the feature table");
    }

    summary stats;
    wide_table tested = results.without_parameter(INTERCEPT);
    shard_writer writer(shard_header(tested), cfg.shards);

    if (!columns.empty()) {
        const auto& keys = features.column(cfg.feature_column);

        std::unordered_map<std::string, std::vector<size_t>> rows_by_feature;
        for (size_t i = 0; i < tested.rows.size(); ++i) {
            rows_by_feature[tested.rows[i].feature].push_back(i);
        }

        for (const auto& column : columns) {
            const auto& labels = features.column(column);

            // label -> features carrying it
            std::map<std::string, std::set<std::string>> groups;
            for (size_t row = 0; row < features.num_rows(); ++row) {
                auto label = labels.text_at(row);
                auto key = keys.text_at(row);
                if (!label || !key) continue;
                groups[*label].insert(*key);
            }

            logging::progress("Writing " + std::to_string(groups.size()) +
                              " groups of annotation " + column);

            for (const auto& [label, group_features] : groups) {
                stats.groups++;

                if (group_features.size() > cfg.max_group_features) {
                    logging::warning("Skipping the annotation " + label + " -- too many (" +
                                     std::to_string(group_features.size()) +
                                     ") CAGs found");
                    stats.skipped++;
                    continue;
                }

                std::vector<size_t> selected;
                for (const auto& feature : group_features) {
                    auto it = rows_by_feature.find(feature);
                    if (it != rows_by_feature.end()) {
                        selected.insert(selected.end(), it->second.begin(), it->second.end());
                    }
                }
                // result table order within a group
                std::sort(selected.begin(), selected.end());

                for (size_t idx : selected) {
                    writer.add(render(tested, tested.rows[idx], label, column));
                }
            }
        }
    }

    writer.finish();

    if (writer.rows_written() == 0) {
        writer.write_placeholder();
        stats.placeholder = true;
    }

    stats.rows = writer.rows_written();
    stats.shards = writer.shards_written();
    return stats;
}
