/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "rank_annotator.hpp"

// standard
#include <unordered_set>

// class
#include "utility.hpp"

rank_annotator::rank_annotator(const taxonomy& tax) : tax(tax) {}

const std::vector<std::string>& rank_annotator::ancestors(const std::string& tax_id) {
    auto it = lineage_cache.find(tax_id);
    if (it != lineage_cache.end()) {
        return it->second;
    }

    // walk up until the chain ends or reaches a node with a cached lineage
    std::vector<std::string> chain;
    std::unordered_set<std::string> visited;
    const std::vector<std::string>* cached_tail = nullptr;
    std::string current = tax_id;

    while (visited.insert(current).second) {
        chain.push_back(current);

        auto next = tax.parent(current);
        if (!next || *next == current) {
            break;
        }
        auto cached = lineage_cache.find(*next);
        if (cached != lineage_cache.end()) {
            cached_tail = &cached->second;
            break;
        }
        current = *next;
    }

    if (cached_tail) {
        // a cycle through this walk ends at the first node seen twice
        for (const auto& node : *cached_tail) {
            if (visited.count(node)) break;
            chain.push_back(node);
        }
    }

    return lineage_cache.emplace(tax_id, std::move(chain)).first->second;
}

std::optional<std::string> rank_annotator::ancestor_at_rank(
    const std::optional<std::string>& tax_id, const std::string& rank) {

    if (taxonomy::is_unassigned(tax_id)) {
        return std::nullopt;
    }

    auto key = std::make_pair(*tax_id, rank);
    auto cached = rank_cache.find(key);
    if (cached != rank_cache.end()) {
        return cached->second;
    }

    std::optional<std::string> result;
    for (const auto& node : ancestors(*tax_id)) {
        if (tax.rank(node) == rank) {
            result = tax.name(node);
            break;
        }
    }

    rank_cache.emplace(std::move(key), result);
    return result;
}

void rank_annotator::annotate(data_table& features, const std::vector<std::string>& ranks,
                              const std::string& tax_column) {
    const auto& ids = features.column(tax_column);

    // normalize once, shared by all ranks
    std::vector<std::optional<std::string>> tax_ids;
    tax_ids.reserve(features.num_rows());
    for (size_t row = 0; row < features.num_rows(); ++row) {
        tax_ids.push_back(taxonomy::normalize_id(ids, row));
    }

    for (const auto& rank : ranks) {
        logging::info("Adding " + rank + " names for " +
                      std::to_string(features.num_rows()) + " genes");

        std::vector<std::string> labels;
        labels.reserve(tax_ids.size());
        size_t assigned = 0;
        for (const auto& tax_id : tax_ids) {
            auto label = ancestor_at_rank(tax_id, rank);
            if (label) assigned++;
            labels.push_back(label.value_or(""));
        }

        logging::progress("  " + std::to_string(assigned) + " genes with a " + rank +
                          " assignment");
        features.add_column(table_column::text_column(rank, std::move(labels)));
    }

    logging::info("Finished adding taxonomic labels");
}
