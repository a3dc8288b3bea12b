/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_RANK_ANNOTATOR_HPP
#define CAGSTAT_RANK_ANNOTATOR_HPP

// standard
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// class
#include "data_table.hpp"
#include "taxonomy.hpp"

/**
 * Assigns rank-specific taxon names (species, genus, family, ...) to
 * taxonomic ids.
 *
 * Lineages and (id, rank) lookups are cached without eviction for the
 * lifetime of the annotator; the set of ids seen in one run is small.
 * The taxonomy must outlive the annotator.
 */
class rank_annotator {
public:
    explicit rank_annotator(const taxonomy& tax);

    /**
     * Same chain as taxonomy::ancestors, cached. The walk stops at the first
     * ancestor with a cached lineage and appends that lineage.
     */
    const std::vector<std::string>& ancestors(const std::string& tax_id);

    /**
     * Name of the first node in the lineage of tax_id (tax_id itself
     * included) whose rank equals rank.
     * @return std::nullopt for a missing or root id, or if no node matches
     */
    std::optional<std::string> ancestor_at_rank(const std::optional<std::string>& tax_id,
                                                const std::string& rank);

    /**
     * Add one text column per rank to the feature table, holding the
     * resolved name or an empty cell. Existing columns of the same name are
     * replaced.
     * @throws std::runtime_error if tax_column does not exist
     */
    void annotate(data_table& features, const std::vector<std::string>& ranks,
                  const std::string& tax_column = "tax_id");

    size_t cached_lineages() const { return lineage_cache.size(); }
    size_t cached_lookups() const { return rank_cache.size(); }

private:
    const taxonomy& tax;
    std::unordered_map<std::string, std::vector<std::string>> lineage_cache;
    std::map<std::pair<std::string, std::string>, std::optional<std::string>> rank_cache;
};

#endif //CAGSTAT_RANK_ANNOTATOR_HPP
