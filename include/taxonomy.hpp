/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_TAXONOMY_HPP
#define CAGSTAT_TAXONOMY_HPP

// standard
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// class
#include "data_table.hpp"

/**
 * Entry of the taxonomy table
 */
struct taxon_node {
    std::string parent;                  // taxonomy::ROOT_SENTINEL for roots
    std::optional<std::string> name;
    std::optional<std::string> rank;     // species, genus, family, ...
};

/**
 * Parent-pointer taxonomy (e.g. NCBI taxdump) keyed by taxonomic id.
 *
 * Ids are normalized once when the table is loaded so that numeric and
 * text encodings of the same id compare equal ("562", 562, 562.0).
 * Lookups of unknown ids return std::nullopt and never throw.
 */
class taxonomy {
public:
    // parent of root nodes and value of unassigned features
    static constexpr const char* ROOT_SENTINEL = "0";

    taxonomy() = default;

    /**
     * Build from a table with columns tax_id, parent, name and rank.
     * Rows without tax_id are skipped; a missing parent becomes ROOT_SENTINEL.
     * @throws std::runtime_error if a required column is missing
     */
    static taxonomy from_table(const data_table& table);

    /**
     * Canonical form of a raw id: surrounding whitespace removed, integral
     * numbers without fractional part ("562.0" -> "562").
     * @return std::nullopt for empty, NA or NaN
     */
    static std::optional<std::string> normalize_id(const std::string& raw);
    static std::optional<std::string> normalize_id(const table_column& col, size_t row);

    // true for a missing id or the root sentinel
    static bool is_unassigned(const std::optional<std::string>& tax_id);

    void add(const std::string& tax_id, const std::string& parent,
             std::optional<std::string> name = std::nullopt,
             std::optional<std::string> rank = std::nullopt);

    bool contains(const std::string& tax_id) const;
    size_t size() const { return nodes.size(); }

    std::optional<std::string> parent(const std::string& tax_id) const;
    std::optional<std::string> name(const std::string& tax_id) const;
    std::optional<std::string> rank(const std::string& tax_id) const;

    /**
     * Chain from tax_id (inclusive) towards the root. The walk ends after a
     * node whose parent is unknown, at a node that is its own parent, or
     * before revisiting a node, so malformed tables cannot make it loop.
     * An unknown id yields the chain [tax_id].
     */
    std::vector<std::string> ancestors(const std::string& tax_id) const;

private:
    std::unordered_map<std::string, taxon_node> nodes;
};

#endif //CAGSTAT_TAXONOMY_HPP
