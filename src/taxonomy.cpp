/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "taxonomy.hpp"

// standard
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

// class
#include "utility.hpp"

taxonomy taxonomy::from_table(const data_table& table) {
    for (const char* required : {"tax_id", "parent", "name", "rank"}) {
        if (!table.has_column(required)) {
            throw std::runtime_error(std::string("Taxonomy table is missing column '") +
                                     required + "'");
        }
    }

    const auto& ids = table.column("tax_id");
    const auto& parents = table.column("parent");
    const auto& names = table.column("name");
    const auto& ranks = table.column("rank");

    taxonomy tax;
    size_t skipped = 0;
    size_t duplicates = 0;

    for (size_t row = 0; row < table.num_rows(); ++row) {
        auto tax_id = normalize_id(ids, row);
        if (!tax_id) {
            skipped++;
            continue;
        }
        if (tax.contains(*tax_id)) {
            duplicates++;
            continue;
        }
        auto parent = normalize_id(parents, row);
        tax.add(*tax_id, parent.value_or(ROOT_SENTINEL), names.text_at(row), ranks.text_at(row));
    }

    if (skipped > 0) {
        logging::warning("Skipped " + std::to_string(skipped) +
                         " taxonomy rows without tax_id");
    }
    if (duplicates > 0) {
        logging::warning("Ignored " + std::to_string(duplicates) +
                         " duplicate tax_id rows (first occurrence kept)");
    }
    return tax;
}

std::optional<std::string> taxonomy::normalize_id(const std::string& raw) {
    std::string value = utility::trim(raw);
    if (value.empty() || value == "NA" || value == "NaN" || value == "nan") {
        return std::nullopt;
    }

    char* end = nullptr;
    double number = std::strtod(value.c_str(), &end);
    if (end == value.c_str() + value.size()) {
        if (std::isnan(number)) {
            return std::nullopt;
        }
        if (std::isfinite(number) && number == std::trunc(number) && std::fabs(number) < 1e15) {
            return std::to_string(static_cast<int64_t>(number));
        }
    }
    return value;
}

std::optional<std::string> taxonomy::normalize_id(const table_column& col, size_t row) {
    auto text = col.text_at(row);
    if (!text) {
        return std::nullopt;
    }
    return normalize_id(*text);
}

bool taxonomy::is_unassigned(const std::optional<std::string>& tax_id) {
    return !tax_id || *tax_id == ROOT_SENTINEL;
}

void taxonomy::add(const std::string& tax_id, const std::string& parent,
                   std::optional<std::string> name, std::optional<std::string> rank) {
    nodes[tax_id] = taxon_node{parent, std::move(name), std::move(rank)};
}

bool taxonomy::contains(const std::string& tax_id) const {
    return nodes.find(tax_id) != nodes.end();
}

std::optional<std::string> taxonomy::parent(const std::string& tax_id) const {
    auto it = nodes.find(tax_id);
    if (it == nodes.end()) return std::nullopt;
    return it->second.parent;
}

std::optional<std::string> taxonomy::name(const std::string& tax_id) const {
    auto it = nodes.find(tax_id);
    if (it == nodes.end()) return std::nullopt;
    return it->second.name;
}

std::optional<std::string> taxonomy::rank(const std::string& tax_id) const {
    auto it = nodes.find(tax_id);
    if (it == nodes.end()) return std::nullopt;
    return it->second.rank;
}

std::vector<std::string> taxonomy::ancestors(const std::string& tax_id) const {
    std::vector<std::string> chain;
    std::unordered_set<std::string> visited;
    std::string current = tax_id;

    while (visited.insert(current).second) {
        chain.push_back(current);

        auto next = parent(current);
        if (!next || *next == current) {
            break;
        }
        current = *next;
    }

    return chain;
}
