/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/lineage.hpp"

#include <fstream>
#include <stdexcept>

#include "hdf5_store.hpp"
#include "rank_annotator.hpp"
#include "taxonomy.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options lineage::parse_args(int argc, char** argv) {
    cxxopts::Options options("cagstat lineage",
        "Show the lineage of taxa in the stored taxonomy");

    options.add_options("Input/Output")
        ("s,store", "HDF5 store holding the taxonomy",
            cxxopts::value<std::string>())
        ("taxonomy-path", "Table path of the taxonomy in the store",
            cxxopts::value<std::string>()->default_value("/ref/taxonomy"))
        ("t,tax-id", "Taxonomic id to look up (repeatable)",
            cxxopts::value<std::vector<std::string>>())
        ("ranks", "Ranks to report (comma separated)",
            cxxopts::value<std::string>()->default_value("species,genus,family"))
        ;

    add_common_options(options);

    return options;
}

void lineage::validate(const cxxopts::ParseResult& args) {
    require_file(args, "store", "-s/--store");

    if (!args.count("tax-id")) {
        throw std::runtime_error("At least one -t/--tax-id is required");
    }
}

void lineage::execute(const cxxopts::ParseResult& args) {
    std::string store_path = args["store"].as<std::string>();
    std::string taxonomy_path = args["taxonomy-path"].as<std::string>();

    hdf5_store store(store_path, hdf5_store::open_mode::READ_ONLY);
    if (!store.has_table(taxonomy_path)) {
        throw std::runtime_error("No taxonomy at " + store_path + ":" + taxonomy_path);
    }

    taxonomy tax = taxonomy::from_table(store.read_table(taxonomy_path));
    logging::info("Loaded " + std::to_string(tax.size()) + " taxa from " + taxonomy_path);

    auto ranks = list_option(args, "ranks");
    rank_annotator annotator(tax);

    auto out_path = output_dir / "lineage.tsv";
    std::ofstream out(out_path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + out_path.string());
    }

    out << "tax_id\tname\trank\tlineage";
    for (const auto& rank : ranks) {
        out << "\t" << rank;
    }
    out << "\n";

    size_t unknown = 0;
    for (const auto& raw : args["tax-id"].as<std::vector<std::string>>()) {
        auto tax_id = taxonomy::normalize_id(raw);
        if (!tax_id) {
            logging::warning("Ignoring empty taxonomic id '" + raw + "'");
            continue;
        }
        if (!tax.contains(*tax_id)) {
            ++unknown;
        }

        std::string chain;
        for (const auto& id : annotator.ancestors(*tax_id)) {
            if (!chain.empty()) chain += ";";
            chain += id;
        }

        out << *tax_id << "\t" << tax.name(*tax_id).value_or("")
            << "\t" << tax.rank(*tax_id).value_or("") << "\t" << chain;
        for (const auto& rank : ranks) {
            out << "\t" << annotator.ancestor_at_rank(tax_id, rank).value_or("");
        }
        out << "\n";
    }

    if (unknown > 0) {
        logging::warning(std::to_string(unknown) + " taxonomic id(s) not found in taxonomy");
    }
    logging::info("Lineages written to: " + out_path.string());
}

} // namespace subcall
