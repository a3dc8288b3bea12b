/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/corncob.hpp"

#include <filesystem>
#include <stdexcept>
#include <unordered_set>

#include "annotation_partitioner.hpp"
#include "fdr_corrector.hpp"
#include "multiple_testing.hpp"
#include "rank_annotator.hpp"
#include "stat_reader.hpp"
#include "taxonomy.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options corncob::parse_args(int argc, char** argv) {
    cxxopts::Options options("cagstat corncob",
        "Add corncob results to the HDF5 store and split them by annotation");

    options.add_options("Input/Output")
        ("s,store", "HDF5 store with taxonomy and gene annotation (updated in place)",
            cxxopts::value<std::string>())
        ("r,results", "Corncob results in long format (CSV, optionally gzipped)",
            cxxopts::value<std::string>())
        ("stats-path", "Table path for the corrected results in the store",
            cxxopts::value<std::string>()->default_value("/stats/cag/corncob"))
        ("taxonomy-path", "Table path of the taxonomy in the store",
            cxxopts::value<std::string>()->default_value("/ref/taxonomy"))
        ("annotation-path", "Table path of the gene annotation in the store",
            cxxopts::value<std::string>()->default_value("/annot/gene/all"))
        ("shard-template", "File name of the output shards, {} is replaced by the index",
            cxxopts::value<std::string>()->default_value("corncob.for.betta.{}.csv.gz"))
        ;

    options.add_options("Statistics")
        ("f,fdr-method", "Multiple testing correction (fdr_bh, fdr_by, bonferroni, "
                         "sidak, holm, holm-sidak, simes-hochberg)",
            cxxopts::value<std::string>()->default_value("fdr_bh"))
        ("alpha", "Target false discovery rate",
            cxxopts::value<double>()->default_value("0.2"))
        ("prefix", "Prefix of the parameters to keep",
            cxxopts::value<std::string>()->default_value("mu."))
        ("feature-column", "Column identifying a CAG in results and annotation",
            cxxopts::value<std::string>()->default_value("CAG"))
        ;

    options.add_options("Annotation")
        ("ranks", "Taxonomic ranks to label genes with (comma separated)",
            cxxopts::value<std::string>()->default_value("species,genus,family"))
        ("annotations", "Functional annotation columns used when present (comma separated)",
            cxxopts::value<std::string>()->default_value("eggNOG_desc"))
        ("shard-rows", "Rows per output shard",
            cxxopts::value<size_t>()->default_value("10000"))
        ("max-group-features", "Skip annotations shared by more CAGs than this",
            cxxopts::value<size_t>()->default_value("50000"))
        ;

    add_common_options(options);

    return options;
}

void corncob::validate(const cxxopts::ParseResult& args) {
    require_file(args, "store", "-s/--store");
    require_file(args, "results", "-r/--results");

    try {
        multiple_testing::parse_method(args["fdr-method"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    double alpha = args["alpha"].as<double>();
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        throw std::runtime_error("--alpha must be in (0, 1]");
    }

    if (args["shard-rows"].as<size_t>() == 0) {
        throw std::runtime_error("--shard-rows must be at least 1");
    }

    if (args["shard-template"].as<std::string>().find("{}") == std::string::npos) {
        throw std::runtime_error("--shard-template must contain {}");
    }
}

void corncob::execute(const cxxopts::ParseResult& args) {
    logging::info("Starting corncob post-processing...");

    wide_table results = read_results(args);
    add_qvalues(results, args);

    std::string store_path = args["store"].as<std::string>();
    logging::info("Opening HDF5 store: " + store_path);
    hdf5_store store(store_path, hdf5_store::open_mode::READ_WRITE);

    data_table features;
    auto columns = prepare_annotation(store, features, args);
    write_shards(results, features, columns, args);

    // Write corncob results to HDF5
    std::string stats_path = args["stats-path"].as<std::string>();
    std::string feature_column = args["feature-column"].as<std::string>();
    store.write_table(stats_path, results.to_table(feature_column));
    logging::info("Wrote " + std::to_string(results.rows.size()) + " rows to " +
                  store_path + ":" + stats_path);

    logging::info("Corncob post-processing complete");
}

wide_table corncob::read_results(const cxxopts::ParseResult& args) {
    std::string results_path = args["results"].as<std::string>();
    std::string feature_column = args["feature-column"].as<std::string>();

    logging::info("Reading corncob results from: " + results_path);
    auto rows = stat_reader::read_all(results_path, feature_column);

    std::unordered_set<std::string> features;
    for (const auto& row : rows) {
        features.insert(row.feature);
    }
    logging::info("Read in corncob results for " + std::to_string(features.size()) +
                  " CAGs");

    result_reshaper::config cfg;
    cfg.prefix = args["prefix"].as<std::string>();
    result_reshaper reshaper(cfg);

    wide_table results = reshaper.reshape(rows);
    logging::info("Reshaped to " + std::to_string(results.rows.size()) +
                  " CAG/parameter rows");
    return results;
}

void corncob::add_qvalues(wide_table& results, const cxxopts::ParseResult& args) {
    fdr_corrector::config cfg;
    cfg.method = multiple_testing::parse_method(args["fdr-method"].as<std::string>());
    cfg.alpha = args["alpha"].as<double>();
    fdr_corrector corrector(cfg);

    auto summary = corrector.correct(results);
    if (!summary.corrected) {
        logging::info("No p_value column in results, q-values not added");
        return;
    }

    if (summary.filled > 0) {
        logging::warning(std::to_string(summary.filled) +
                         " rows without p-value were counted as p = 1");
    }
    logging::info("Added q-values (" + multiple_testing::method_name(cfg.method) + ") for " +
                  std::to_string(summary.tested) + " tests, " +
                  std::to_string(summary.significant) + " with q <= " +
                  utility::format_number(cfg.alpha));
}

std::vector<std::string> corncob::prepare_annotation(hdf5_store& store, data_table& features,
                                                     const cxxopts::ParseResult& args) {
    std::vector<std::string> columns;

    std::string annotation_path = args["annotation-path"].as<std::string>();
    if (!store.has_table(annotation_path)) {
        logging::warning("No gene annotation at " + annotation_path +
                         ", results are not split by annotation");
        return columns;
    }

    logging::info("Reading gene annotation from: " + annotation_path);
    features = store.read_table(annotation_path);
    logging::info("Read annotation for " + std::to_string(features.num_rows()) + " genes");

    // Check if we have taxonomic assignments annotating the gene catalog
    if (features.has_column("tax_id")) {
        std::string taxonomy_path = args["taxonomy-path"].as<std::string>();
        if (store.has_table(taxonomy_path)) {
            taxonomy tax = taxonomy::from_table(store.read_table(taxonomy_path));
            logging::info("Loaded " + std::to_string(tax.size()) + " taxa from " +
                          taxonomy_path);

            auto ranks = list_option(args, "ranks");
            rank_annotator annotator(tax);
            annotator.annotate(features, ranks);
            columns.insert(columns.end(), ranks.begin(), ranks.end());
        } else {
            logging::warning("No taxonomy at " + taxonomy_path +
                             ", genes are not labeled by rank");
        }
    }

    for (const auto& column : list_option(args, "annotations")) {
        if (features.has_column(column)) {
            columns.push_back(column);
        } else {
            logging::progress("Annotation column " + column + " not present, skipping");
        }
    }

    return columns;
}

void corncob::write_shards(const wide_table& results, const data_table& features,
                           const std::vector<std::string>& columns,
                           const cxxopts::ParseResult& args) {
    annotation_partitioner::config cfg;
    cfg.feature_column = args["feature-column"].as<std::string>();
    cfg.max_group_features = args["max-group-features"].as<size_t>();
    cfg.shards.output_dir = output_dir;
    cfg.shards.name_template = args["shard-template"].as<std::string>();
    cfg.shards.shard_rows = args["shard-rows"].as<size_t>();

    if (columns.empty()) {
        logging::warning("No annotation columns available, writing placeholder shard");
    } else {
        std::string joined;
        for (const auto& column : columns) {
            if (!joined.empty()) joined += ", ";
            joined += column;
        }
        logging::info("Splitting results by annotation: " + joined);
    }

    annotation_partitioner partitioner(cfg);
    auto summary = partitioner.partition(results, features, columns);

    if (summary.skipped > 0) {
        logging::warning("Skipped " + std::to_string(summary.skipped) + " of " +
                         std::to_string(summary.groups) + " annotation groups");
    }
    if (summary.placeholder) {
        logging::info("Wrote placeholder shard to " +
                      (output_dir / cfg.shards.name_template).string());
    } else {
        logging::info("Wrote " + std::to_string(summary.rows) + " rows in " +
                      std::to_string(summary.shards) + " shard(s) to " + output_dir.string());
    }
}

} // namespace subcall
