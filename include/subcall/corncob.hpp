/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_SUBCALL_CORNCOB_HPP
#define CAGSTAT_SUBCALL_CORNCOB_HPP

#include "subcall/subcall.hpp"

#include <string>
#include <vector>

#include "data_table.hpp"
#include "hdf5_store.hpp"
#include "result_reshaper.hpp"

namespace subcall {

/**
 * Corncob subcommand: add corncob results to the HDF5 store.
 *
 * Reshapes the long-format results into one row per CAG and parameter,
 * adds q-values, writes the table to the store and splits the results by
 * taxonomic and functional annotation into shards for the betta step.
 */
class corncob : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "corncob"; }
    std::string description() const override {
        return "Add corncob results to the HDF5 store and split them by annotation";
    }

private:
    wide_table read_results(const cxxopts::ParseResult& args);
    void add_qvalues(wide_table& results, const cxxopts::ParseResult& args);

    /**
     * Read the gene annotation and add taxonomic rank columns.
     * @return annotation columns available for partitioning
     */
    std::vector<std::string> prepare_annotation(hdf5_store& store, data_table& features,
                                                const cxxopts::ParseResult& args);

    void write_shards(const wide_table& results, const data_table& features,
                      const std::vector<std::string>& columns,
                      const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // CAGSTAT_SUBCALL_CORNCOB_HPP
