/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_SUBCALL_LINEAGE_HPP
#define CAGSTAT_SUBCALL_LINEAGE_HPP

#include "subcall/subcall.hpp"

#include <string>

namespace subcall {

/**
 * Lineage subcommand: print the ancestor chain and rank names of taxa
 * from the taxonomy stored in an HDF5 store.
 */
class lineage : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "lineage"; }
    std::string description() const override {
        return "Show the lineage of taxa in the stored taxonomy";
    }
};

} // namespace subcall

#endif // CAGSTAT_SUBCALL_LINEAGE_HPP
