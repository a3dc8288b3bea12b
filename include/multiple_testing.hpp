/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_MULTIPLE_TESTING_HPP
#define CAGSTAT_MULTIPLE_TESTING_HPP

// standard
#include <string>
#include <vector>

namespace multiple_testing {

enum class method {
    BONFERRONI,
    SIDAK,
    HOLM,
    HOLM_SIDAK,
    SIMES_HOCHBERG,
    FDR_BH,          // Benjamini-Hochberg
    FDR_BY           // Benjamini-Yekutieli
};

/**
 * Parse a method name as accepted by statsmodels' multipletests
 * (fdr_bh, fdr_by, bonferroni, sidak, holm, holm-sidak, simes-hochberg and
 * their short aliases), case insensitive.
 * @throws std::invalid_argument for an unknown name
 */
method parse_method(const std::string& name);

std::string method_name(method m);

/**
 * Adjusted p-values, in the same order as the input.
 * @throws std::invalid_argument if a p-value is NaN
 */
std::vector<double> adjust(const std::vector<double>& pvals, method m);

} // namespace multiple_testing

#endif //CAGSTAT_MULTIPLE_TESTING_HPP
