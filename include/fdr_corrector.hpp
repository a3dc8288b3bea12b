/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_FDR_CORRECTOR_HPP
#define CAGSTAT_FDR_CORRECTOR_HPP

// standard
#include <cstddef>

// class
#include "multiple_testing.hpp"
#include "result_reshaper.hpp"

/**
 * Adds q-values to a wide_table that carries a p_value column.
 *
 * Rows without a p-value enter the correction as 1.0 and therefore count
 * towards the number of tests. Tables without a p_value column are left
 * untouched (no q_value column).
 */
class fdr_corrector {
public:
    struct config {
        multiple_testing::method method = multiple_testing::method::FDR_BH;
        double alpha = 0.2;         // target rate, reported as number of rows passing
    };

    /**
     * Summary of one correction
     */
    struct summary {
        bool corrected = false;     // false when the table had no p_value column
        size_t tested = 0;
        size_t filled = 0;          // rows whose missing p-value was set to 1.0
        size_t significant = 0;     // q_value <= alpha
    };

    fdr_corrector() : fdr_corrector(config{}) {}
    explicit fdr_corrector(const config& cfg);

    summary correct(wide_table& table) const;

private:
    config cfg;
};

#endif //CAGSTAT_FDR_CORRECTOR_HPP
