/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "fdr_corrector.hpp"

// standard
#include <vector>

fdr_corrector::fdr_corrector(const config& cfg) : cfg(cfg) {}

fdr_corrector::summary fdr_corrector::correct(wide_table& table) const {
    summary result;
    if (!table.has_column("p_value")) {
        return result;
    }

    std::vector<double> pvals;
    pvals.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        auto p = row.p_value();
        if (!p) {
            result.filled++;
        }
        pvals.push_back(p.value_or(1.0));
    }

    auto qvals = multiple_testing::adjust(pvals, cfg.method);
    for (size_t i = 0; i < table.rows.size(); ++i) {
        table.rows[i].q_value = qvals[i];
        if (qvals[i] <= cfg.alpha) {
            result.significant++;
        }
    }

    table.has_q_value = true;
    result.corrected = true;
    result.tested = pvals.size();
    return result;
}
