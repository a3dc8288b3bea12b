/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "multiple_testing.hpp"

// standard
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace multiple_testing {

method parse_method(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
        [](unsigned char c) { return std::tolower(c); });

    if (key == "fdr_bh" || key == "fdr_i" || key == "fdr_p" || key == "fdri" || key == "fdrp") {
        return method::FDR_BH;
    }
    if (key == "fdr_by" || key == "fdr_n" || key == "fdr_c" || key == "fdrn" || key == "fdrcorr") {
        return method::FDR_BY;
    }
    if (key == "bonferroni" || key == "b") return method::BONFERRONI;
    if (key == "sidak" || key == "s") return method::SIDAK;
    if (key == "holm" || key == "h") return method::HOLM;
    if (key == "holm-sidak" || key == "hs") return method::HOLM_SIDAK;
    if (key == "simes-hochberg" || key == "sh") return method::SIMES_HOCHBERG;

    throw std::invalid_argument("Unknown multiple testing method: " + name +
                                " (expected fdr_bh, fdr_by, bonferroni, sidak, holm,"
                                " holm-sidak or simes-hochberg)");
}

std::string method_name(method m) {
    switch (m) {
        case method::BONFERRONI: return "bonferroni";
        case method::SIDAK: return "sidak";
        case method::HOLM: return "holm";
        case method::HOLM_SIDAK: return "holm-sidak";
        case method::SIMES_HOCHBERG: return "simes-hochberg";
        case method::FDR_BH: return "fdr_bh";
        case method::FDR_BY: return "fdr_by";
    }
    return "unknown";
}

std::vector<double> adjust(const std::vector<double>& pvals, method m) {
    const size_t n = pvals.size();
    if (n == 0) return {};

    for (double p : pvals) {
        if (std::isnan(p)) {
            throw std::invalid_argument("Cannot adjust NaN p-values");
        }
    }

    const double ntests = static_cast<double>(n);
    std::vector<double> adjusted(n);

    // single-step methods need no ordering
    if (m == method::BONFERRONI) {
        for (size_t i = 0; i < n; ++i) {
            adjusted[i] = std::min(pvals[i] * ntests, 1.0);
        }
        return adjusted;
    }
    if (m == method::SIDAK) {
        for (size_t i = 0; i < n; ++i) {
            adjusted[i] = -std::expm1(ntests * std::log1p(-pvals[i]));
        }
        return adjusted;
    }

    // ascending order of p-values, ties keep input order
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&pvals](size_t a, size_t b) { return pvals[a] < pvals[b]; });

    switch (m) {
        case method::HOLM:
        case method::HOLM_SIDAK: {
            // step-down: running maximum from the smallest p-value
            double running_max = 0.0;
            for (size_t rank = 0; rank < n; ++rank) {
                size_t idx = order[rank];
                double remaining = static_cast<double>(n - rank);
                double value = (m == method::HOLM)
                    ? pvals[idx] * remaining
                    : -std::expm1(std::log1p(-pvals[idx]) * remaining);
                running_max = std::max(running_max, value);
                adjusted[idx] = std::min(running_max, 1.0);
            }
            break;
        }
        case method::SIMES_HOCHBERG:
        case method::FDR_BH:
        case method::FDR_BY: {
            double harmonic = 1.0;
            if (m == method::FDR_BY) {
                harmonic = 0.0;
                for (size_t k = 1; k <= n; ++k) {
                    harmonic += 1.0 / static_cast<double>(k);
                }
            }

            // step-up: running minimum from the largest p-value
            double running_min = 1.0;
            for (size_t i = n; i > 0; --i) {
                size_t idx = order[i - 1];
                double value = (m == method::SIMES_HOCHBERG)
                    ? pvals[idx] * static_cast<double>(n - i + 1)
                    : pvals[idx] * ntests * harmonic / static_cast<double>(i);
                running_min = std::min(running_min, value);
                adjusted[idx] = running_min;
            }
            break;
        }
        default:
            break;
    }

    return adjusted;
}

} // namespace multiple_testing
