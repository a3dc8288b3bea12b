/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_ERRORS_HPP
#define CAGSTAT_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * Input that cannot be processed at all, e.g. a results table without
 * a single row of the expected parameter prefix or without its key columns.
 */
class malformed_input_error : public std::runtime_error {
public:
    explicit malformed_input_error(const std::string& message)
        : std::runtime_error(message) {}
};

#endif //CAGSTAT_ERRORS_HPP
