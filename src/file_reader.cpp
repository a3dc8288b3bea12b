/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "file_reader.hpp"

// standard
#include <stdexcept>

file_reader_base::file_reader_base(const std::filesystem::path& filepath)
    : file(nullptr), path(filepath.string()), line_num(0), eof_reached(false) {

    // gzopen reads uncompressed files transparently
    file = gzopen(path.c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
}

file_reader_base::~file_reader_base() {
    if (file) {
        gzclose(file);
    }
}

bool file_reader_base::read_line(std::string& line) {
    line.clear();
    if (eof_reached) {
        return false;
    }

    char buffer[8192];
    while (gzgets(file, buffer, sizeof(buffer)) != nullptr) {
        line.append(buffer);
        if (!line.empty() && line.back() == '\n') {
            break;
        }
    }

    if (line.empty()) {
        int errnum = Z_OK;
        const char* message = gzerror(file, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Error reading " + path + ": " + message);
        }
        eof_reached = true;
        return false;
    }

    line_num++;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return true;
}
