/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_TEST_HELPERS_HPP
#define CAGSTAT_TEST_HELPERS_HPP

#include <gtest/gtest.h>
#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace test_helpers {

// Fixture owning a fresh scratch directory, removed after each test
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        std::random_device rd;
        dir = std::filesystem::temp_directory_path() /
              ("cagstat_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path write_text(const std::string& name, const std::string& content) {
        auto path = dir / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path write_gz(const std::string& name, const std::string& content) {
        auto path = dir / name;
        gzFile out = gzopen(path.string().c_str(), "wb");
        EXPECT_NE(out, nullptr);
        gzwrite(out, content.data(), static_cast<unsigned int>(content.size()));
        gzclose(out);
        return path;
    }
};

// All lines of a (possibly gzip-compressed) text file
inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    gzFile in = gzopen(path.string().c_str(), "rb");
    if (!in) {
        ADD_FAILURE() << "cannot open " << path;
        return lines;
    }

    std::string current;
    char buffer[4096];
    int n;
    while ((n = gzread(in, buffer, sizeof(buffer))) > 0) {
        for (int i = 0; i < n; ++i) {
            if (buffer[i] == '\n') {
                lines.push_back(current);
                current.clear();
            } else {
                current += buffer[i];
            }
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    gzclose(in);
    return lines;
}

} // namespace test_helpers

#endif //CAGSTAT_TEST_HELPERS_HPP
