/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static bool show_progress = false;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        std::cout << "[CAGSTAT] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::cout << YELLOW << "[CAGSTAT] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::cerr << RED << "[CAGSTAT] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void progress(const std::string& message) {
        if (!show_progress) return;
        std::cout << "[CAGSTAT] " << get_timestamp() << " - " << message << std::endl;
    }

    void set_progress_enabled(bool enabled) {
        show_progress = enabled;
    }
}

namespace utility {
    std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

    std::vector<std::string> split_list(const std::string& value, char delim) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;

        while (std::getline(ss, item, delim)) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    std::vector<std::string> split_csv(const std::string& line, char delim) {
        std::vector<std::string> fields;
        std::string field;
        bool quoted = false;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        quoted = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == '"') {
                quoted = true;
            } else if (c == delim) {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field += c;
            }
        }
        fields.push_back(std::move(field));
        return fields;
    }

    std::string csv_field(const std::string& value, char delim) {
        if (value.find_first_of(std::string("\"\r\n") + delim) == std::string::npos) {
            return value;
        }
        std::string quoted = "\"";
        for (char c : value) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    double parse_number(const std::string& cell) {
        std::string value = trim(cell);
        if (value.empty() || value == "NA" || value == "NaN" || value == "nan" ||
            value == "NULL" || value == ".") {
            return std::nan("");
        }

        char* end = nullptr;
        double parsed = std::strtod(value.c_str(), &end);
        if (end != value.c_str() + value.size()) {
            throw std::invalid_argument("Not a number: '" + cell + "'");
        }
        return parsed;
    }

    std::string format_number(double value) {
        if (std::isnan(value)) {
            return "";
        }
        char buffer[64];
        auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        if (ec != std::errc()) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }
        return std::string(buffer, ptr);
    }
}
