/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iostream>
#include <string>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/subcall.hpp"

void showVersion(std::ostream& _str) {
    _str << "cagstat v" << cagstat_VERSION_MAJOR;
    _str << "." << cagstat_VERSION_MINOR << ".";
    _str << cagstat_VERSION_PATCH << " - ";
    _str << "Post-process per-CAG regression results";
    _str << std::endl;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: cagstat <subcommand> [options]" << std::endl << std::endl;
    _str << "Subcommands:" << std::endl;
    for (const auto& name : subcall::available()) {
        auto cmd = subcall::create(name);
        _str << "  " << name << "\t" << cmd->description() << std::endl;
    }
    _str << std::endl;
    _str << "  -h, --help     Print help message" << std::endl;
    _str << "  -v, --version  Print version number" << std::endl;
    _str << std::endl;
    _str << "Run 'cagstat <subcommand> --help' for subcommand options." << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        showUsage(std::cerr);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(std::cout);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        showVersion(std::cout);
        return 0;
    }

    try {
        auto cmd = subcall::create(command);
        if (!cmd) {
            logging::error("Unknown subcommand: " + command);
            showUsage(std::cerr);
            return 1;
        }

        // parse the remaining arguments with the subcommand's options
        auto options = cmd->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cmd->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
