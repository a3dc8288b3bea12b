/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>
#include <stdexcept>

#include "utility.hpp"
#include "subcall/corncob.hpp"
#include "subcall/lineage.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("o,output-dir", "Output directory for results (default: current directory)",
            cxxopts::value<std::string>())
        ("progress", "Show progress output")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }
    output_dir = resolve_output_dir(args);
}

std::filesystem::path subcall::resolve_output_dir(const cxxopts::ParseResult& args) const {
    std::filesystem::path dir;

    if (args.count("output-dir")) {
        dir = args["output-dir"].as<std::string>();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<std::string> subcall::list_option(const cxxopts::ParseResult& args,
                                              const std::string& name) {
    return utility::split_list(args[name].as<std::string>());
}

void subcall::require_file(const cxxopts::ParseResult& args, const std::string& option,
                           const std::string& flag) {
    if (!args.count(option)) {
        throw std::runtime_error("Missing required option " + flag);
    }
    std::string path = args[option].as<std::string>();
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("File not found: " + path);
    }
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

std::unique_ptr<subcall> create(const std::string& name) {
    if (name == "corncob") {
        return std::make_unique<corncob>();
    }
    if (name == "lineage") {
        return std::make_unique<lineage>();
    }
    return nullptr;
}

std::vector<std::string> available() {
    return {"corncob", "lineage"};
}

} // namespace subcall
