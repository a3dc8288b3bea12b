/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_SUBCALL_HPP
#define CAGSTAT_SUBCALL_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>

namespace subcall {

/**
 * Abstract base class for all cagstat subcommands.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Parse command-line arguments and return the options object.
     * The subclass defines its own options here.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Execute the subcommand.
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → execute.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add common options shared across all subcommands.
     * Call this in parse_args() implementations.
     */
    static void add_common_options(cxxopts::Options& options);

    /**
     * Get the subcommand name (for help text).
     */
    virtual std::string name() const = 0;

    /**
     * Get brief description (for help text).
     */
    virtual std::string description() const = 0;

protected:
    std::filesystem::path output_dir;

    /**
     * Resolve the output directory from --output-dir or the working directory.
     * Creates the directory if it doesn't exist.
     */
    std::filesystem::path resolve_output_dir(const cxxopts::ParseResult& args) const;

    // Comma separated option value as a list
    static std::vector<std::string> list_option(const cxxopts::ParseResult& args,
                                                const std::string& name);

    // Throws if a required path option is missing or does not exist
    static void require_file(const cxxopts::ParseResult& args, const std::string& option,
                             const std::string& flag);

private:
    /**
     * Apply common options (progress, output directory)
     */
    void apply_common_options(const cxxopts::ParseResult& args);
};

/**
 * Create the subcommand registered under name, nullptr if unknown.
 */
std::unique_ptr<subcall> create(const std::string& name);

// Names of all registered subcommands, in help order
std::vector<std::string> available();

} // namespace subcall

#endif // CAGSTAT_SUBCALL_HPP
