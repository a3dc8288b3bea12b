/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "shard_writer.hpp"

// standard
#include <stdexcept>

// zlib
#include <zlib.h>

// class
#include "utility.hpp"

namespace {

std::string join_record(const std::vector<std::string>& fields) {
    std::string record;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) record += ',';
        record += utility::csv_field(fields[i]);
    }
    return record;
}

} // namespace

shard_writer::shard_writer(std::vector<std::string> header, const config& cfg)
    : header(std::move(header)), cfg(cfg) {

    if (cfg.shard_rows == 0) {
        throw std::invalid_argument("Shard size must be at least one row");
    }
    if (cfg.name_template.find("{}") == std::string::npos) {
        throw std::invalid_argument("Shard name template has no '{}' placeholder: " +
                                    cfg.name_template);
    }
}

std::filesystem::path shard_writer::shard_path(size_t index) const {
    std::string name = cfg.name_template;
    name.replace(name.find("{}"), 2, std::to_string(index));
    return cfg.output_dir / name;
}

void shard_writer::add(const std::vector<std::string>& fields) {
    buffer.push_back(join_record(fields));
    if (buffer.size() >= cfg.shard_rows) {
        flush();
    }
}

void shard_writer::finish() {
    if (!buffer.empty()) {
        flush();
    }
}

void shard_writer::flush() {
    write_file(header, buffer);
    total_rows += buffer.size();
    buffer.clear();
}

void shard_writer::write_placeholder() {
    if (shard_index != 0) {
        throw std::logic_error("Placeholder shard requested after " +
                               std::to_string(shard_index) + " shard(s) were written");
    }
    write_file({"estimate", "p_value", "parameter"}, {"1,1,dummy"});
}

void shard_writer::write_file(const std::vector<std::string>& columns,
                              const std::vector<std::string>& records) {
    std::filesystem::path path = shard_path(shard_index);

    std::string content = join_record(columns) + "\n";
    for (const auto& record : records) {
        content += record;
        content += '\n';
    }

    gzFile out = gzopen(path.string().c_str(), "wb");
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }

    int written = content.empty() ? 0
        : gzwrite(out, content.data(), static_cast<unsigned int>(content.size()));
    if (written != static_cast<int>(content.size())) {
        int errnum = Z_OK;
        std::string message = gzerror(out, &errnum);
        gzclose(out);
        throw std::runtime_error("Failed to write " + path.string() + ": " + message);
    }
    if (gzclose(out) != Z_OK) {
        throw std::runtime_error("Failed to close " + path.string());
    }

    logging::progress("  Wrote " + std::to_string(records.size()) + " rows to " +
                      path.string());
    files.push_back(path);
    shard_index++;
}
