/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_SHARD_WRITER_HPP
#define CAGSTAT_SHARD_WRITER_HPP

// standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/**
 * Writes CSV records into a numbered series of gzip-compressed files.
 *
 * A shard is written as soon as it holds shard_rows records and is never
 * reopened; finish() writes the remaining partial shard. File names come
 * from name_template with "{}" replaced by the zero-based shard index.
 */
class shard_writer {
public:
    struct config {
        std::filesystem::path output_dir = ".";
        std::string name_template = "corncob.for.betta.{}.csv.gz";
        size_t shard_rows = 10000;
    };

    shard_writer(std::vector<std::string> header, const config& cfg);

    // Append one record; fields are quoted as needed
    void add(const std::vector<std::string>& fields);

    // Write the last partial shard, if any
    void finish();

    /**
     * Write shard 0 with a single dummy row (estimate=1, p_value=1,
     * parameter=dummy) so downstream steps always find one file.
     * Only valid before any shard was written.
     */
    void write_placeholder();

    std::filesystem::path shard_path(size_t index) const;

    size_t shards_written() const { return shard_index; }
    size_t rows_written() const { return total_rows; }
    const std::vector<std::filesystem::path>& written_files() const { return files; }

private:
    std::vector<std::string> header;
    config cfg;
    std::vector<std::string> buffer;     // rendered records of the open shard
    size_t shard_index = 0;
    size_t total_rows = 0;
    std::vector<std::filesystem::path> files;

    void flush();
    void write_file(const std::vector<std::string>& columns,
                    const std::vector<std::string>& records);
};

#endif //CAGSTAT_SHARD_WRITER_HPP
