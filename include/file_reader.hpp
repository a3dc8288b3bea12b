/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_FILE_READER_HPP
#define CAGSTAT_FILE_READER_HPP

// standard
#include <cstddef>
#include <filesystem>
#include <string>

// zlib
#include <zlib.h>

/**
 * Line source shared by all text readers. Plain and gzip-compressed files
 * are both opened through zlib; trailing CR/LF is stripped from each line.
 */
class file_reader_base {
    public:
        explicit file_reader_base(const std::filesystem::path& filepath);
        virtual ~file_reader_base();

        file_reader_base(const file_reader_base&) = delete;
        file_reader_base& operator=(const file_reader_base&) = delete;

        bool has_next() const { return !eof_reached; }

        // Line number of the last line read (for error reporting)
        size_t get_current_line() const { return line_num; }

        const std::string& get_path() const { return path; }

    protected:
        /**
         * Read the next line, false at end of file
         * @throws std::runtime_error on a read or decompression error
         */
        bool read_line(std::string& line);

    private:
        gzFile file;
        std::string path;
        size_t line_num;
        bool eof_reached;
};

// Templated derived class for type-specific reading
template<typename EntryType>
class file_reader : public file_reader_base {
    public:
        using file_reader_base::file_reader_base;

        virtual bool read_next(EntryType& entry) = 0;
};

#endif //CAGSTAT_FILE_READER_HPP
