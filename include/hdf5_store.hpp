/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef CAGSTAT_HDF5_STORE_HPP
#define CAGSTAT_HDF5_STORE_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

// HDF5
#include <H5Cpp.h>

// class
#include "data_table.hpp"

/**
 * Columnar tables inside an HDF5 file.
 *
 * A table is a group, each column a one-dimensional dataset of equal length:
 * numeric columns as native doubles, text columns as variable-length strings.
 * Integer and fixed-length string datasets are accepted on read. The group
 * attribute "columns" (tab separated names) keeps the column order; groups
 * without it are read in link name order.
 *
 * Frames written by pandas in its fixed format (axis0, axis1, blockN_items,
 * two-dimensional blockN_values) are read as well, in axis0 column order.
 * Blocks of pickled Python objects cannot be read.
 *
 * Layout:
 *   /ref/taxonomy          tax_id, parent, name, rank
 *   /annot/gene/all        CAG, tax_id, eggNOG_desc, ...
 *   /stats/cag/corncob     written by the corncob subcommand
 */
class hdf5_store {
public:
    enum class open_mode {
        READ_ONLY,
        READ_WRITE,
        TRUNCATE       // create or overwrite
    };

    explicit hdf5_store(const std::filesystem::path& filepath,
                        open_mode mode = open_mode::READ_ONLY);
    ~hdf5_store();

    hdf5_store(const hdf5_store&) = delete;
    hdf5_store& operator=(const hdf5_store&) = delete;

    bool has_table(const std::string& path) const;

    /**
     * @throws std::runtime_error if the group is missing or holds a column
     *         that is not one-dimensional or of an unsupported type
     */
    data_table read_table(const std::string& path) const;

    // Replaces whatever is stored at path; intermediate groups are created
    void write_table(const std::string& path, const data_table& table);

private:
    std::string filename_;
    H5::H5File file_;

    bool exists(const std::string& path) const;
    void create_parent_groups(const std::string& path);

    static table_column read_column(const H5::Group& group, const std::string& name);
    static hsize_t dataset_length(const H5::DataSet& dataset);
    static std::vector<double> read_numbers(const H5::DataSet& dataset, hsize_t count);
    static std::vector<std::string> read_strings(const H5::DataSet& dataset, hsize_t count);

    static bool is_pandas_frame(const H5::Group& group);
    static data_table read_pandas_frame(const H5::Group& group);
    static std::vector<table_column> read_block(const H5::DataSet& dataset,
                                                const std::vector<std::string>& items,
                                                hsize_t rows);
    static void write_column(H5::Group& group, const table_column& col);
    static std::vector<std::string> split_path(const std::string& path);
};

#endif //CAGSTAT_HDF5_STORE_HPP
