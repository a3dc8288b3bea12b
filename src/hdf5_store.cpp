/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "hdf5_store.hpp"

// standard
#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

// class
#include "utility.hpp"

namespace {

// Column names stored as a dataset; numeric names are rendered as text
std::vector<std::string> names_of(const table_column& col) {
    std::vector<std::string> names;
    names.reserve(col.size());
    for (size_t i = 0; i < col.size(); ++i) {
        names.push_back(col.text_at(i).value_or(""));
    }
    return names;
}

unsigned int access_flags(hdf5_store::open_mode mode) {
    switch (mode) {
        case hdf5_store::open_mode::READ_WRITE:
            return H5F_ACC_RDWR;
        case hdf5_store::open_mode::TRUNCATE:
            return H5F_ACC_TRUNC;
        default:
            return H5F_ACC_RDONLY;
    }
}

H5::H5File open_file(const std::string& filename, hdf5_store::open_mode mode) {
    // errors are reported through exceptions only
    H5::Exception::dontPrint();
    try {
        return H5::H5File(filename, access_flags(mode));
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Cannot open HDF5 store " + filename + ": " +
                                 e.getDetailMsg());
    }
}

} // namespace

hdf5_store::hdf5_store(const std::filesystem::path& filepath, open_mode mode)
    : filename_(filepath.string()), file_(open_file(filename_, mode)) {
}

hdf5_store::~hdf5_store() {
    try {
        file_.close();
    } catch (const H5::Exception& e) {
        logging::error("Failed to close HDF5 store " + filename_ + ": " + e.getDetailMsg());
    }
}

std::vector<std::string> hdf5_store::split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

bool hdf5_store::exists(const std::string& path) const {
    // nameExists fails on a missing intermediate group, so walk the path
    std::string current;
    for (const auto& part : split_path(path)) {
        current += "/" + part;
        if (!file_.nameExists(current)) {
            return false;
        }
    }
    return !current.empty();
}

bool hdf5_store::has_table(const std::string& path) const {
    try {
        return exists(path) && file_.childObjType(path) == H5O_TYPE_GROUP;
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Cannot inspect " + path + " in " + filename_ + ": " +
                                 e.getDetailMsg());
    }
}

data_table hdf5_store::read_table(const std::string& path) const {
    if (!has_table(path)) {
        throw std::runtime_error("Table " + path + " not found in " + filename_);
    }

    try {
        H5::Group group = file_.openGroup(path);

        if (is_pandas_frame(group)) {
            return read_pandas_frame(group);
        }

        std::vector<std::string> names;
        if (group.attrExists("columns")) {
            H5::Attribute attr = group.openAttribute("columns");
            H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
            std::string joined;
            attr.read(str_type, joined);
            names = utility::split_list(joined, '\t');
        } else {
            for (hsize_t i = 0; i < group.getNumObjs(); ++i) {
                std::string name = group.getObjnameByIdx(i);
                if (group.childObjType(name) == H5O_TYPE_DATASET) {
                    names.push_back(name);
                }
            }
        }

        data_table table;
        for (const auto& name : names) {
            table.add_column(read_column(group, name));
        }
        return table;
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to read table " + path + " from " + filename_ +
                                 ": " + e.getDetailMsg());
    }
}

bool hdf5_store::is_pandas_frame(const H5::Group& group) {
    return group.nameExists("axis0") && group.nameExists("block0_items") &&
           group.nameExists("block0_values");
}

data_table hdf5_store::read_pandas_frame(const H5::Group& group) {
    // pandas "fixed" format: axis0 = column names, axis1 = row index,
    // blockN_items / blockN_values = the columns of one dtype block
    auto order = names_of(read_column(group, "axis0"));
    hsize_t rows = dataset_length(group.openDataSet("axis1"));

    std::unordered_map<std::string, table_column> columns;
    for (size_t block = 0; ; ++block) {
        std::string prefix = "block" + std::to_string(block);
        if (!group.nameExists(prefix + "_items")) {
            break;
        }
        auto items = names_of(read_column(group, prefix + "_items"));
        for (auto& col : read_block(group.openDataSet(prefix + "_values"), items, rows)) {
            columns[col.name] = std::move(col);
        }
    }

    data_table table;
    for (const auto& name : order) {
        auto it = columns.find(name);
        if (it == columns.end()) {
            throw std::runtime_error("Column '" + name + "' is listed in axis0 but not "
                                     "stored in any block");
        }
        table.add_column(std::move(it->second));
    }
    return table;
}

std::vector<table_column> hdf5_store::read_block(const H5::DataSet& dataset,
                                                 const std::vector<std::string>& items,
                                                 hsize_t rows) {
    if (items.empty()) {
        return {};
    }

    H5::DataSpace space = dataset.getSpace();
    const hsize_t width = items.size();

    hsize_t dims[2] = {0, 0};
    if (space.getSimpleExtentNdims() != 2) {
        throw std::runtime_error("Block of columns '" + items.front() +
                                 "'... is not two-dimensional");
    }
    space.getSimpleExtentDims(dims);

    // pandas writes blocks transposed (rows x items); also accept items x rows
    bool row_major;
    if (dims[0] == rows && dims[1] == width) {
        row_major = true;
    } else if (dims[0] == width && dims[1] == rows) {
        row_major = false;
    } else {
        throw std::runtime_error("Block of columns '" + items.front() + "'... has shape " +
                                 std::to_string(dims[0]) + "x" + std::to_string(dims[1]) +
                                 ", expected " + std::to_string(rows) + "x" +
                                 std::to_string(width));
    }

    auto cell = [&](hsize_t row, hsize_t item) {
        return row_major ? row * width + item : item * rows + row;
    };

    std::vector<table_column> columns;
    switch (dataset.getTypeClass()) {
        case H5T_INTEGER:
        case H5T_FLOAT: {
            auto values = read_numbers(dataset, rows * width);
            for (hsize_t item = 0; item < width; ++item) {
                std::vector<double> column(rows);
                for (hsize_t row = 0; row < rows; ++row) {
                    column[row] = values[cell(row, item)];
                }
                columns.push_back(table_column::numeric_column(items[item], std::move(column)));
            }
            break;
        }
        case H5T_STRING: {
            auto values = read_strings(dataset, rows * width);
            for (hsize_t item = 0; item < width; ++item) {
                std::vector<std::string> column(rows);
                for (hsize_t row = 0; row < rows; ++row) {
                    column[row] = std::move(values[cell(row, item)]);
                }
                columns.push_back(table_column::text_column(items[item], std::move(column)));
            }
            break;
        }
        default:
            throw std::runtime_error("Block of columns '" + items.front() +
                                     "'... holds Python objects; store text columns as "
                                     "fixed-width strings or use this tool's table layout");
    }
    return columns;
}

hsize_t hdf5_store::dataset_length(const H5::DataSet& dataset) {
    H5::DataSpace space = dataset.getSpace();
    if (space.getSimpleExtentNdims() != 1) {
        throw std::runtime_error("Dataset is not one-dimensional");
    }
    hsize_t rows = 0;
    space.getSimpleExtentDims(&rows);
    return rows;
}

std::vector<double> hdf5_store::read_numbers(const H5::DataSet& dataset, hsize_t count) {
    std::vector<double> values(count);
    if (count > 0) {
        dataset.read(values.data(), H5::PredType::NATIVE_DOUBLE);
    }
    return values;
}

std::vector<std::string> hdf5_store::read_strings(const H5::DataSet& dataset, hsize_t count) {
    H5::StrType file_type = dataset.getStrType();
    std::vector<std::string> values;
    values.reserve(count);
    if (count == 0) {
        return values;
    }

    if (file_type.isVariableStr()) {
        H5::StrType mem_type(H5::PredType::C_S1, H5T_VARIABLE);
        mem_type.setCset(file_type.getCset());
        std::vector<char*> buffer(count, nullptr);
        dataset.read(buffer.data(), mem_type);
        for (char* value : buffer) {
            values.emplace_back(value ? value : "");
        }
        H5::DataSpace space = dataset.getSpace();
        H5::DataSet::vlenReclaim(buffer.data(), mem_type, space);
    } else {
        size_t width = file_type.getSize();
        std::vector<char> buffer(count * width);
        dataset.read(buffer.data(), file_type);
        for (hsize_t i = 0; i < count; ++i) {
            const char* start = buffer.data() + i * width;
            values.emplace_back(start, strnlen(start, width));
        }
    }
    return values;
}

table_column hdf5_store::read_column(const H5::Group& group, const std::string& name) {
    H5::DataSet dataset = group.openDataSet(name);
    if (dataset.getSpace().getSimpleExtentNdims() != 1) {
        throw std::runtime_error("Column '" + name + "' is not one-dimensional");
    }
    hsize_t rows = dataset_length(dataset);

    switch (dataset.getTypeClass()) {
        case H5T_INTEGER:
        case H5T_FLOAT:
            return table_column::numeric_column(name, read_numbers(dataset, rows));
        case H5T_STRING:
            return table_column::text_column(name, read_strings(dataset, rows));
        default:
            throw std::runtime_error("Column '" + name + "' has an unsupported data type");
    }
}

void hdf5_store::create_parent_groups(const std::string& path) {
    auto parts = split_path(path);
    std::string current;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        current += "/" + parts[i];
        if (!file_.nameExists(current)) {
            file_.createGroup(current);
        }
    }
}

void hdf5_store::write_table(const std::string& path, const data_table& table) {
    if (split_path(path).empty()) {
        throw std::runtime_error("Invalid table path: '" + path + "'");
    }

    try {
        if (exists(path)) {
            file_.unlink(path);
        }
        create_parent_groups(path);

        H5::Group group = file_.createGroup(path);
        std::string joined;
        for (const auto& col : table.columns()) {
            write_column(group, col);
            if (!joined.empty()) joined += '\t';
            joined += col.name;
        }

        H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
        H5::DataSpace scalar_space(H5S_SCALAR);
        H5::Attribute columns_attr = group.createAttribute("columns", str_type, scalar_space);
        columns_attr.write(str_type, joined);

        file_.flush(H5F_SCOPE_GLOBAL);
    } catch (const H5::Exception& e) {
        throw std::runtime_error("Failed to write table " + path + " to " + filename_ +
                                 ": " + e.getDetailMsg());
    }
}

void hdf5_store::write_column(H5::Group& group, const table_column& col) {
    if (col.name.empty() || col.name.find('/') != std::string::npos) {
        throw std::runtime_error("Invalid column name: '" + col.name + "'");
    }

    hsize_t dims[1] = {static_cast<hsize_t>(col.size())};
    H5::DataSpace dataspace(1, dims);

    // Set up compression
    H5::DSetCreatPropList plist;
    if (dims[0] > 0) {
        hsize_t chunk_dims[1] = {std::min<hsize_t>(dims[0], 10000)};
        plist.setChunk(1, chunk_dims);
        plist.setDeflate(6);
    }

    if (col.numeric) {
        H5::DataSet dataset = group.createDataSet(col.name, H5::PredType::NATIVE_DOUBLE,
                                                  dataspace, plist);
        if (dims[0] > 0) {
            dataset.write(col.numbers.data(), H5::PredType::NATIVE_DOUBLE);
        }
        return;
    }

    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    H5::DataSet dataset = group.createDataSet(col.name, str_type, dataspace, plist);
    if (dims[0] > 0) {
        std::vector<const char*> pointers;
        pointers.reserve(col.text.size());
        for (const auto& value : col.text) {
            pointers.push_back(value.c_str());
        }
        dataset.write(pointers.data(), str_type);
    }
}
