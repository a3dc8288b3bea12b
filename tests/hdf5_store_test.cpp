/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of cagstat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include "hdf5_store.hpp"
#include "test_helpers.hpp"

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

data_table make_annotation() {
    data_table table;
    table.add_column(table_column::text_column("gene", {"g1", "g2", "g3"}));
    table.add_column(table_column::numeric_column("CAG", {0, 0, 1}));
    table.add_column(table_column::numeric_column("tax_id", {562, NaN, 1280}));
    table.add_column(table_column::text_column("eggNOG_desc", {"kinase", "", "a, b"}));
    return table;
}

// fixed-width strings as pandas/PyTables store them ("S" dtype)
void write_fixed_strings(H5::Group& group, const std::string& name,
                         const std::vector<std::string>& values,
                         const std::vector<hsize_t>& dims) {
    size_t width = 1;
    for (const auto& value : values) {
        width = std::max(width, value.size());
    }
    std::vector<char> buffer(values.size() * width, '\0');
    for (size_t i = 0; i < values.size(); ++i) {
        std::copy(values[i].begin(), values[i].end(), buffer.begin() + i * width);
    }

    H5::StrType type(H5::PredType::C_S1, width);
    H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
    H5::DataSet dataset = group.createDataSet(name, type, space);
    dataset.write(buffer.data(), type);
}

void write_doubles(H5::Group& group, const std::string& name, const std::vector<double>& values,
                   const std::vector<hsize_t>& dims) {
    H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
    H5::DataSet dataset = group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space);
    dataset.write(values.data(), H5::PredType::NATIVE_DOUBLE);
}

void write_int64(H5::Group& group, const std::string& name, const std::vector<int64_t>& values,
                 const std::vector<hsize_t>& dims) {
    H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
    H5::DataSet dataset = group.createDataSet(name, H5::PredType::NATIVE_INT64, space);
    dataset.write(values.data(), H5::PredType::NATIVE_INT64);
}

/**
 * Gene annotation in pandas' fixed layout:
 *   axis0          CAG, tax_id, eggNOG_desc     (column order)
 *   axis1          0, 1, 2                      (row index)
 *   block0_items   tax_id, CAG                  (float block, rows x items)
 *   block1_items   eggNOG_desc                  (string block, rows x items)
 */
void write_pandas_annotation(const std::filesystem::path& path) {
    H5::H5File file(path.string(), H5F_ACC_TRUNC);
    file.createGroup("/annot");
    file.createGroup("/annot/gene");
    H5::Group group = file.createGroup("/annot/gene/all");

    write_fixed_strings(group, "axis0", {"CAG", "tax_id", "eggNOG_desc"}, {3});
    write_int64(group, "axis1", {0, 1, 2}, {3});
    write_fixed_strings(group, "block0_items", {"tax_id", "CAG"}, {2});
    write_doubles(group, "block0_values", {562, 0, NaN, 0, 1280, 1}, {3, 2});
    write_fixed_strings(group, "block1_items", {"eggNOG_desc"}, {1});
    write_fixed_strings(group, "block1_values", {"kinase", "", "ABC transporter"}, {3, 1});
}

} // namespace

class Hdf5StoreTest : public test_helpers::TempDirTest {
protected:
    std::filesystem::path store_path() const { return dir / "store.h5"; }
};

TEST_F(Hdf5StoreTest, RoundTripKeepsValuesAndColumnOrder) {
    {
        hdf5_store store(store_path(), hdf5_store::open_mode::TRUNCATE);
        store.write_table("/annot/gene/all", make_annotation());
    }

    hdf5_store store(store_path(), hdf5_store::open_mode::READ_ONLY);
    ASSERT_TRUE(store.has_table("/annot/gene/all"));
    auto table = store.read_table("/annot/gene/all");

    EXPECT_EQ(table.column_names(),
              (std::vector<std::string>{"gene", "CAG", "tax_id", "eggNOG_desc"}));
    ASSERT_EQ(table.num_rows(), 3u);

    EXPECT_FALSE(table.column("gene").numeric);
    EXPECT_EQ(table.column("gene").text_at(2), "g3");
    EXPECT_TRUE(table.column("tax_id").numeric);
    EXPECT_DOUBLE_EQ(table.column("tax_id").numbers[0], 562);
    EXPECT_TRUE(std::isnan(table.column("tax_id").numbers[1]));
    EXPECT_EQ(table.column("eggNOG_desc").text_at(1), std::nullopt);
    EXPECT_EQ(table.column("eggNOG_desc").text_at(2), "a, b");
}

TEST_F(Hdf5StoreTest, WriteReplacesExistingTable) {
    hdf5_store store(store_path(), hdf5_store::open_mode::TRUNCATE);
    store.write_table("/stats/cag/corncob", make_annotation());

    data_table smaller;
    smaller.add_column(table_column::text_column("CAG", {"5"}));
    store.write_table("/stats/cag/corncob", smaller);

    auto table = store.read_table("/stats/cag/corncob");
    EXPECT_EQ(table.num_columns(), 1u);
    EXPECT_EQ(table.num_rows(), 1u);
    EXPECT_EQ(table.column("CAG").text_at(0), "5");
}

TEST_F(Hdf5StoreTest, MissingTables) {
    hdf5_store store(store_path(), hdf5_store::open_mode::TRUNCATE);
    store.write_table("/ref/taxonomy", make_annotation());

    EXPECT_FALSE(store.has_table("/annot/gene/all"));
    EXPECT_FALSE(store.has_table("/ref/taxonomy/tax_id"));   // a column, not a table
    EXPECT_TRUE(store.has_table("/ref/taxonomy"));
    EXPECT_THROW(store.read_table("/annot/gene/all"), std::runtime_error);
}

TEST_F(Hdf5StoreTest, ReadWriteModeKeepsOtherTables) {
    {
        hdf5_store store(store_path(), hdf5_store::open_mode::TRUNCATE);
        store.write_table("/ref/taxonomy", make_annotation());
    }
    {
        hdf5_store store(store_path(), hdf5_store::open_mode::READ_WRITE);
        store.write_table("/stats/cag/corncob", make_annotation());
    }

    hdf5_store store(store_path(), hdf5_store::open_mode::READ_ONLY);
    EXPECT_TRUE(store.has_table("/ref/taxonomy"));
    EXPECT_TRUE(store.has_table("/stats/cag/corncob"));
}

TEST_F(Hdf5StoreTest, OpenMissingFileThrows) {
    EXPECT_THROW(hdf5_store(dir / "absent.h5", hdf5_store::open_mode::READ_ONLY),
                 std::runtime_error);
}

TEST_F(Hdf5StoreTest, ReadsPandasFixedFrame) {
    write_pandas_annotation(store_path());

    hdf5_store store(store_path(), hdf5_store::open_mode::READ_ONLY);
    ASSERT_TRUE(store.has_table("/annot/gene/all"));
    auto table = store.read_table("/annot/gene/all");

    EXPECT_EQ(table.column_names(),
              (std::vector<std::string>{"CAG", "tax_id", "eggNOG_desc"}));
    ASSERT_EQ(table.num_rows(), 3u);

    EXPECT_EQ(table.column("CAG").text_at(0), "0");
    EXPECT_EQ(table.column("CAG").text_at(2), "1");
    EXPECT_DOUBLE_EQ(table.column("tax_id").numbers[0], 562);
    EXPECT_TRUE(std::isnan(table.column("tax_id").numbers[1]));
    EXPECT_DOUBLE_EQ(table.column("tax_id").numbers[2], 1280);
    EXPECT_EQ(table.column("eggNOG_desc").text_at(0), "kinase");
    EXPECT_EQ(table.column("eggNOG_desc").text_at(1), std::nullopt);
    EXPECT_EQ(table.column("eggNOG_desc").text_at(2), "ABC transporter");
}

TEST_F(Hdf5StoreTest, ReadsPandasBlockStoredItemsByRows) {
    {
        H5::H5File file(store_path().string(), H5F_ACC_TRUNC);
        file.createGroup("/ref");
        H5::Group group = file.createGroup("/ref/taxonomy");

        write_fixed_strings(group, "axis0", {"tax_id", "parent"}, {2});
        write_int64(group, "axis1", {0, 1, 2}, {3});
        write_fixed_strings(group, "block0_items", {"tax_id", "parent"}, {2});
        // items x rows
        write_int64(group, "block0_values", {1, 561, 562, 1, 1, 561}, {2, 3});
    }

    hdf5_store store(store_path(), hdf5_store::open_mode::READ_ONLY);
    auto table = store.read_table("/ref/taxonomy");
    ASSERT_EQ(table.num_rows(), 3u);
    EXPECT_EQ(table.column("tax_id").text_at(2), "562");
    EXPECT_EQ(table.column("parent").text_at(2), "561");
    EXPECT_EQ(table.column("parent").text_at(0), "1");
}

TEST_F(Hdf5StoreTest, PandasBlockWithWrongShapeThrows) {
    {
        H5::H5File file(store_path().string(), H5F_ACC_TRUNC);
        H5::Group group = file.createGroup("/frame");
        write_fixed_strings(group, "axis0", {"a"}, {1});
        write_int64(group, "axis1", {0, 1, 2}, {3});
        write_fixed_strings(group, "block0_items", {"a"}, {1});
        write_doubles(group, "block0_values", {1, 2}, {2, 1});
    }

    hdf5_store store(store_path(), hdf5_store::open_mode::READ_ONLY);
    EXPECT_THROW(store.read_table("/frame"), std::runtime_error);
}
