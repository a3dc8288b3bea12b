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

#include "annotation_partitioner.hpp"
#include "test_helpers.hpp"

namespace {

wide_row make_row(const std::string& feature, const std::string& parameter, double p) {
    wide_row row;
    row.feature = feature;
    row.parameter = parameter;
    row.values["estimate"] = 1.0;
    row.values["p_value"] = p;
    row.values["std_error"] = 0.5;
    row.q_value = p;
    row.wald = 2.0;
    return row;
}

// one "group" row (and optionally an intercept row) per feature 0..n-1
wide_table make_results(size_t n, bool intercept = false) {
    wide_table table;
    table.value_columns = {"estimate", "p_value", "std_error"};
    table.has_q_value = true;
    for (size_t i = 0; i < n; ++i) {
        if (intercept) {
            table.rows.push_back(make_row(std::to_string(i), annotation_partitioner::INTERCEPT, 0.5));
        }
        table.rows.push_back(make_row(std::to_string(i), "group", 0.01));
    }
    return table;
}

// features [first, first + n) all carrying label in column
void add_features(std::vector<std::string>& keys, std::vector<std::string>& labels,
                  size_t first, size_t n, const std::string& label) {
    for (size_t i = first; i < first + n; ++i) {
        keys.push_back(std::to_string(i));
        labels.push_back(label);
    }
}

data_table make_features(std::vector<std::string> keys,
                         std::vector<std::pair<std::string, std::vector<std::string>>> columns) {
    data_table table;
    table.add_column(table_column::text_column("CAG", std::move(keys)));
    for (auto& [name, values] : columns) {
        table.add_column(table_column::text_column(name, std::move(values)));
    }
    return table;
}

size_t count_rows(const std::vector<std::filesystem::path>& files) {
    size_t rows = 0;
    for (const auto& file : files) {
        rows += test_helpers::read_lines(file).size() - 1;
    }
    return rows;
}

} // namespace

class AnnotationPartitionerTest : public test_helpers::TempDirTest {
protected:
    annotation_partitioner::config make_config() const {
        annotation_partitioner::config cfg;
        cfg.shards.output_dir = dir;
        return cfg;
    }

    std::vector<std::filesystem::path> shard_files() const {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        return files;
    }
};

TEST_F(AnnotationPartitionerTest, WritesLabelAndAnnotationColumns) {
    auto features = make_features({"0", "1", "2"},
        {{"genus", {"Escherichia", "Bacteroides", "Escherichia"}}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(3), features, {"genus"});

    EXPECT_EQ(summary.groups, 2u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.rows, 3u);
    EXPECT_EQ(summary.shards, 1u);
    EXPECT_FALSE(summary.placeholder);

    auto lines = test_helpers::read_lines(dir / "corncob.for.betta.0.csv.gz");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "CAG,parameter,estimate,p_value,std_error,q_value,wald,label,annotation");
    // labels in sorted order, result order within a label
    EXPECT_EQ(lines[1], "1,group,1,0.01,0.5,0.01,2,Bacteroides,genus");
    EXPECT_EQ(lines[2], "0,group,1,0.01,0.5,0.01,2,Escherichia,genus");
    EXPECT_EQ(lines[3], "2,group,1,0.01,0.5,0.01,2,Escherichia,genus");
}

TEST_F(AnnotationPartitionerTest, InterceptRowsAreNeverWritten) {
    auto features = make_features({"0", "1"}, {{"genus", {"Escherichia", "Escherichia"}}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(2, true), features, {"genus"});

    EXPECT_EQ(summary.rows, 2u);
    for (const auto& line : test_helpers::read_lines(dir / "corncob.for.betta.0.csv.gz")) {
        EXPECT_EQ(line.find("(Intercept)"), std::string::npos);
    }
}

TEST_F(AnnotationPartitionerTest, GroupAtLimitIsKept) {
    std::vector<std::string> keys, labels;
    add_features(keys, labels, 0, 50000, "Escherichia");
    auto features = make_features(keys, {{"genus", labels}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(10), features, {"genus"});

    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.rows, 10u);
    EXPECT_FALSE(summary.placeholder);
}

TEST_F(AnnotationPartitionerTest, GroupAboveLimitIsSkipped) {
    std::vector<std::string> keys, labels;
    add_features(keys, labels, 0, 50001, "Escherichia");
    add_features(keys, labels, 50001, 2, "Bacteroides");
    auto features = make_features(keys, {{"genus", labels}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(50003), features, {"genus"});

    EXPECT_EQ(summary.groups, 2u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.rows, 2u);

    auto lines = test_helpers::read_lines(dir / "corncob.for.betta.0.csv.gz");
    ASSERT_EQ(lines.size(), 3u);
    for (size_t i = 1; i < lines.size(); ++i) {
        EXPECT_NE(lines[i].find(",Bacteroides,genus"), std::string::npos);
    }
}

TEST_F(AnnotationPartitionerTest, LimitCountsDistinctFeatures) {
    // several genes of the same CAG count once
    auto features = make_features({"0", "0", "0", "1"},
        {{"genus", {"Escherichia", "Escherichia", "Escherichia", "Escherichia"}}});

    auto cfg = make_config();
    cfg.max_group_features = 2;
    annotation_partitioner partitioner(cfg);
    auto summary = partitioner.partition(make_results(2), features, {"genus"});

    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.rows, 2u);
}

TEST_F(AnnotationPartitionerTest, GroupsSpanShards) {
    std::vector<std::string> keys, genus, eggnog;
    add_features(keys, genus, 0, 6000, "Escherichia");
    eggnog.assign(6000, "");
    add_features(keys, eggnog, 6000, 6000, "kinase");
    genus.resize(12000, "");
    auto features = make_features(keys, {{"genus", genus}, {"eggNOG_desc", eggnog}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(12000), features,
                                         {"genus", "eggNOG_desc"});

    EXPECT_EQ(summary.rows, 12000u);
    EXPECT_EQ(summary.shards, 2u);

    auto first = test_helpers::read_lines(dir / "corncob.for.betta.0.csv.gz");
    auto second = test_helpers::read_lines(dir / "corncob.for.betta.1.csv.gz");
    EXPECT_EQ(first.size(), 10001u);
    EXPECT_EQ(second.size(), 2001u);
    EXPECT_EQ(first[0], second[0]);
    EXPECT_FALSE(std::filesystem::exists(dir / "corncob.for.betta.2.csv.gz"));
    EXPECT_EQ(count_rows(shard_files()), 12000u);
}

TEST_F(AnnotationPartitionerTest, NoColumnsWritesPlaceholder) {
    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(5), data_table{}, {});

    EXPECT_TRUE(summary.placeholder);
    EXPECT_EQ(summary.rows, 0u);
    EXPECT_EQ(summary.shards, 1u);
    EXPECT_EQ(shard_files().size(), 1u);
    EXPECT_EQ(test_helpers::read_lines(dir / "corncob.for.betta.0.csv.gz"),
              (std::vector<std::string>{"estimate,p_value,parameter", "1,1,dummy"}));
}

TEST_F(AnnotationPartitionerTest, NoMatchingFeaturesWritesPlaceholder) {
    auto features = make_features({"100", "101"}, {{"genus", {"Escherichia", ""}}});

    annotation_partitioner partitioner(make_config());
    auto summary = partitioner.partition(make_results(3), features, {"genus"});

    EXPECT_EQ(summary.groups, 1u);
    EXPECT_TRUE(summary.placeholder);
    EXPECT_EQ(shard_files().size(), 1u);
}

TEST_F(AnnotationPartitionerTest, AllGroupsSkippedWritesPlaceholder) {
    auto features = make_features({"0", "1"}, {{"genus", {"Escherichia", "Escherichia"}}});

    auto cfg = make_config();
    cfg.max_group_features = 1;
    annotation_partitioner partitioner(cfg);
    auto summary = partitioner.partition(make_results(2), features, {"genus"});

    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_TRUE(summary.placeholder);
}

TEST_F(AnnotationPartitionerTest, MissingColumnThrows) {
    auto features = make_features({"0"}, {{"genus", {"Escherichia"}}});

    annotation_partitioner partitioner(make_config());
    EXPECT_THROW(partitioner.partition(make_results(1), features, {"family"}),
                 std::runtime_error);
}

TEST_F(AnnotationPartitionerTest, HeaderWithoutQValue) {
    auto results = make_results(1);
    results.has_q_value = false;

    annotation_partitioner partitioner(make_config());
    EXPECT_EQ(partitioner.shard_header(results),
              (std::vector<std::string>{"CAG", "parameter", "estimate", "p_value", "std_error",
                                        "wald", "label", "annotation"}));
}
