#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "data/dataset.hpp"
#include "test_support.hpp"

namespace {

using simlab::core::errors::get_error;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;
using simlab::data::Dataset;
using simlab::data::parse_csv;
using simlab::data::read_csv;
using simlab::data::to_csv;
using simlab::data::write_csv;
using simlab::testing::TempWorkspace;

TEST(DatasetTest, QuotesCellsThatNeedIt) {
    Dataset dataset;
    dataset.columns = {"L", "trace"};
    dataset.rows = {{"1.0", "[1, 2]"}, {"2.0", "say \"hi\""}};

    EXPECT_EQ(to_csv(dataset), "L,trace\n1.0,\"[1, 2]\"\n2.0,\"say \"\"hi\"\"\"\n");
}

TEST(DatasetTest, ParsesQuotedCellsWithNewlines) {
    auto result = parse_csv("a,b\n\"x\ny\",2\n");
    ASSERT_FALSE(is_error(result));
    const auto& dataset = get_value(result);
    ASSERT_EQ(dataset.row_count(), 1u);
    EXPECT_EQ(dataset.rows[0][0], "x\ny");
    EXPECT_EQ(dataset.column_index("b"), std::optional<std::size_t>(1));
    EXPECT_FALSE(dataset.column_index("c").has_value());
}

TEST(DatasetTest, RejectsRaggedRows) {
    auto result = parse_csv("a,b\n1\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_csv");
}

TEST(DatasetTest, RejectsUnterminatedQuote) {
    auto result = parse_csv("a\n\"open\n");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_csv");
}

TEST(DatasetTest, WriteCreatesDirectoriesAndReadsBack) {
    TempWorkspace workspace("dataset");
    Dataset dataset;
    dataset.columns = {"L", "period"};
    dataset.rows = {{"1", "2.006"}};

    const auto target = workspace.root() / "nested" / "data.csv";
    auto written = write_csv(dataset, target);
    ASSERT_FALSE(is_error(written));

    auto loaded = read_csv(target);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).columns, dataset.columns);
    EXPECT_EQ(get_value(loaded).rows, dataset.rows);
}

TEST(DatasetTest, ReadReportsMissingFile) {
    TempWorkspace workspace("dataset");
    auto result = read_csv(workspace.root() / "missing.csv");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "dataset_not_found");
}

}  // namespace
