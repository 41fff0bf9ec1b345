#include <gtest/gtest.h>
#include "common/batch.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

using namespace rowfeed;
using namespace rowfeed::test;

TEST(BatchTest, ToRowsTransposesColumns) {
    ColumnarBatch columnar({"a", "b"});
    columnar.getColumn(0) = {1, 2, 3};
    columnar.getColumn(1) = {"x", "y", "z"};

    auto rows = toRows(columnar);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], Row::parse(R"({"a": 1, "b": "x"})"));
    EXPECT_EQ(rows[1], Row::parse(R"({"a": 2, "b": "y"})"));
    EXPECT_EQ(rows[2], Row::parse(R"({"a": 3, "b": "z"})"));
}

TEST(BatchTest, ToRowsKeepsColumnOrder) {
    ColumnarBatch columnar({"zeta", "alpha"});
    columnar.getColumn(0) = {1};
    columnar.getColumn(1) = {2};

    auto rows = toRows(columnar);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].dump(), R"({"zeta":1,"alpha":2})");
}

TEST(BatchTest, ToRowsOfEmptyColumnsIsEmpty) {
    ColumnarBatch columnar({"a", "b"});
    EXPECT_TRUE(toRows(columnar).empty());
    EXPECT_TRUE(toRows(ColumnarBatch{}).empty());
}

TEST(BatchTest, ToRowsRejectsColumnsOfDifferentLength) {
    ColumnarBatch columnar({"a", "b"});
    columnar.getColumn(0) = {1, 2};
    columnar.getColumn(1) = {"x"};

    try {
        toRows(columnar);
        FAIL() << "Expected SchemaViolation";
    } catch (const SchemaViolation& e) {
        ASSERT_TRUE(e.getColumn().has_value());
        EXPECT_EQ(*e.getColumn(), "b");
    }
}

TEST(BatchTest, RowsRoundTripThroughColumnar) {
    Batch rows = {Row::parse(R"({"id": 1, "text": "a", "score": 0.5})"),
                  Row::parse(R"({"id": 2, "text": null, "score": 1.5})")};

    auto columnar = toColumnar(rows);
    EXPECT_EQ(columnar.getColumnNames(), (std::vector<std::string>{"id", "text", "score"}));
    EXPECT_EQ(columnar.getRowCount(), 2);
    EXPECT_EQ(toRows(columnar), rows);
}

TEST(BatchTest, AppendRowRejectsUnknownAndMissingKeys) {
    ColumnarBatch columnar({"a", "b"});
    EXPECT_THROW(columnar.appendRow(Row::parse(R"({"a": 1})")), SchemaViolation);
    EXPECT_THROW(columnar.appendRow(Row::parse(R"({"a": 1, "c": 2})")), SchemaViolation);
    EXPECT_THROW(columnar.appendRow(Row::parse("[1, 2]")), SchemaViolation);
    EXPECT_EQ(columnar.getRowCount(), 0);

    // key order of the row does not matter
    columnar.appendRow(Row::parse(R"({"b": 2, "a": 1})"));
    EXPECT_EQ(columnar.getColumnByName("a")[0], 1);
    EXPECT_EQ(columnar.getColumnByName("b")[0], 2);
}

TEST(BatchTest, SliceClampsToAvailableRows) {
    auto batch = data_helpers::sequenceBatch(10);

    auto middle = batch.slice(3, 4);
    EXPECT_EQ(middle.getRowCount(), 4);
    EXPECT_EQ(middle.getColumn(0).front(), 3);

    EXPECT_EQ(batch.slice(8, 5).getRowCount(), 2);
    EXPECT_EQ(batch.slice(12, 5).getRowCount(), 0);
    EXPECT_EQ(batch.slice(12, 5).getColumnNames(), batch.getColumnNames());
}

TEST(BatchTest, AppendRequiresSameColumns) {
    auto batch = data_helpers::sequenceBatch(2);
    batch.append(data_helpers::sequenceBatch(3, 2));
    EXPECT_EQ(batch.getRowCount(), 5);
    EXPECT_EQ(batch.getColumn(0).back(), 4);

    ColumnarBatch other({"id"});
    EXPECT_THROW(batch.append(other), SchemaViolation);
}

TEST(BatchTest, TruncateAndColumnLookup) {
    auto batch = data_helpers::sequenceBatch(5);
    batch.truncate(2);
    EXPECT_EQ(batch.getRowCount(), 2);
    batch.truncate(10);
    EXPECT_EQ(batch.getRowCount(), 2);

    EXPECT_EQ(batch.getColumnIndex("text"), 1);
    EXPECT_EQ(batch.getColumnIndex("missing"), -1);
    EXPECT_THROW(batch.getColumnByName("missing"), SchemaViolation);
    EXPECT_THROW(batch.addColumn("id"), SchemaViolation);
}

TEST(BatchTest, PrettyStringShowsHeaderAndTruncation) {
    auto batch = data_helpers::sequenceBatch(3);
    auto text = batch.toPrettyString(2);
    EXPECT_NE(text.find("| id"), std::string::npos);
    EXPECT_NE(text.find("\"row-1\""), std::string::npos);
    EXPECT_EQ(text.find("\"row-2\""), std::string::npos);
    EXPECT_NE(text.find("1 more rows"), std::string::npos);

    EXPECT_EQ(ColumnarBatch{}.toPrettyString(), "[empty batch]");
}
