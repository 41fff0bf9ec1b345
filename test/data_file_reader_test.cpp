#include <gtest/gtest.h>
#include <memory>
#include "common/errors.hpp"
#include "storage/csv_data_file_reader.hpp"
#include "storage/dataset_handle.hpp"
#include "storage/json_data_file_reader.hpp"
#include "test_helpers.hpp"

using namespace rowfeed;
using namespace rowfeed::test;

class DataFileReaderTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryFileSystem> fs_ = std::make_shared<MemoryFileSystem>();

    ColumnarBatch readAll(DataFileReader& reader, int64_t chunk = 8192) {
        ColumnarBatch out(reader.getColumnNames());
        while (reader.readBatch(out, chunk) > 0) {
        }
        return out;
    }
};

TEST_F(DataFileReaderTest, FiletypeFromExtension) {
    EXPECT_EQ(filetypeFromExtension("jsonl"), "json");
    EXPECT_EQ(filetypeFromExtension("CSV"), "csv");
    EXPECT_EQ(filetypeFromExtension("parquet"), "parquet");
    EXPECT_EQ(fileFormatFromString("txt"), FileFormat::TEXT);
    EXPECT_EQ(fileFormatFromString("JSONL"), FileFormat::JSON);
    EXPECT_FALSE(fileFormatFromString("parquet").has_value());
    EXPECT_EQ(fileFormatToString(FileFormat::CSV), "csv");
}

TEST_F(DataFileReaderTest, CsvInfersCellTypes) {
    fs_->addFile("data.csv", "i,d,b,s,n,q\n42,3.5,true,hello,,\"42\"\r\n-7,1e3,FALSE,\"a,b\",NULL,\"say \"\"hi\"\"\"\n");
    CsvDataFileReader reader(fs_, "data.csv");

    EXPECT_EQ(reader.getColumnNames(), (std::vector<std::string>{"i", "d", "b", "s", "n", "q"}));
    auto rows = toRows(readAll(reader));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], Row::parse(R"({"i": 42, "d": 3.5, "b": true, "s": "hello", "n": null, "q": "42"})"));
    EXPECT_EQ(rows[1], Row::parse(R"({"i": -7, "d": 1000.0, "b": false, "s": "a,b", "n": null, "q": "say \"hi\""})"));
    EXPECT_TRUE(rows[0]["i"].is_number_integer());
    EXPECT_TRUE(rows[0]["q"].is_string());
}

TEST_F(DataFileReaderTest, CsvReadsInChunksAndResets) {
    fs_->addFile("data.csv", data_helpers::sequenceCsv(5));
    CsvDataFileReader reader(fs_, "data.csv");

    ColumnarBatch out(reader.getColumnNames());
    EXPECT_EQ(reader.readBatch(out, 2), 2);
    EXPECT_EQ(reader.readBatch(out, 2), 2);
    EXPECT_EQ(reader.readBatch(out, 2), 1);
    EXPECT_EQ(reader.readBatch(out, 2), 0);
    EXPECT_FALSE(reader.hasMore());
    EXPECT_EQ(out, data_helpers::sequenceBatch(5));

    reader.reset();
    EXPECT_TRUE(reader.hasMore());
    EXPECT_EQ(readAll(reader), data_helpers::sequenceBatch(5));
}

TEST_F(DataFileReaderTest, CsvRejectsRaggedLines) {
    fs_->addFile("bad.csv", "a,b\n1,2\n3\n");
    CsvDataFileReader reader(fs_, "bad.csv");
    ColumnarBatch out(reader.getColumnNames());
    EXPECT_THROW(reader.readBatch(out), SchemaViolation);

    fs_->addFile("quote.csv", "a\n\"open\n");
    CsvDataFileReader quoted(fs_, "quote.csv");
    ColumnarBatch quotedOut(quoted.getColumnNames());
    EXPECT_THROW(quoted.readBatch(quotedOut), SchemaViolation);
}

TEST_F(DataFileReaderTest, CsvQuotedFieldSpansLines) {
    fs_->addFile("notes.csv", "id,note\r\n1,\"first line\r\nsecond, line\"\r\n2,plain\r\n");
    CsvDataFileReader reader(fs_, "notes.csv");

    auto rows = toRows(readAll(reader));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["note"], "first line\nsecond, line");
    EXPECT_EQ(rows[1], Row::parse(R"({"id": 2, "note": "plain"})"));
}

TEST_F(DataFileReaderTest, CsvKeepsRawBytesAndJsonTextReplacesThem) {
    fs_->addFile("latin1.csv", "id,name\n1,caf\xe9\n");
    CsvDataFileReader reader(fs_, "latin1.csv");

    auto rows = toRows(readAll(reader));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["name"], "caf\xe9");
    EXPECT_EQ(toJsonText(rows[0]), "{\"id\":1,\"name\":\"caf\xEF\xBF\xBD\"}");
}

TEST_F(DataFileReaderTest, CsvWithoutHeaderHasNoColumns) {
    fs_->addFile("empty.csv", "\n\n");
    CsvDataFileReader reader(fs_, "empty.csv");
    EXPECT_TRUE(reader.getColumnNames().empty());
    ColumnarBatch out;
    EXPECT_EQ(reader.readBatch(out), 0);
}

TEST_F(DataFileReaderTest, JsonLinesReadsRecords) {
    fs_->addFile("data.jsonl", data_helpers::sequenceJsonLines(3) + "\n   \n");
    JsonDataFileReader reader(fs_, "data.jsonl");

    EXPECT_EQ(reader.getColumnNames(), (std::vector<std::string>{"id", "text"}));
    EXPECT_EQ(readAll(reader, 2), data_helpers::sequenceBatch(3));
    EXPECT_FALSE(reader.hasMore());
}

TEST_F(DataFileReaderTest, JsonArrayReadsRecords) {
    fs_->addFile("data.json", R"(  [{"id": 0, "text": "row-0"}, {"id": 1, "text": "row-1"}])");
    JsonDataFileReader reader(fs_, "data.json");
    EXPECT_EQ(readAll(reader), data_helpers::sequenceBatch(2));
}

TEST_F(DataFileReaderTest, JsonMissingFieldReadsAsNull) {
    fs_->addFile("data.jsonl", "{\"a\": 1, \"b\": 2}\n{\"b\": 3}\n");
    JsonDataFileReader reader(fs_, "data.jsonl");
    auto rows = toRows(readAll(reader));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_TRUE(rows[1]["a"].is_null());
    EXPECT_EQ(rows[1]["b"], 3);
}

TEST_F(DataFileReaderTest, JsonRejectsNewColumnsAndMalformedLines) {
    fs_->addFile("extra.jsonl", "{\"a\": 1}\n{\"a\": 2, \"c\": 3}\n");
    JsonDataFileReader extra(fs_, "extra.jsonl");
    ColumnarBatch out(extra.getColumnNames());
    try {
        extra.readBatch(out);
        FAIL() << "Expected SchemaViolation";
    } catch (const SchemaViolation& e) {
        EXPECT_EQ(e.getColumn(), std::optional<std::string>("c"));
        EXPECT_EQ(e.getPath(), std::optional<std::string>("extra.jsonl"));
    }

    fs_->addFile("broken.jsonl", "{\"a\": 1}\n{\"a\": \n");
    JsonDataFileReader broken(fs_, "broken.jsonl");
    ColumnarBatch brokenOut(broken.getColumnNames());
    EXPECT_THROW(broken.readBatch(brokenOut), SchemaViolation);

    fs_->addFile("scalar.jsonl", "42\n");
    JsonDataFileReader scalar(fs_, "scalar.jsonl");
    EXPECT_THROW(scalar.getColumnNames(), SchemaViolation);
}

TEST_F(DataFileReaderTest, TextReadsOneRowPerLine) {
    fs_->addFile("notes.txt", "first\r\nsecond\n\nlast");
    TextDataFileReader reader(fs_, "notes.txt");
    auto rows = toRows(readAll(reader));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0]["text"], "first");
    EXPECT_EQ(rows[2]["text"], "");
    EXPECT_EQ(rows[3]["text"], "last");
}

TEST_F(DataFileReaderTest, MissingFileIsUnavailable) {
    EXPECT_THROW(JsonDataFileReader(fs_, "nope.jsonl"), SourceUnavailable);
    EXPECT_THROW(createFileReader(FileFormat::CSV, fs_, "nope.csv"), SourceUnavailable);
}

TEST_F(DataFileReaderTest, FileDatasetSpansFilesAndSkipsEmptyOnes) {
    fs_->addFile("a.jsonl", data_helpers::sequenceJsonLines(3));
    fs_->addFile("b.jsonl", "");
    fs_->addFile("c.jsonl", data_helpers::sequenceJsonLines(4, 3));

    FileDataset dataset(fs_, FileFormat::JSON, {"a.jsonl", "b.jsonl", "c.jsonl"});
    EXPECT_EQ(dataset.getColumnNames(), (std::vector<std::string>{"id", "text"}));
    EXPECT_FALSE(dataset.getRowCount().has_value());

    EXPECT_EQ(dataset.read(0, 5), data_helpers::sequenceBatch(5));
    EXPECT_EQ(dataset.read(5, 5), data_helpers::sequenceBatch(2, 5));
    EXPECT_TRUE(dataset.read(7, 5).empty());

    // reading backwards rewinds
    EXPECT_EQ(dataset.read(1, 2), data_helpers::sequenceBatch(2, 1));
}

TEST_F(DataFileReaderTest, FileDatasetTruncateLimitsReads) {
    fs_->addFile("a.jsonl", data_helpers::sequenceJsonLines(10));
    FileDataset dataset(fs_, FileFormat::JSON, {"a.jsonl"}, 10, false);
    dataset.truncate(4);
    EXPECT_EQ(dataset.getRowCount(), std::optional<RowCount>(4));
    EXPECT_EQ(dataset.read(2, 10).getRowCount(), 2);
    EXPECT_TRUE(dataset.read(4, 10).empty());
}

TEST_F(DataFileReaderTest, FileDatasetRejectsColumnDrift) {
    fs_->addFile("a.jsonl", "{\"a\": 1}\n");
    fs_->addFile("b.jsonl", "{\"b\": 1}\n");
    FileDataset dataset(fs_, FileFormat::JSON, {"a.jsonl", "b.jsonl"});
    EXPECT_THROW(dataset.read(0, 10), SchemaViolation);
}

TEST_F(DataFileReaderTest, OpenDatasetMaterializesWhenNotStreaming) {
    fs_->addFile("a.csv", data_helpers::sequenceCsv(6));
    auto eager = openDataset(fs_, FileFormat::CSV, {"a.csv"}, false);
    EXPECT_TRUE(eager->supportsRandomAccess());
    EXPECT_EQ(eager->getRowCount(), std::optional<RowCount>(6));

    auto lazy = openDataset(fs_, FileFormat::CSV, {"a.csv"}, true);
    EXPECT_TRUE(lazy->isStreaming());
    EXPECT_FALSE(lazy->getRowCount().has_value());
    EXPECT_EQ(materialize(*lazy)->getData(), data_helpers::sequenceBatch(6));
}

TEST_F(DataFileReaderTest, CountRowsReadsStreamingDatasetInChunks) {
    fs_->addFile("a.jsonl", data_helpers::sequenceJsonLines(3));
    fs_->addFile("b.jsonl", data_helpers::sequenceJsonLines(5, 3));

    FileDataset dataset(fs_, FileFormat::JSON, {"a.jsonl", "b.jsonl"});
    EXPECT_EQ(countRows(dataset), 8);
    EXPECT_FALSE(dataset.getRowCount().has_value());
    // still readable from the start afterwards
    EXPECT_EQ(dataset.read(0, 2), data_helpers::sequenceBatch(2));

    FileDataset known(fs_, FileFormat::JSON, {"a.jsonl"}, 3, false);
    EXPECT_EQ(countRows(known), 3);
}
