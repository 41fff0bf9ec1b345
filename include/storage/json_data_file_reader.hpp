#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <vector>
#include "storage/data_file_reader.hpp"

namespace rowfeed {

/**
 * @brief Reader for JSON files holding either one object per line (JSON lines) or a single
 * top-level array of objects. The first record defines the column order; later records
 * may omit columns (read as null) but must not introduce new ones.
 */
class JsonDataFileReader : public DataFileReader {
public:
    JsonDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath);

    JsonDataFileReader(const JsonDataFileReader&) = delete;
    JsonDataFileReader& operator=(const JsonDataFileReader&) = delete;

    ~JsonDataFileReader() override = default;

    int64_t readBatch(ColumnarBatch& out, int64_t requestedRows = 8192) override;

    bool hasMore() const noexcept override;

    void reset() override;

    const std::string& getPath() const noexcept override { return file_path_; }

    const std::vector<std::string>& getColumnNames() override;

private:
    std::shared_ptr<FileSystem> file_system_;
    std::string file_path_;
    std::unique_ptr<std::istream> file_;
    std::vector<std::string> columns_;
    bool started_;
    bool eof_;
    int64_t line_number_;

    // Set when the file is a top-level array; records are then served from memory
    std::optional<Value> array_;
    size_t array_index_;

    // Record read ahead while discovering the columns
    std::optional<Value> pending_;

    void start();

    std::optional<Value> nextRecord();

    void appendRecord(ColumnarBatch& out, const Value& record);
};

/**
 * @brief Plain text reader: one row per line with a single "text" column
 */
class TextDataFileReader : public DataFileReader {
public:
    TextDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath);

    int64_t readBatch(ColumnarBatch& out, int64_t requestedRows = 8192) override;

    bool hasMore() const noexcept override;

    void reset() override;

    const std::string& getPath() const noexcept override { return file_path_; }

    const std::vector<std::string>& getColumnNames() override { return columns_; }

private:
    std::shared_ptr<FileSystem> file_system_;
    std::string file_path_;
    std::unique_ptr<std::istream> file_;
    std::vector<std::string> columns_{"text"};
    bool eof_;
};

}  // namespace rowfeed
