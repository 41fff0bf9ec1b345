#pragma once

#include <istream>
#include <memory>
#include <vector>
#include "storage/data_file_reader.hpp"

namespace rowfeed {

/**
 * @brief Line based CSV file reader. The following is supported:
 * - Comma separated values, first line is the header
 * - Double quotes escape the separator, "" inside quotes is a literal quote
 * - Unquoted cells are typed: empty/NULL/null -> null, true/false (case insensitive) -> bool,
 *   integers -> int64, decimals -> double, anything else -> string
 * - Quoted cells are always strings
 * - Quoted fields may span several lines
 */
class CsvDataFileReader : public DataFileReader {
public:
    CsvDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath, char separator = ',');

    CsvDataFileReader(const CsvDataFileReader&) = delete;
    CsvDataFileReader& operator=(const CsvDataFileReader&) = delete;

    ~CsvDataFileReader() override = default;

    int64_t readBatch(ColumnarBatch& out, int64_t requestedRows = 8192) override;

    bool hasMore() const noexcept override;

    void reset() override;

    const std::string& getPath() const noexcept override { return file_path_; }

    const std::vector<std::string>& getColumnNames() override;

    struct Field {
        std::string text;
        bool quoted = false;
    };

    std::vector<Field> parseCSVLine(const std::string& line) const;

    /**
     * @brief Typed value of an unquoted cell
     */
    static Value parseCell(const std::string& text);

private:
    std::shared_ptr<FileSystem> file_system_;
    std::string file_path_;
    std::unique_ptr<std::istream> file_;
    std::vector<std::string> columns_;
    bool header_read_;
    bool eof_;
    int64_t line_number_;
    char separator_;

    void readHeader();

    /**
     * @brief Read the next non-blank record, joining lines while a quote is open. Returns
     * false at end of file.
     */
    bool readRecord(std::string& record);
};

}  // namespace rowfeed
