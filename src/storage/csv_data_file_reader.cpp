#include "storage/csv_data_file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

namespace {

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

CsvDataFileReader::CsvDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath, char separator)
    : file_system_(std::move(fileSystem)),
      file_path_(std::move(filePath)),
      header_read_(false),
      eof_(false),
      line_number_(0),
      separator_(separator) {
    file_ = file_system_->openInput(file_path_);
}

void CsvDataFileReader::reset() {
    file_ = file_system_->openInput(file_path_);
    header_read_ = false;
    eof_ = false;
    line_number_ = 0;
    columns_.clear();
}

bool CsvDataFileReader::hasMore() const noexcept {
    return !eof_ && file_ && file_->good();
}

std::vector<CsvDataFileReader::Field> CsvDataFileReader::parseCSVLine(const std::string& line) const {
    std::vector<Field> fields;
    Field field;
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (inQuotes && i + 1 < line.length() && line[i + 1] == '"') {
                field.text += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
                field.quoted = true;
            }
        } else if (c == separator_ && !inQuotes) {
            fields.push_back(std::move(field));
            field = Field{};
        } else {
            field.text += c;
        }
    }
    if (inQuotes) {
        throw SchemaViolation("Unterminated quote at line " + std::to_string(line_number_), std::nullopt,
                              file_path_);
    }
    fields.push_back(std::move(field));

    return fields;
}

Value CsvDataFileReader::parseCell(const std::string& text) {
    if (text.empty() || text == "NULL" || text == "null") {
        return nullptr;
    }

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    const char* begin = text.data();
    const char* end = text.data() + text.size();

    int64_t integer = 0;
    auto [intEnd, intErr] = std::from_chars(begin, end, integer);
    if (intErr == std::errc{} && intEnd == end) {
        return integer;
    }

    double decimal = 0.0;
    auto [doubleEnd, doubleErr] = std::from_chars(begin, end, decimal);
    if (doubleErr == std::errc{} && doubleEnd == end) {
        return decimal;
    }

    return text;
}

bool CsvDataFileReader::readRecord(std::string& record) {
    std::string line;
    while (std::getline(*file_, line)) {
        ++line_number_;
        stripCarriageReturn(line);
        if (!line.empty()) {
            break;
        }
    }
    if (line.empty()) {
        return false;
    }

    int64_t firstLine = line_number_;
    auto quotes = std::count(line.begin(), line.end(), '"');
    record = std::move(line);
    while (quotes % 2 != 0) {
        if (!std::getline(*file_, line)) {
            throw SchemaViolation("Unterminated quote starting at line " + std::to_string(firstLine), std::nullopt,
                                  file_path_);
        }
        ++line_number_;
        stripCarriageReturn(line);
        quotes += std::count(line.begin(), line.end(), '"');
        record += '\n';
        record += line;
    }
    return true;
}

void CsvDataFileReader::readHeader() {
    if (header_read_) {
        return;
    }
    header_read_ = true;

    std::string headerLine;
    if (!readRecord(headerLine)) {
        Logger::warn("CSV file {} has no header", file_path_);
        eof_ = true;
        return;
    }

    for (auto& field : parseCSVLine(headerLine)) {
        columns_.push_back(std::move(field.text));
    }
}

const std::vector<std::string>& CsvDataFileReader::getColumnNames() {
    readHeader();
    return columns_;
}

int64_t CsvDataFileReader::readBatch(ColumnarBatch& out, int64_t requestedRows) {
    readHeader();
    if (eof_ || !file_->good()) {
        eof_ = true;
        return 0;
    }

    if (out.getColumnNames() != columns_) {
        throw SchemaViolation("Output columns do not match the CSV header", std::nullopt, file_path_);
    }

    int64_t rowsRead = 0;
    std::string line;
    while (rowsRead < requestedRows && readRecord(line)) {
        std::vector<Field> fields = parseCSVLine(line);
        if (fields.size() != columns_.size()) {
            throw SchemaViolation("CSV line " + std::to_string(line_number_) + " has " +
                                      std::to_string(fields.size()) + " fields, expected " +
                                      std::to_string(columns_.size()),
                                  std::nullopt, file_path_);
        }

        for (size_t colIdx = 0; colIdx < fields.size(); ++colIdx) {
            auto& field = fields[colIdx];
            out.getColumn(static_cast<int64_t>(colIdx))
                .push_back(field.quoted ? Value(std::move(field.text)) : parseCell(field.text));
        }

        ++rowsRead;
    }

    if (!file_->good()) {
        eof_ = true;
    }

    return rowsRead;
}

}  // namespace rowfeed
