#include "storage/json_data_file_reader.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

JsonDataFileReader::JsonDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath)
    : file_system_(std::move(fileSystem)),
      file_path_(std::move(filePath)),
      started_(false),
      eof_(false),
      line_number_(0),
      array_index_(0) {
    file_ = file_system_->openInput(file_path_);
}

void JsonDataFileReader::reset() {
    file_ = file_system_->openInput(file_path_);
    started_ = false;
    eof_ = false;
    line_number_ = 0;
    array_.reset();
    array_index_ = 0;
    pending_.reset();
    columns_.clear();
}

bool JsonDataFileReader::hasMore() const noexcept {
    return !eof_;
}

void JsonDataFileReader::start() {
    if (started_) {
        return;
    }
    started_ = true;

    // A leading '[' means the whole file is one array of records
    *file_ >> std::ws;
    if (file_->peek() == '[') {
        try {
            array_ = Value::parse(*file_);
        } catch (const nlohmann::json::parse_error& e) {
            throw SchemaViolation(std::string("Malformed JSON array: ") + e.what(), std::nullopt, file_path_);
        }
    }

    pending_ = nextRecord();
    if (!pending_) {
        Logger::warn("JSON file {} holds no records", file_path_);
        return;
    }
    for (const auto& [key, value] : pending_->items()) {
        columns_.push_back(key);
    }
}

std::optional<Value> JsonDataFileReader::nextRecord() {
    if (pending_) {
        auto record = std::move(*pending_);
        pending_.reset();
        return record;
    }

    Value record;
    if (array_) {
        if (array_index_ >= array_->size()) {
            eof_ = true;
            return std::nullopt;
        }
        record = std::move((*array_)[array_index_++]);
    } else {
        std::string line;
        while (true) {
            if (!std::getline(*file_, line)) {
                eof_ = true;
                return std::nullopt;
            }
            ++line_number_;
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                break;
            }
        }
        try {
            record = Value::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            throw SchemaViolation("Malformed JSON at line " + std::to_string(line_number_) + ": " + e.what(),
                                  std::nullopt, file_path_);
        }
    }

    if (!record.is_object()) {
        throw SchemaViolation("Expected a JSON object per record but found " + valueTypeName(record),
                              std::nullopt, file_path_);
    }
    return record;
}

const std::vector<std::string>& JsonDataFileReader::getColumnNames() {
    start();
    return columns_;
}

void JsonDataFileReader::appendRecord(ColumnarBatch& out, const Value& record) {
    for (const auto& [key, value] : record.items()) {
        if (out.getColumnIndex(key) == -1) {
            throw SchemaViolation("Record introduces a column missing from the first record", key, file_path_);
        }
    }
    for (int64_t colIdx = 0; colIdx < out.getColumnCount(); ++colIdx) {
        const auto& name = out.getColumnNames()[static_cast<size_t>(colIdx)];
        auto it = record.find(name);
        out.getColumn(colIdx).push_back(it != record.end() ? *it : Value(nullptr));
    }
}

int64_t JsonDataFileReader::readBatch(ColumnarBatch& out, int64_t requestedRows) {
    start();
    if (columns_.empty()) {
        eof_ = true;
        return 0;
    }
    if (out.getColumnNames() != columns_) {
        throw SchemaViolation("Output columns do not match the columns of the first record", std::nullopt,
                              file_path_);
    }

    int64_t rowsRead = 0;
    while (rowsRead < requestedRows) {
        auto record = nextRecord();
        if (!record) {
            break;
        }
        appendRecord(out, *record);
        ++rowsRead;
    }
    return rowsRead;
}

TextDataFileReader::TextDataFileReader(std::shared_ptr<FileSystem> fileSystem, std::string filePath)
    : file_system_(std::move(fileSystem)), file_path_(std::move(filePath)), eof_(false) {
    file_ = file_system_->openInput(file_path_);
}

void TextDataFileReader::reset() {
    file_ = file_system_->openInput(file_path_);
    eof_ = false;
}

bool TextDataFileReader::hasMore() const noexcept {
    return !eof_ && file_ && file_->good();
}

int64_t TextDataFileReader::readBatch(ColumnarBatch& out, int64_t requestedRows) {
    if (eof_) {
        return 0;
    }
    if (out.getColumnNames() != columns_) {
        throw SchemaViolation("Output columns do not match the text column", std::nullopt, file_path_);
    }

    int64_t rowsRead = 0;
    std::string line;
    auto& column = out.getColumn(0);
    while (rowsRead < requestedRows && std::getline(*file_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        column.push_back(line);
        ++rowsRead;
    }
    if (!file_->good()) {
        eof_ = true;
    }
    return rowsRead;
}

}  // namespace rowfeed
