#include "common/batch.hpp"
#include <algorithm>
#include "common/assert.hpp"
#include "common/errors.hpp"

namespace rowfeed {

ColumnarBatch::ColumnarBatch(const std::vector<std::string>& columnNames) {
    for (const auto& name : columnNames) {
        addColumn(name);
    }
}

const std::vector<Value>& ColumnarBatch::getColumn(int64_t index) const {
    rf_assert(index >= 0 && static_cast<size_t>(index) < columns_.size(),
              "Tried accessing non existing column: {}", index);
    return columns_[static_cast<size_t>(index)];
}

std::vector<Value>& ColumnarBatch::getColumn(int64_t index) {
    rf_assert(index >= 0 && static_cast<size_t>(index) < columns_.size(),
              "Tried accessing non existing column: {}", index);
    return columns_[static_cast<size_t>(index)];
}

const std::vector<Value>& ColumnarBatch::getColumnByName(const std::string& name) const {
    auto index = getColumnIndex(name);
    if (index == -1) {
        throw SchemaViolation("Unknown column", name);
    }
    return columns_[static_cast<size_t>(index)];
}

int64_t ColumnarBatch::getColumnIndex(const std::string& name) const noexcept {
    auto it = nameToIndex_.find(name);
    if (it != nameToIndex_.end()) {
        return it->second;
    }
    return -1;
}

void ColumnarBatch::addColumn(std::string name, std::vector<Value> values) {
    if (hasColumn(name)) {
        throw SchemaViolation("Duplicate column", name);
    }
    nameToIndex_[name] = static_cast<int64_t>(columns_.size());
    names_.push_back(std::move(name));
    columns_.push_back(std::move(values));
}

void ColumnarBatch::appendRow(const Row& row) {
    if (!row.is_object()) {
        throw SchemaViolation("Row is not an object but " + valueTypeName(row));
    }
    if (row.size() != columns_.size()) {
        throw SchemaViolation("Row has " + std::to_string(row.size()) + " fields, expected " +
                              std::to_string(columns_.size()));
    }
    // Look up every key first so a bad row leaves the batch untouched
    std::vector<const Value*> ordered(columns_.size(), nullptr);
    for (const auto& [key, value] : row.items()) {
        auto index = getColumnIndex(key);
        if (index == -1) {
            throw SchemaViolation("Row carries unknown column", key);
        }
        ordered[static_cast<size_t>(index)] = &value;
    }
    for (size_t i = 0; i < columns_.size(); ++i) {
        columns_[i].push_back(*ordered[i]);
    }
}

void ColumnarBatch::append(const ColumnarBatch& other) {
    if (other.names_ != names_) {
        throw SchemaViolation("Cannot append batch with a different column set");
    }
    for (size_t i = 0; i < columns_.size(); ++i) {
        auto& column = columns_[i];
        const auto& source = other.columns_[i];
        column.insert(column.end(), source.begin(), source.end());
    }
}

ColumnarBatch ColumnarBatch::slice(int64_t start, int64_t count) const {
    ColumnarBatch result(names_);
    int64_t rows = getRowCount();
    start = std::clamp<int64_t>(start, 0, rows);
    int64_t end = std::clamp<int64_t>(start + std::max<int64_t>(count, 0), start, rows);
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& column = columns_[i];
        auto last = std::min<int64_t>(end, static_cast<int64_t>(column.size()));
        if (start < last) {
            result.columns_[i].assign(column.begin() + start, column.begin() + last);
        }
    }
    return result;
}

void ColumnarBatch::truncate(int64_t newRowCount) {
    newRowCount = std::max<int64_t>(newRowCount, 0);
    for (auto& column : columns_) {
        if (static_cast<int64_t>(column.size()) > newRowCount) {
            column.resize(static_cast<size_t>(newRowCount));
        }
    }
}

void ColumnarBatch::clearRows() noexcept {
    for (auto& column : columns_) {
        column.clear();
    }
}

std::string ColumnarBatch::toPrettyString(int64_t maxRows) const {
    int64_t rowCount = getRowCount();
    if (columns_.empty() || rowCount == 0) {
        return "[empty batch]";
    }

    bool truncated = false;
    int64_t displayRows = rowCount;
    if (maxRows >= 0 && rowCount > maxRows) {
        displayRows = maxRows;
        truncated = true;
    }

    std::vector<std::vector<std::string>> cells(columns_.size());
    std::vector<size_t> colWidths;
    for (size_t colIdx = 0; colIdx < columns_.size(); ++colIdx) {
        size_t width = names_[colIdx].length();
        for (int64_t row = 0; row < displayRows; ++row) {
            const auto& column = columns_[colIdx];
            std::string cell = row < static_cast<int64_t>(column.size()) ? toJsonText(column[row]) : "";
            width = std::max(width, cell.length());
            cells[colIdx].push_back(std::move(cell));
        }
        colWidths.push_back(width);
    }

    auto separator = [&]() {
        std::string line = "+";
        for (size_t width : colWidths) {
            line += std::string(width + 2, '-');
            line += "+";
        }
        return line + "\n";
    };

    auto renderRow = [&](const std::vector<std::string>& values) {
        std::string line = "|";
        for (size_t colIdx = 0; colIdx < values.size(); ++colIdx) {
            line += " " + values[colIdx];
            line += std::string(colWidths[colIdx] - values[colIdx].length() + 1, ' ');
            line += "|";
        }
        return line + "\n";
    };

    std::string result = separator();
    result += renderRow(names_);
    result += separator();
    for (int64_t row = 0; row < displayRows; ++row) {
        std::vector<std::string> values;
        values.reserve(columns_.size());
        for (const auto& column : cells) {
            values.push_back(column[static_cast<size_t>(row)]);
        }
        result += renderRow(values);
    }
    result += separator();
    if (truncated) {
        result += "... (" + std::to_string(rowCount - maxRows) + " more rows)\n";
    }
    return result;
}

Batch toRows(const ColumnarBatch& columnar) {
    const auto& names = columnar.getColumnNames();
    int64_t length = columnar.getRowCount();
    for (int64_t colIdx = 0; colIdx < columnar.getColumnCount(); ++colIdx) {
        auto columnLength = static_cast<int64_t>(columnar.getColumn(colIdx).size());
        if (columnLength != length) {
            throw SchemaViolation("Column has " + std::to_string(columnLength) + " values, expected " +
                                      std::to_string(length),
                                  names[static_cast<size_t>(colIdx)]);
        }
    }

    Batch rows;
    rows.reserve(static_cast<size_t>(length));
    for (int64_t row = 0; row < length; ++row) {
        Row record = Row::object();
        for (int64_t colIdx = 0; colIdx < columnar.getColumnCount(); ++colIdx) {
            record[names[static_cast<size_t>(colIdx)]] = columnar.getColumn(colIdx)[static_cast<size_t>(row)];
        }
        rows.push_back(std::move(record));
    }
    return rows;
}

ColumnarBatch toColumnar(const Batch& rows, const std::vector<std::string>& columnNames) {
    ColumnarBatch columnar(columnNames);
    for (const auto& row : rows) {
        columnar.appendRow(row);
    }
    return columnar;
}

ColumnarBatch toColumnar(const Batch& rows) {
    std::vector<std::string> names;
    if (!rows.empty() && rows.front().is_object()) {
        for (const auto& [key, value] : rows.front().items()) {
            names.push_back(key);
        }
    }
    return toColumnar(rows, names);
}

std::string toJsonText(const Value& value, int indent) {
    return value.dump(indent, ' ', false, Value::error_handler_t::replace);
}

}  // namespace rowfeed
