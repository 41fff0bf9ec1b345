#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"

namespace rowfeed {

/**
 * @brief Column-major batch: an ordered set of named columns. Columns are expected to
 * have equal length; transposition to rows verifies it.
 */
class ColumnarBatch {
   public:
    ColumnarBatch() = default;

    /**
     * @brief Create a batch with the given columns and no rows
     */
    explicit ColumnarBatch(const std::vector<std::string>& columnNames);

    int64_t getColumnCount() const noexcept { return static_cast<int64_t>(columns_.size()); }

    /**
     * @brief Number of rows, taken from the first column (0 if there are no columns)
     */
    int64_t getRowCount() const noexcept {
        return columns_.empty() ? 0 : static_cast<int64_t>(columns_.front().size());
    }

    bool empty() const noexcept { return getRowCount() == 0; }

    const std::vector<std::string>& getColumnNames() const noexcept { return names_; }

    const std::vector<Value>& getColumn(int64_t index) const;

    std::vector<Value>& getColumn(int64_t index);

    bool hasColumn(const std::string& name) const noexcept { return nameToIndex_.contains(name); }

    const std::vector<Value>& getColumnByName(const std::string& name) const;

    /**
     * @brief Index of the named column, -1 if absent
     */
    int64_t getColumnIndex(const std::string& name) const noexcept;

    void addColumn(std::string name, std::vector<Value> values = {});

    /**
     * @brief Append a row given as a JSON object. Keys must match the column set exactly.
     */
    void appendRow(const Row& row);

    /**
     * @brief Append all rows of other, whose columns must match this batch's columns
     */
    void append(const ColumnarBatch& other);

    /**
     * @brief Copy of rows [start, start + count), clamped to the available rows
     */
    ColumnarBatch slice(int64_t start, int64_t count) const;

    /**
     * @brief Drop every row at or after newRowCount
     */
    void truncate(int64_t newRowCount);

    void clearRows() noexcept;

    /**
     * @brief Table-formatted rendering for debugging
     * @param maxRows Maximum number of rows to display (default: 20). Set to -1 for all rows.
     */
    std::string toPrettyString(int64_t maxRows = 20) const;

    bool operator==(const ColumnarBatch& other) const noexcept {
        return names_ == other.names_ && columns_ == other.columns_;
    }

   private:
    std::vector<std::string> names_;
    std::vector<std::vector<Value>> columns_;
    std::unordered_map<std::string, int64_t> nameToIndex_;
};

/**
 * @brief Transpose column-major data into rows. Every column must have the same length,
 * otherwise SchemaViolation is thrown naming the first offending column.
 */
Batch toRows(const ColumnarBatch& columnar);

/**
 * @brief Transpose rows back into columns with the given column order. Every row must
 * carry exactly these keys.
 */
ColumnarBatch toColumnar(const Batch& rows, const std::vector<std::string>& columnNames);

/**
 * @brief Transpose rows back into columns, taking the column set from the first row
 */
ColumnarBatch toColumnar(const Batch& rows);

/**
 * @brief Serialize a value as JSON text. Strings holding invalid UTF-8 (raw bytes of a
 * Latin-1 file, say) get U+FFFD in place of the bad bytes.
 * @param indent -1 for a single line
 */
std::string toJsonText(const Value& value, int indent = -1);

}  // namespace rowfeed
