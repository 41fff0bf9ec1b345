#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rowfeed {

/**
 * @brief Dynamically typed cell value. Object key order is insertion order, which keeps
 * the column order of rows stable.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief One record: a JSON object mapping column name to value
 */
using Row = Value;

/**
 * @brief Row-major batch as delivered to the pipeline executor
 */
using Batch = std::vector<Row>;

/**
 * @brief Opaque backend configuration (credentials, project ids, ...) handed to the
 * filesystem factory of a URL scheme
 */
using StorageOptions = nlohmann::json;

using RowCount = int64_t;

/**
 * @brief Name of the value kind, used in log and error messages
 */
inline std::string valueTypeName(const Value& value) {
    return value.type_name();
}

}  // namespace rowfeed
