#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace rowfeed {

/**
 * @brief Metadata of one dataset configuration: its columns and the size of each split
 */
struct DatasetInfo {
    std::vector<std::string> features;
    std::map<std::string, RowCount> splits;

    Value to_json() const;

    /**
     * @brief Accepts "features" either as an object keyed by column name (key order is
     * column order) or as an array of column names
     */
    static DatasetInfo from_json(const Value& obj);
};

/**
 * @brief Dataset infos keyed by configuration name
 */
using DatasetInfos = std::map<std::string, DatasetInfo>;

inline constexpr const char* defaultConfigName = "default";

/**
 * @brief Key under which a configuration's info is stored
 */
inline std::string configKey(const std::optional<std::string>& config) {
    return config ? *config : defaultConfigName;
}

Value datasetInfosToJson(const DatasetInfos& infos);

DatasetInfos datasetInfosFromJson(const Value& root);

}  // namespace rowfeed
