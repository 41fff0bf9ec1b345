#pragma once

#include <optional>
#include <string>
#include <vector>
#include "hub/dataset_info.hpp"
#include "storage/dataset_handle.hpp"

namespace rowfeed {

/**
 * @brief Determines the output columns of a source. Nothing is cached here; adapters keep
 * the result for their own lifetime.
 */
class SchemaResolver {
public:
    /**
     * @brief Feature names of the info stored for config (or "default")
     * @throws SourceUnavailable if the configuration is unknown
     * @throws EmptySource if it lists no features
     */
    static std::vector<std::string> resolve(const DatasetInfos& infos, const std::optional<std::string>& config,
                                            const std::string& sourceDescription);

    /**
     * @brief Column names of an opened handle
     * @throws EmptySource if the handle has no columns
     */
    static std::vector<std::string> resolve(const DatasetHandle& handle, const std::string& sourceDescription);
};

}  // namespace rowfeed
