#include "source/schema_resolver.hpp"
#include "common/errors.hpp"

namespace rowfeed {

std::vector<std::string> SchemaResolver::resolve(const DatasetInfos& infos, const std::optional<std::string>& config,
                                                 const std::string& sourceDescription) {
    auto it = infos.find(configKey(config));
    if (it == infos.end()) {
        throw SourceUnavailable("No dataset info for configuration '" + configKey(config) + "'", sourceDescription);
    }
    if (it->second.features.empty()) {
        throw EmptySource("Dataset info lists no columns", sourceDescription);
    }
    return it->second.features;
}

std::vector<std::string> SchemaResolver::resolve(const DatasetHandle& handle, const std::string& sourceDescription) {
    const auto& columns = handle.getColumnNames();
    if (columns.empty()) {
        throw EmptySource("No columns could be resolved", sourceDescription);
    }
    return columns;
}

}  // namespace rowfeed
