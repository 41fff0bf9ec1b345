#include "hub/dataset_info.hpp"
#include "common/errors.hpp"

namespace rowfeed {

Value DatasetInfo::to_json() const {
    Value obj;
    obj["features"] = Value::array();
    for (const auto& feature : features)
        obj["features"].push_back(feature);
    obj["splits"] = Value::object();
    for (const auto& [name, numExamples] : splits)
        obj["splits"][name] = Value{{"name", name}, {"num_examples", numExamples}};
    return obj;
}

DatasetInfo DatasetInfo::from_json(const Value& obj) {
    DatasetInfo info;
    if (obj.contains("features")) {
        const auto& features = obj.at("features");
        if (features.is_object()) {
            for (const auto& feature : features.items())
                info.features.push_back(feature.key());
        } else {
            for (const auto& name : features)
                info.features.push_back(name.get<std::string>());
        }
    }
    if (obj.contains("splits")) {
        for (const auto& [name, split] : obj.at("splits").items()) {
            info.splits[name] = split.is_number() ? split.get<RowCount>() : split.at("num_examples").get<RowCount>();
        }
    }
    return info;
}

Value datasetInfosToJson(const DatasetInfos& infos) {
    Value root = Value::object();
    for (const auto& [config, info] : infos)
        root[config] = info.to_json();
    return root;
}

DatasetInfos datasetInfosFromJson(const Value& root) {
    if (!root.is_object()) {
        throw SchemaViolation("Dataset infos must be a JSON object keyed by configuration");
    }
    DatasetInfos infos;
    for (const auto& [config, info] : root.items())
        infos[config] = DatasetInfo::from_json(info);
    return infos;
}

}  // namespace rowfeed
