#include "config/source_config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <variant>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "source/filesystem_source.hpp"
#include "source/hub_source.hpp"
#include "source/snapshot_source.hpp"

namespace rowfeed {

namespace {

constexpr const char* hubMirrorVariable = "ROWFEED_HUB_MIRROR";

std::string requireString(const Value& obj, const std::string& key) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        throw InvalidConfiguration(key, "is required");
    }
    if (!obj.at(key).is_string() || obj.at(key).get<std::string>().empty()) {
        throw InvalidConfiguration(key, "must be a non-empty string");
    }
    return obj.at(key).get<std::string>();
}

std::optional<std::string> optionalString(const Value& obj, const std::string& key) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return std::nullopt;
    }
    if (!obj.at(key).is_string()) {
        throw InvalidConfiguration(key, "must be a string");
    }
    return obj.at(key).get<std::string>();
}

std::optional<bool> optionalBool(const Value& obj, const std::string& key) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return std::nullopt;
    }
    if (!obj.at(key).is_boolean()) {
        throw InvalidConfiguration(key, "must be a boolean");
    }
    return obj.at(key).get<bool>();
}

std::optional<RowCount> optionalCount(const Value& obj, const std::string& key, RowCount minimum) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return std::nullopt;
    }
    if (!obj.at(key).is_number_integer()) {
        throw InvalidConfiguration(key, "must be an integer");
    }
    auto value = obj.at(key).get<RowCount>();
    if (value < minimum) {
        throw InvalidConfiguration(key, "must be >= " + std::to_string(minimum) + ", got " + std::to_string(value));
    }
    return value;
}

void putOptional(Value& obj, const std::string& key, const std::optional<std::string>& value) {
    if (value)
        obj[key] = *value;
}

}  // namespace

std::string sourceKindToString(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::HUB:
            return "hub";
        case SourceKind::FILESYSTEM:
            return "filesystem";
        case SourceKind::SNAPSHOT:
            return "snapshot";
    }
    return "unknown";
}

std::optional<SourceKind> sourceKindFromString(const std::string& s) noexcept {
    if (s == "hub") {
        return SourceKind::HUB;
    } else if (s == "filesystem") {
        return SourceKind::FILESYSTEM;
    } else if (s == "snapshot" || s == "disk") {
        return SourceKind::SNAPSHOT;
    } else {
        return std::nullopt;
    }
}

SourceKind SourceConfig::getKind() const noexcept {
    return static_cast<SourceKind>(descriptor.index());
}

Value SourceConfig::to_json() const {
    Value obj;
    obj["kind"] = sourceKindToString(getKind());
    if (const auto* hub = std::get_if<HubDescriptor>(&descriptor)) {
        obj["repo_id"] = hub->repoId;
        putOptional(obj, "config", hub->config);
        obj["split"] = hub->split;
    } else if (const auto* files = std::get_if<FilesystemDescriptor>(&descriptor)) {
        obj["data_files"] = files->dataFiles;
        putOptional(obj, "filetype", files->filetype);
        obj["split"] = files->split;
    } else if (const auto* snapshot = std::get_if<SnapshotDescriptor>(&descriptor)) {
        obj["dataset_path"] = snapshot->datasetPath;
        putOptional(obj, "config", snapshot->config);
        putOptional(obj, "split", snapshot->split);
        obj["is_distiset"] = snapshot->isDistiset;
        if (snapshot->keepInMemory)
            obj["keep_in_memory"] = *snapshot->keepInMemory;
    }
    obj["streaming"] = options.streaming;
    if (options.rowLimit)
        obj["num_examples"] = *options.rowLimit;
    obj["batch_size"] = batchSize;
    if (!options.storageOptions.empty())
        obj["storage_options"] = Value::parse(options.storageOptions.dump());
    putOptional(obj, "hub_mirror", hubMirror);
    return obj;
}

SourceConfig SourceConfig::from_json(const Value& obj) {
    if (!obj.is_object()) {
        throw InvalidConfiguration("<root>", "must be a JSON object");
    }

    auto kindName = requireString(obj, "kind");
    auto kind = sourceKindFromString(kindName);
    if (!kind) {
        throw InvalidConfiguration("kind", "unknown source kind '" + kindName + "'");
    }

    SourceConfig config;
    switch (*kind) {
        case SourceKind::HUB: {
            HubDescriptor hub;
            hub.repoId = requireString(obj, "repo_id");
            hub.config = optionalString(obj, "config");
            hub.split = optionalString(obj, "split").value_or(defaultSplitName);
            config.descriptor = std::move(hub);
            break;
        }
        case SourceKind::FILESYSTEM: {
            FilesystemDescriptor files;
            files.dataFiles = requireString(obj, "data_files");
            files.filetype = optionalString(obj, "filetype");
            files.split = optionalString(obj, "split").value_or(defaultSplitName);
            config.descriptor = std::move(files);
            break;
        }
        case SourceKind::SNAPSHOT: {
            SnapshotDescriptor snapshot;
            snapshot.datasetPath = requireString(obj, "dataset_path");
            snapshot.config = optionalString(obj, "config");
            snapshot.split = optionalString(obj, "split");
            snapshot.isDistiset = optionalBool(obj, "is_distiset").value_or(false);
            snapshot.keepInMemory = optionalBool(obj, "keep_in_memory");
            config.descriptor = std::move(snapshot);
            break;
        }
    }

    config.options.streaming = optionalBool(obj, "streaming").value_or(false);
    config.options.rowLimit = optionalCount(obj, "num_examples", 0);
    config.batchSize = optionalCount(obj, "batch_size", 1).value_or(50);
    if (obj.contains("storage_options") && !obj.at("storage_options").is_null()) {
        if (!obj.at("storage_options").is_object()) {
            throw InvalidConfiguration("storage_options", "must be a JSON object");
        }
        config.options.storageOptions = StorageOptions::parse(obj.at("storage_options").dump());
    }
    config.hubMirror = optionalString(obj, "hub_mirror");
    return config;
}

SourceConfig SourceConfig::fromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw SourceUnavailable("Cannot read configuration file '" + path + "'");
    }
    Value root;
    try {
        ifs >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidConfiguration("<root>", std::string("malformed JSON in '") + path + "': " + e.what());
    }
    return from_json(root);
}

std::expected<SourceConfig, std::string> parseSourceConfig(const std::string& text) {
    Value root;
    try {
        root = Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string("malformed JSON: ") + e.what());
    }
    try {
        return SourceConfig::from_json(root);
    } catch (const InvalidConfiguration& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::unique_ptr<SourceAdapter> makeSourceAdapter(const SourceConfig& config, SourceServices services) {
    return std::visit(
        [&](const auto& descriptor) -> std::unique_ptr<SourceAdapter> {
            using descriptor_t = std::decay_t<decltype(descriptor)>;
            if constexpr (std::is_same_v<descriptor_t, HubDescriptor>) {
                if (!services.repository) {
                    auto mirror = config.hubMirror;
                    if (!mirror) {
                        if (const char* fromEnv = std::getenv(hubMirrorVariable); fromEnv && *fromEnv)
                            mirror = fromEnv;
                    }
                    if (!mirror) {
                        throw InvalidConfiguration("hub_mirror", "no hub available for repository '" +
                                                                     descriptor.repoId + "'");
                    }
                    auto hub = std::make_shared<LocalHubMirror>(*mirror, config.options.storageOptions);
                    services.repository = hub;
                    if (!services.infoService)
                        services.infoService = hub;
                }
                return std::make_unique<HubSource>(descriptor, config.options, services.infoService,
                                                   services.repository);
            } else if constexpr (std::is_same_v<descriptor_t, FilesystemDescriptor>) {
                return std::make_unique<FilesystemSource>(descriptor, config.options);
            } else {
                return std::make_unique<SnapshotSource>(descriptor, config.options);
            }
        },
        config.descriptor);
}

}  // namespace rowfeed
