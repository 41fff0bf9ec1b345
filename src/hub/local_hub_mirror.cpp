#include <algorithm>
#include <iterator>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "hub/hub_client.hpp"
#include "source/path_classifier.hpp"

namespace rowfeed {

namespace {

std::string fileStem(const std::string& path) {
    auto name = pathFileName(path);
    auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

// "train.jsonl", "train-00000-of-00002.jsonl"
bool isSplitFile(const std::string& path, const std::string& split) {
    auto stem = fileStem(path);
    return stem == split || stem.starts_with(split + "-");
}

}  // namespace

LocalHubMirror::LocalHubMirror(std::string root, StorageOptions storageOptions)
    : root_(std::move(root)), storage_options_(std::move(storageOptions)) {
    file_system_ = FileSystemRegistry::instance().resolve(root_, storage_options_);
}

std::string LocalHubMirror::repositoryPath(const std::string& repoId) const {
    return joinPath(root_, repoId);
}

DatasetInfos LocalHubMirror::getDatasetInfos(const std::string& repoId) {
    auto infosPath = joinPath(repositoryPath(repoId), infosFileName);
    if (!file_system_->isFile(infosPath)) {
        throw SourceUnavailable("No dataset infos published for repository", repoId);
    }

    auto stream = file_system_->openInput(infosPath);
    Value root;
    try {
        root = Value::parse(*stream);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaViolation(std::string("Malformed dataset infos: ") + e.what(), std::nullopt, infosPath);
    }
    return datasetInfosFromJson(root);
}

std::unique_ptr<DatasetHandle> LocalHubMirror::loadDataset(const std::string& repoId,
                                                           const std::optional<std::string>& config,
                                                           const std::string& split, bool streaming) {
    auto configPath = joinPath(repositoryPath(repoId), configKey(config));
    if (!file_system_->isDirectory(configPath)) {
        throw SourceUnavailable("Unknown repository or configuration '" + configKey(config) + "'", repoId);
    }

    PathClassifier classifier(file_system_);
    auto classification = classifier.classify(configPath);

    std::vector<std::string> files;
    for (const auto& [directory, groupFiles] : classification.grouped) {
        if (pathFileName(directory) == split) {
            files = groupFiles;
            break;
        }
    }
    if (files.empty()) {
        std::copy_if(classification.sequence.begin(), classification.sequence.end(), std::back_inserter(files),
                     [&](const std::string& path) { return isSplitFile(path, split); });
    }
    if (files.empty()) {
        throw SourceUnavailable("Unknown split '" + split + "' in configuration '" + configKey(config) + "'",
                                repoId);
    }

    auto filetype = filetypeFromExtension(pathExtension(files.front()));
    auto format = fileFormatFromString(filetype);
    if (!format) {
        throw UnsupportedMode("No reader for filetype '" + filetype + "'", repoId);
    }

    Logger::debug("Loading {} file(s) of {}/{}/{} (streaming: {})", files.size(), repoId, configKey(config), split,
                  streaming);
    return openDataset(file_system_, *format, files, streaming);
}

}  // namespace rowfeed
