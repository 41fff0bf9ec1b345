#include "source/path_classifier.hpp"
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "storage/data_file_reader.hpp"

namespace rowfeed {

namespace {

bool isHidden(const std::string& path) {
    auto name = pathFileName(path);
    return !name.empty() && name.front() == '.';
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

}  // namespace

DataFiles PathClassification::dataFiles() const {
    if (singleFile) {
        return *singleFile;
    }
    if (!sequence.empty()) {
        return sequence;
    }
    return grouped;
}

std::vector<std::string> PathClassifier::sortedChildren(const std::string& directory) const {
    auto children = file_system_->listDirectory(directory);
    std::erase_if(children, isHidden);
    std::sort(children.begin(), children.end());
    return children;
}

PathClassification PathClassifier::classify(const std::string& path) const {
    PathClassification result;

    if (file_system_->isFile(path)) {
        result.singleFile = path;
        result.filetype = filetypeFromExtension(pathExtension(path));
        Logger::debug("Classified '{}' as a single {} file", path, result.filetype);
        return result;
    }

    if (!file_system_->isDirectory(path)) {
        throw SourceUnavailable("Path does not exist", path);
    }

    for (const auto& child : sortedChildren(path)) {
        if (file_system_->isFile(child)) {
            result.sequence.push_back(child);
        } else if (file_system_->isDirectory(child)) {
            auto& files = result.grouped[child];
            for (const auto& nested : sortedChildren(child)) {
                if (file_system_->isFile(nested)) {
                    files.push_back(nested);
                }
            }
        }
    }

    std::erase_if(result.grouped, [](const auto& entry) { return entry.second.empty(); });

    // Assume every file has the same type as the first one
    std::optional<std::string> firstFile;
    if (!result.sequence.empty()) {
        firstFile = result.sequence.front();
    } else if (!result.grouped.empty()) {
        firstFile = result.grouped.begin()->second.front();
    }
    if (!firstFile) {
        throw UnresolvableFiletype("Directory contains no files", path);
    }
    result.filetype = filetypeFromExtension(pathExtension(*firstFile));

    Logger::debug("Classified '{}': {} flat file(s), {} group(s), filetype '{}'", path, result.sequence.size(),
                  result.grouped.size(), result.filetype);
    return result;
}

std::vector<std::string> selectSplitFiles(const DataFiles& dataFiles, const std::string& split) {
    if (const auto* grouped = std::get_if<std::map<std::string, std::vector<std::string>>>(&dataFiles)) {
        auto it = grouped->find(split);
        if (it != grouped->end()) {
            return it->second;
        }
        std::vector<std::string> available;
        for (const auto& [key, files] : *grouped) {
            if (pathFileName(key) == split) {
                return files;
            }
            available.push_back(pathFileName(key));
        }
        throw SourceUnavailable("Unknown split '" + split + "', available splits: " + joinNames(available));
    }

    if (split != defaultSplitName) {
        throw SourceUnavailable("Unknown split '" + split + "', ungrouped data files only form the split '" +
                                std::string(defaultSplitName) + "'");
    }
    if (const auto* single = std::get_if<std::string>(&dataFiles)) {
        return {*single};
    }
    return std::get<std::vector<std::string>>(dataFiles);
}

}  // namespace rowfeed
