#pragma once

#include <optional>
#include <string>
#include <variant>
#include "common/types.hpp"
#include "source/path_classifier.hpp"

namespace rowfeed {

struct HubDescriptor {
    std::string repoId;
    std::optional<std::string> config;
    std::string split = defaultSplitName;
};

struct FilesystemDescriptor {
    // file or directory, optionally prefixed with a URL scheme
    std::string dataFiles;
    std::optional<std::string> filetype;
    std::string split = defaultSplitName;
};

struct SnapshotDescriptor {
    std::string datasetPath;
    std::optional<std::string> config;
    std::optional<std::string> split;
    bool isDistiset = false;
    std::optional<bool> keepInMemory;
};

using SourceDescriptor = std::variant<HubDescriptor, FilesystemDescriptor, SnapshotDescriptor>;

/**
 * @brief Parameters shared by every source kind
 */
struct LoadOptions {
    bool streaming = false;
    // maximum number of rows to deliver, all rows when unset
    std::optional<RowCount> rowLimit;
    StorageOptions storageOptions = StorageOptions::object();
};

std::string describe(const HubDescriptor& descriptor);

std::string describe(const FilesystemDescriptor& descriptor);

std::string describe(const SnapshotDescriptor& descriptor);

std::string describe(const SourceDescriptor& descriptor);

}  // namespace rowfeed
