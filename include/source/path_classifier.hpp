#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "storage/filesystem.hpp"

namespace rowfeed {

/**
 * @brief Files making up a dataset: one file, a flat sequence of files, or files grouped
 * by the sub-directory that holds them (one group per split)
 */
using DataFiles = std::variant<std::string, std::vector<std::string>, std::map<std::string, std::vector<std::string>>>;

struct PathClassification {
    std::optional<std::string> singleFile;

    // regular files directly inside the directory
    std::vector<std::string> sequence;

    // child directory path -> regular files inside it
    std::map<std::string, std::vector<std::string>> grouped;

    // inferred from the first file, empty when that file has no extension
    std::string filetype;

    /**
     * @brief Preferred grouping handed to the loader: the single file, else the flat
     * sequence when non-empty, else the grouped mapping
     */
    DataFiles dataFiles() const;
};

/**
 * @brief Decides how a path maps to data files and which format they have
 */
class PathClassifier {
public:
    explicit PathClassifier(std::shared_ptr<FileSystem> fileSystem) : file_system_(std::move(fileSystem)) {}

    /**
     * @brief Classify a file or directory path.
     *
     * Children of a directory are visited in name order and hidden entries are skipped.
     * Only one level of sub-directories is expanded.
     *
     * @throws SourceUnavailable if the path does not exist
     * @throws UnresolvableFiletype if a directory contains no files
     */
    PathClassification classify(const std::string& path) const;

private:
    std::shared_ptr<FileSystem> file_system_;

    std::vector<std::string> sortedChildren(const std::string& directory) const;
};

/**
 * @brief Files of the given split. A single file or a flat sequence is the lone split
 * "train"; a grouped mapping is indexed by its key or by the key's last path component.
 *
 * @throws SourceUnavailable if the split does not exist
 */
std::vector<std::string> selectSplitFiles(const DataFiles& dataFiles, const std::string& split);

/**
 * @brief Name of the single split formed by an ungrouped set of files
 */
inline constexpr const char* defaultSplitName = "train";

}  // namespace rowfeed
