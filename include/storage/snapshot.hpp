#pragma once

#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/batch.hpp"
#include "common/types.hpp"
#include "storage/dataset_handle.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

struct FileEntry {
    // relative to the dataset directory
    std::string path;
    std::optional<RowCount> row_count;

    Value to_json() const {
        Value obj;
        obj["path"] = path;
        if (row_count)
            obj["row_count"] = *row_count;
        return obj;
    }

    static FileEntry from_json(const Value& j) {
        FileEntry fileEntry;
        fileEntry.path = j.at("path").get<std::string>();
        if (j.contains("row_count"))
            fileEntry.row_count = j.at("row_count").get<RowCount>();
        return fileEntry;
    }
};

/**
 * @brief Manifest of one materialized dataset: data files, their format and row counts
 */
struct DatasetManifest {
    std::string format;
    std::vector<std::string> columns;
    std::vector<FileEntry> files;
    std::string generated_at;

    /**
     * @brief Sum of the file row counts, nullopt if any file has none recorded
     */
    std::optional<RowCount> getRowCount() const noexcept;

    Value to_json() const;

    static DatasetManifest from_json(const Value& obj);

    static constexpr const char* fileName = "dataset_manifest.json";
};

/**
 * @brief Loaded snapshot tree. A dataset leaf, a dictionary of splits, or a distiset
 * (dictionary of configurations, each a dictionary of splits).
 */
class SnapshotNode {
public:
    enum class Kind { DATASET, SPLIT_DICT, DISTISET };

    Kind getKind() const noexcept { return kind_; }

    const std::string& getPath() const noexcept { return path_; }

    bool isDataset() const noexcept { return kind_ == Kind::DATASET; }

    std::vector<std::string> keys() const;

    /**
     * @brief Child by configuration or split name
     * @throws SourceUnavailable if there is no such child
     */
    const SnapshotNode& at(const std::string& key) const;

    /**
     * @throws UnsupportedMode if this node is not a dataset
     */
    const DatasetManifest& getManifest() const;

    /**
     * @brief Open the dataset of a leaf node, either fully in memory or file backed with the
     * row count of the manifest
     */
    std::unique_ptr<DatasetHandle> openDataset(std::shared_ptr<FileSystem> fileSystem, bool keepInMemory) const;

    static constexpr const char* dictFileName = "dataset_dict.json";

    /**
     * @brief Load the snapshot stored at path. With isDistiset the directory is read as a set of
     * configurations, each stored as a dictionary of splits.
     * @throws SourceUnavailable if the path holds no snapshot
     */
    static SnapshotNode load(std::shared_ptr<FileSystem> fileSystem, const std::string& path, bool isDistiset);

private:
    Kind kind_ = Kind::DATASET;
    std::string path_;
    std::optional<DatasetManifest> manifest_;
    std::map<std::string, std::unique_ptr<SnapshotNode>> children_;

    static SnapshotNode loadDataset(FileSystem& fileSystem, const std::string& path);

    static SnapshotNode loadSplitDict(FileSystem& fileSystem, const std::string& path);
};

/**
 * @brief Writes snapshots readable by SnapshotNode::load. Manifests are persisted atomically
 * under an exclusive lock file.
 */
class SnapshotWriter {
public:
    explicit SnapshotWriter(std::filesystem::path root, RowCount rowsPerShard = 100000)
        : root_(std::move(root)), rows_per_shard_(std::max<RowCount>(rowsPerShard, 1)) {}

    void saveDataset(const ColumnarBatch& data);

    void saveDatasetDict(const std::map<std::string, ColumnarBatch>& splits);

    void saveDistiset(const std::map<std::string, std::map<std::string, ColumnarBatch>>& configs);

private:
    std::filesystem::path root_;
    RowCount rows_per_shard_;

    void writeDataset(const std::filesystem::path& dir, const ColumnarBatch& data);

    void writeSplitDict(const std::filesystem::path& dir, const std::map<std::string, ColumnarBatch>& splits);

    static void persistAtomic(const std::filesystem::path& target, const Value& content);
};

}  // namespace rowfeed
