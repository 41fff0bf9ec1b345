#include "storage/snapshot.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "storage/metadata_lock.hpp"

namespace rowfeed {

namespace fs = std::filesystem;

namespace {

Value readJsonFile(FileSystem& fileSystem, const std::string& path) {
    auto stream = fileSystem.openInput(path);
    try {
        return Value::parse(*stream);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaViolation(std::string("Malformed snapshot metadata: ") + e.what(), std::nullopt, path);
    }
}

std::string shardName(size_t index, size_t count) {
    char name[64];
    std::snprintf(name, sizeof(name), "data-%05zu-of-%05zu.jsonl", index, count);
    return name;
}

}  // namespace

std::optional<RowCount> DatasetManifest::getRowCount() const noexcept {
    RowCount total = 0;
    for (const auto& file : files) {
        if (!file.row_count)
            return std::nullopt;
        total += *file.row_count;
    }
    return total;
}

Value DatasetManifest::to_json() const {
    Value obj;
    obj["format"] = format;
    obj["columns"] = columns;
    obj["files"] = Value::array();
    for (auto& f : files)
        obj["files"].push_back(f.to_json());
    obj["generated_at"] = generated_at;
    return obj;
}

DatasetManifest DatasetManifest::from_json(const Value& obj) {
    DatasetManifest manifest;
    manifest.format = obj.at("format").get<std::string>();
    if (obj.contains("columns")) {
        for (auto& cj : obj.at("columns"))
            manifest.columns.push_back(cj.get<std::string>());
    }
    if (obj.contains("files")) {
        for (auto& fj : obj.at("files"))
            manifest.files.push_back(FileEntry::from_json(fj));
    }
    manifest.generated_at = obj.value("generated_at", "");
    return manifest;
}

std::vector<std::string> SnapshotNode::keys() const {
    std::vector<std::string> out;
    out.reserve(children_.size());
    for (auto& kv : children_)
        out.push_back(kv.first);
    return out;
}

const SnapshotNode& SnapshotNode::at(const std::string& key) const {
    auto it = children_.find(key);
    if (it == children_.end()) {
        std::string available;
        for (const auto& name : keys())
            available += (available.empty() ? "" : ", ") + name;
        throw SourceUnavailable("Snapshot has no entry '" + key + "', available: [" + available + "]", path_);
    }
    return *it->second;
}

const DatasetManifest& SnapshotNode::getManifest() const {
    if (!manifest_) {
        std::string available;
        for (const auto& name : keys())
            available += (available.empty() ? "" : ", ") + name;
        throw UnsupportedMode("Snapshot entry holds several datasets [" + available + "], select one", path_);
    }
    return *manifest_;
}

std::unique_ptr<DatasetHandle> SnapshotNode::openDataset(std::shared_ptr<FileSystem> fileSystem,
                                                        bool keepInMemory) const {
    const auto& manifest = getManifest();
    auto format = fileFormatFromString(manifest.format);
    if (!format) {
        throw UnsupportedMode("No reader for snapshot format '" + manifest.format + "'", path_);
    }

    // Empty shards carry no records to read the columns from
    if (manifest.getRowCount() == 0) {
        return std::make_unique<MaterializedDataset>(ColumnarBatch(manifest.columns));
    }

    std::vector<std::string> files;
    files.reserve(manifest.files.size());
    for (const auto& file : manifest.files)
        files.push_back(joinPath(path_, file.path));

    auto dataset = std::make_unique<FileDataset>(std::move(fileSystem), *format, std::move(files),
                                                 manifest.getRowCount(), false);
    if (!manifest.files.empty() && dataset->getColumnNames() != manifest.columns) {
        throw SchemaViolation("Data files do not match the columns of the manifest", std::nullopt, path_);
    }
    if (keepInMemory) {
        return materialize(*dataset);
    }
    return dataset;
}

SnapshotNode SnapshotNode::loadDataset(FileSystem& fileSystem, const std::string& path) {
    SnapshotNode node;
    node.kind_ = Kind::DATASET;
    node.path_ = path;
    try {
        node.manifest_ = DatasetManifest::from_json(readJsonFile(fileSystem, joinPath(path, DatasetManifest::fileName)));
    } catch (const nlohmann::json::exception& e) {
        throw SchemaViolation(std::string("Invalid dataset manifest: ") + e.what(), std::nullopt, path);
    }
    return node;
}

SnapshotNode SnapshotNode::loadSplitDict(FileSystem& fileSystem, const std::string& path) {
    SnapshotNode node;
    node.kind_ = Kind::SPLIT_DICT;
    node.path_ = path;
    auto root = readJsonFile(fileSystem, joinPath(path, dictFileName));
    if (!root.contains("splits") || !root.at("splits").is_array()) {
        throw SchemaViolation("Dataset dictionary lists no splits", std::nullopt, path);
    }
    for (const auto& split : root.at("splits")) {
        auto name = split.get<std::string>();
        node.children_[name] = std::make_unique<SnapshotNode>(loadDataset(fileSystem, joinPath(path, name)));
    }
    return node;
}

SnapshotNode SnapshotNode::load(std::shared_ptr<FileSystem> fileSystem, const std::string& path, bool isDistiset) {
    if (!fileSystem->isDirectory(path)) {
        throw SourceUnavailable("Snapshot directory does not exist", path);
    }

    if (isDistiset) {
        SnapshotNode node;
        node.kind_ = Kind::DISTISET;
        node.path_ = path;
        auto children = fileSystem->listDirectory(path);
        std::sort(children.begin(), children.end());
        for (const auto& child : children) {
            if (fileSystem->isFile(joinPath(child, dictFileName))) {
                node.children_[pathFileName(child)] =
                    std::make_unique<SnapshotNode>(loadSplitDict(*fileSystem, child));
            }
        }
        if (node.children_.empty()) {
            throw SourceUnavailable("Distiset holds no configurations", path);
        }
        Logger::debug("Loaded distiset '{}' with {} configuration(s)", path, node.children_.size());
        return node;
    }

    if (fileSystem->isFile(joinPath(path, DatasetManifest::fileName))) {
        return loadDataset(*fileSystem, path);
    }
    if (fileSystem->isFile(joinPath(path, dictFileName))) {
        return loadSplitDict(*fileSystem, path);
    }
    throw SourceUnavailable("Directory holds no dataset snapshot", path);
}

void SnapshotWriter::saveDataset(const ColumnarBatch& data) {
    writeDataset(root_, data);
}

void SnapshotWriter::saveDatasetDict(const std::map<std::string, ColumnarBatch>& splits) {
    writeSplitDict(root_, splits);
}

void SnapshotWriter::saveDistiset(const std::map<std::string, std::map<std::string, ColumnarBatch>>& configs) {
    for (const auto& [config, splits] : configs)
        writeSplitDict(root_ / config, splits);
}

void SnapshotWriter::writeSplitDict(const fs::path& dir, const std::map<std::string, ColumnarBatch>& splits) {
    Value root;
    root["splits"] = Value::array();
    for (const auto& [split, data] : splits) {
        writeDataset(dir / split, data);
        root["splits"].push_back(split);
    }
    persistAtomic(dir / SnapshotNode::dictFileName, root);
}

void SnapshotWriter::writeDataset(const fs::path& dir, const ColumnarBatch& data) {
    fs::create_directories(dir);

    DatasetManifest manifest;
    manifest.format = "json";
    manifest.columns = data.getColumnNames();
    manifest.generated_at = currentTimestamp();

    RowCount rowCount = data.getRowCount();
    size_t shardCount = rowCount == 0 ? 1 : static_cast<size_t>((rowCount + rows_per_shard_ - 1) / rows_per_shard_);
    for (size_t shard = 0; shard < shardCount; ++shard) {
        auto name = shardName(shard, shardCount);
        auto rows = toRows(data.slice(static_cast<RowCount>(shard) * rows_per_shard_, rows_per_shard_));
        std::ofstream ofs(dir / name, std::ios::trunc);
        for (const auto& row : rows)
            ofs << toJsonText(row) << '\n';
        ofs.close();
        if (!ofs) {
            throw SourceUnavailable("Error writing snapshot file", (dir / name).string());
        }
        manifest.files.push_back(FileEntry{name, static_cast<RowCount>(rows.size())});
    }

    persistAtomic(dir / DatasetManifest::fileName, manifest.to_json());
    Logger::info("Saved {} row(s) in {} file(s) to {}", rowCount, shardCount, dir.string());
}

void SnapshotWriter::persistAtomic(const fs::path& target, const Value& content) {
    MetadataLock lock(target);

    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp.string(), std::ios::trunc);
        ofs << toJsonText(content, 2);
        ofs.close();
        if (!ofs) {
            throw SourceUnavailable("Error writing snapshot metadata", tmp.string());
        }
    }
    // Rename (atomic on most OSes)
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw SourceUnavailable("Error writing snapshot metadata: " + ec.message(), target.string());
    }
}

}  // namespace rowfeed
