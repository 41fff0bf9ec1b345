#include "storage/dataset_handle.hpp"
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

namespace {

constexpr RowCount readChunkRows = 8192;

}  // namespace

FileDataset::FileDataset(std::shared_ptr<FileSystem> fileSystem, FileFormat format, std::vector<std::string> files,
                         std::optional<RowCount> knownRowCount, bool streaming)
    : file_system_(std::move(fileSystem)),
      format_(format),
      files_(std::move(files)),
      known_row_count_(knownRowCount),
      streaming_(streaming),
      current_file_index_(0),
      position_(0) {
    // The first file with columns defines the schema of the dataset
    rewind();
    if (current_reader_) {
        columns_ = current_reader_->getColumnNames();
    }
    Logger::debug("Opened {} {} file(s) with {} column(s)", files_.size(), fileFormatToString(format_),
                  columns_.size());
}

std::optional<RowCount> FileDataset::getRowCount() const noexcept {
    if (!known_row_count_) {
        return std::nullopt;
    }
    return limit_ ? std::min(*known_row_count_, *limit_) : *known_row_count_;
}

void FileDataset::rewind() {
    current_file_index_ = 0;
    current_reader_.reset();
    position_ = 0;
    advanceToReadableFile();
}

bool FileDataset::advanceToReadableFile() {
    if (current_reader_ && current_reader_->hasMore()) {
        return true;
    }
    if (current_reader_) {
        current_reader_.reset();
        ++current_file_index_;
    }

    while (current_file_index_ < files_.size()) {
        const auto& path = files_[current_file_index_];
        auto reader = createFileReader(format_, file_system_, path);
        const auto& fileColumns = reader->getColumnNames();
        if (fileColumns.empty()) {
            Logger::debug("Skipping file without records: {}", path);
            ++current_file_index_;
            continue;
        }
        if (!columns_.empty() && fileColumns != columns_) {
            throw SchemaViolation("Columns differ from the first file of the dataset", std::nullopt, path);
        }
        current_reader_ = std::move(reader);
        return true;
    }
    return false;
}

RowCount FileDataset::readRows(ColumnarBatch& out, RowCount count) {
    RowCount total = 0;
    while (total < count && advanceToReadableFile()) {
        RowCount rowsRead = current_reader_->readBatch(out, count - total);
        total += rowsRead;
        if (rowsRead == 0) {
            // force the next file
            current_reader_.reset();
            ++current_file_index_;
        }
    }
    position_ += total;
    return total;
}

ColumnarBatch FileDataset::read(RowCount startRow, RowCount maxRows) {
    ColumnarBatch out(columns_);
    if (limit_) {
        maxRows = std::min(maxRows, *limit_ - startRow);
    }
    if (maxRows <= 0 || columns_.empty()) {
        return out;
    }

    if (startRow < position_) {
        Logger::debug("Rewinding dataset from row {} to row {}", position_, startRow);
        rewind();
    }

    ColumnarBatch scratch(columns_);
    while (position_ < startRow) {
        scratch.clearRows();
        if (readRows(scratch, std::min(startRow - position_, readChunkRows)) == 0) {
            return out;
        }
    }

    readRows(out, maxRows);
    return out;
}

std::unique_ptr<DatasetHandle> openDataset(std::shared_ptr<FileSystem> fileSystem, FileFormat format,
                                           const std::vector<std::string>& files, bool streaming) {
    auto dataset = std::make_unique<FileDataset>(std::move(fileSystem), format, files, std::nullopt, streaming);
    if (streaming) {
        return dataset;
    }
    return materialize(*dataset);
}

std::unique_ptr<MaterializedDataset> materialize(DatasetHandle& handle) {
    ColumnarBatch data(handle.getColumnNames());
    RowCount position = 0;
    while (true) {
        auto chunk = handle.read(position, readChunkRows);
        if (chunk.empty()) {
            break;
        }
        position += chunk.getRowCount();
        data.append(chunk);
    }
    return std::make_unique<MaterializedDataset>(std::move(data));
}

RowCount countRows(DatasetHandle& handle) {
    if (auto known = handle.getRowCount()) {
        return *known;
    }
    RowCount position = 0;
    while (true) {
        auto chunk = handle.read(position, readChunkRows);
        if (chunk.empty()) {
            break;
        }
        position += chunk.getRowCount();
    }
    return position;
}

}  // namespace rowfeed
