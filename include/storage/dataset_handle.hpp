#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/batch.hpp"
#include "common/types.hpp"
#include "storage/data_file_reader.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

/**
 * @brief Backing dataset of a source. Owned by exactly one adapter.
 */
class DatasetHandle {
public:
    virtual ~DatasetHandle() = default;

    virtual const std::vector<std::string>& getColumnNames() const noexcept = 0;

    /**
     * @brief Total number of rows, nullopt when it is unknown without a full pass
     */
    virtual std::optional<RowCount> getRowCount() const noexcept = 0;

    /**
     * @brief Read up to maxRows rows starting at startRow, in source order. Returns fewer
     * rows only at the end of the dataset.
     */
    virtual ColumnarBatch read(RowCount startRow, RowCount maxRows) = 0;

    /**
     * @brief Keep only the first rowCount rows
     */
    virtual void truncate(RowCount rowCount) = 0;

    virtual bool isStreaming() const noexcept = 0;

    /**
     * @brief True if read() at an arbitrary offset costs no more than a sequential read
     */
    virtual bool supportsRandomAccess() const noexcept = 0;
};

/**
 * @brief Dataset held entirely in memory in columnar form
 */
class MaterializedDataset : public DatasetHandle {
public:
    explicit MaterializedDataset(ColumnarBatch data) : data_(std::move(data)) {}

    const std::vector<std::string>& getColumnNames() const noexcept override { return data_.getColumnNames(); }

    std::optional<RowCount> getRowCount() const noexcept override { return data_.getRowCount(); }

    ColumnarBatch read(RowCount startRow, RowCount maxRows) override { return data_.slice(startRow, maxRows); }

    void truncate(RowCount rowCount) override { data_.truncate(rowCount); }

    bool isStreaming() const noexcept override { return false; }

    bool supportsRandomAccess() const noexcept override { return true; }

    const ColumnarBatch& getData() const noexcept { return data_; }

private:
    ColumnarBatch data_;
};

/**
 * @brief Dataset read lazily from a sequence of files of one format. Reads are forward
 * only; reading before the current position rewinds to the first file.
 */
class FileDataset : public DatasetHandle {
public:
    /**
     * @param knownRowCount Row count recorded elsewhere (e.g. a snapshot manifest)
     * @param streaming Whether the dataset is consumed as a stream
     */
    FileDataset(std::shared_ptr<FileSystem> fileSystem, FileFormat format, std::vector<std::string> files,
                std::optional<RowCount> knownRowCount = std::nullopt, bool streaming = true);

    FileDataset(const FileDataset&) = delete;
    FileDataset& operator=(const FileDataset&) = delete;

    const std::vector<std::string>& getColumnNames() const noexcept override { return columns_; }

    std::optional<RowCount> getRowCount() const noexcept override;

    ColumnarBatch read(RowCount startRow, RowCount maxRows) override;

    void truncate(RowCount rowCount) override { limit_ = rowCount; }

    bool isStreaming() const noexcept override { return streaming_; }

    bool supportsRandomAccess() const noexcept override { return false; }

private:
    std::shared_ptr<FileSystem> file_system_;
    FileFormat format_;
    std::vector<std::string> files_;
    std::optional<RowCount> known_row_count_;
    std::optional<RowCount> limit_;
    bool streaming_;

    std::vector<std::string> columns_;
    size_t current_file_index_;
    std::unique_ptr<DataFileReader> current_reader_;
    RowCount position_;

    void rewind();

    /**
     * @brief Make current_reader_ point at the next file holding rows. Returns false
     * once all files are exhausted.
     */
    bool advanceToReadableFile();

    RowCount readRows(ColumnarBatch& out, RowCount count);
};

/**
 * @brief Open a dataset over the given files. Non-streaming datasets are read fully into
 * memory; streaming ones are read lazily.
 */
std::unique_ptr<DatasetHandle> openDataset(std::shared_ptr<FileSystem> fileSystem, FileFormat format,
                                           const std::vector<std::string>& files, bool streaming);

/**
 * @brief Read every row of a handle into memory
 */
std::unique_ptr<MaterializedDataset> materialize(DatasetHandle& handle);

/**
 * @brief Number of rows of a handle. Handles that do not know their size are read once
 * chunk by chunk; only the current chunk is held in memory.
 */
RowCount countRows(DatasetHandle& handle);

}  // namespace rowfeed
