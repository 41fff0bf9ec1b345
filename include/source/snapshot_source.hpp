#pragma once

#include <memory>
#include <vector>
#include "source/source_adapter.hpp"
#include "source/source_descriptor.hpp"
#include "storage/dataset_handle.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

/**
 * @brief Source reading a snapshot previously saved to disk: a single dataset, a
 * dictionary of splits, or a distiset of configurations. Streaming is not supported.
 */
class SnapshotSource : public SourceAdapter {
public:
    SnapshotSource(SnapshotDescriptor descriptor, LoadOptions options);

    SnapshotSource(const SnapshotSource&) = delete;
    SnapshotSource& operator=(const SnapshotSource&) = delete;

    void open() override;

    bool isOpen() const noexcept override { return opened_; }

    RowCount rowCount() const override;

    const std::vector<std::string>& columns() const override;

    ColumnarBatch readColumnar(RowCount startRow, RowCount batchSize) override;

    bool supportsSeek() const noexcept override { return dataset_ && dataset_->supportsRandomAccess(); }

    bool isStreaming() const noexcept override { return false; }

    std::string describe() const override { return rowfeed::describe(descriptor_); }

private:
    SnapshotDescriptor descriptor_;
    LoadOptions options_;

    std::shared_ptr<FileSystem> file_system_;
    std::unique_ptr<DatasetHandle> dataset_;
    bool opened_;
    RowCount row_budget_;
    std::vector<std::string> columns_;
};

}  // namespace rowfeed
