#pragma once

#include <memory>
#include <vector>
#include "source/path_classifier.hpp"
#include "source/source_adapter.hpp"
#include "source/source_descriptor.hpp"
#include "storage/dataset_handle.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

/**
 * @brief Source reading a file, a directory of files or a directory of per-split
 * sub-directories. The format is inferred from the file extensions unless given.
 */
class FilesystemSource : public SourceAdapter {
public:
    FilesystemSource(FilesystemDescriptor descriptor, LoadOptions options);

    FilesystemSource(const FilesystemSource&) = delete;
    FilesystemSource& operator=(const FilesystemSource&) = delete;

    void open() override;

    bool isOpen() const noexcept override { return opened_; }

    RowCount rowCount() const override;

    const std::vector<std::string>& columns() const override;

    ColumnarBatch readColumnar(RowCount startRow, RowCount batchSize) override;

    bool supportsSeek() const noexcept override { return dataset_ && dataset_->supportsRandomAccess(); }

    bool isStreaming() const noexcept override { return options_.streaming; }

    std::string describe() const override { return rowfeed::describe(descriptor_); }

    /**
     * @brief Filetype used to read the files; the override or the inferred one. Set by open().
     */
    const std::string& getFiletype() const noexcept { return filetype_; }

    /**
     * @brief Files of the selected split. Set by open().
     */
    const std::vector<std::string>& getSplitFiles() const noexcept { return split_files_; }

private:
    FilesystemDescriptor descriptor_;
    LoadOptions options_;

    std::shared_ptr<FileSystem> file_system_;
    std::unique_ptr<DatasetHandle> dataset_;
    bool opened_;
    RowCount row_budget_;
    std::vector<std::string> columns_;
    std::string filetype_;
    std::vector<std::string> split_files_;

    /**
     * @brief Exact row count of a streaming dataset through a second, non-streaming open
     */
    RowCount countRowsWithSecondaryOpen(FileFormat format) const;
};

}  // namespace rowfeed
