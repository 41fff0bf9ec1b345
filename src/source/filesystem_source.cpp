#include "source/filesystem_source.hpp"
#include <fmt/ranges.h>
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "source/schema_resolver.hpp"

namespace rowfeed {

FilesystemSource::FilesystemSource(FilesystemDescriptor descriptor, LoadOptions options)
    : descriptor_(std::move(descriptor)), options_(std::move(options)), opened_(false), row_budget_(0) {}

void FilesystemSource::open() {
    if (opened_) {
        Logger::debug("{} is already open", describe());
        return;
    }

    file_system_ = FileSystemRegistry::instance().resolve(descriptor_.dataFiles, options_.storageOptions);

    PathClassifier classifier(file_system_);
    auto classification = classifier.classify(descriptor_.dataFiles);

    filetype_ = descriptor_.filetype ? filetypeFromExtension(*descriptor_.filetype) : classification.filetype;
    if (filetype_.empty()) {
        throw UnresolvableFiletype("Cannot infer the filetype from a file without extension",
                                   descriptor_.dataFiles);
    }
    auto format = fileFormatFromString(filetype_);
    if (!format) {
        throw UnsupportedMode("No reader for filetype '" + filetype_ + "'", describe());
    }

    split_files_ = selectSplitFiles(classification.dataFiles(), descriptor_.split);
    dataset_ = openDataset(file_system_, *format, split_files_, options_.streaming);

    if (options_.rowLimit) {
        if (options_.streaming) {
            row_budget_ = *options_.rowLimit;
        } else {
            row_budget_ = std::min(*options_.rowLimit, dataset_->getRowCount().value_or(0));
            dataset_->truncate(row_budget_);
        }
    } else if (options_.streaming) {
        row_budget_ = countRowsWithSecondaryOpen(*format);
    } else {
        row_budget_ = dataset_->getRowCount().value_or(0);
    }

    columns_ = SchemaResolver::resolve(*dataset_, describe());
    opened_ = true;

    Logger::info("Opened {}: {} {} file(s), {} row(s), columns [{}]", describe(), split_files_.size(), filetype_,
                 row_budget_, fmt::join(columns_, ", "));
}

RowCount FilesystemSource::countRowsWithSecondaryOpen(FileFormat format) const {
    // No exact count exists for a stream without reading it once
    Logger::debug("Counting rows of {} with a non-streaming open", describe());
    FileDataset counter(file_system_, format, split_files_, std::nullopt, false);
    return countRows(counter);
}

RowCount FilesystemSource::rowCount() const {
    if (!opened_) {
        throw SourceStateError("rowCount() called before open()", describe());
    }
    return row_budget_;
}

const std::vector<std::string>& FilesystemSource::columns() const {
    if (!opened_) {
        throw SourceStateError("columns() called before open()", describe());
    }
    return columns_;
}

ColumnarBatch FilesystemSource::readColumnar(RowCount startRow, RowCount batchSize) {
    if (!opened_) {
        throw SourceStateError("readColumnar() called before open()", describe());
    }
    return detail::readFromHandle(dataset_.get(), startRow, batchSize, describe());
}

}  // namespace rowfeed
