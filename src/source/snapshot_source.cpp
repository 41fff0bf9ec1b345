#include "source/snapshot_source.hpp"
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "source/schema_resolver.hpp"
#include "storage/snapshot.hpp"

namespace rowfeed {

SnapshotSource::SnapshotSource(SnapshotDescriptor descriptor, LoadOptions options)
    : descriptor_(std::move(descriptor)), options_(std::move(options)), opened_(false), row_budget_(0) {}

void SnapshotSource::open() {
    if (opened_) {
        Logger::debug("{} is already open", describe());
        return;
    }
    if (options_.streaming) {
        throw UnsupportedMode("Streaming is not supported for snapshots", describe());
    }

    file_system_ = FileSystemRegistry::instance().resolve(descriptor_.datasetPath, options_.storageOptions);
    auto root = SnapshotNode::load(file_system_, descriptor_.datasetPath, descriptor_.isDistiset);

    const SnapshotNode* node = &root;
    if (descriptor_.isDistiset) {
        if (descriptor_.config) {
            node = &node->at(*descriptor_.config);
        } else if (root.keys().size() == 1) {
            node = &node->at(root.keys().front());
            Logger::debug("Using the only configuration '{}' of {}", root.keys().front(), describe());
        } else {
            throw UnsupportedMode("Distiset holds several configurations, select one with 'config'", describe());
        }
    } else if (descriptor_.config) {
        Logger::warn("Ignoring config '{}' of {}: configurations only exist in distisets", *descriptor_.config,
                     describe());
    }

    if (descriptor_.split) {
        node = &node->at(*descriptor_.split);
    }

    dataset_ = node->openDataset(file_system_, descriptor_.keepInMemory.value_or(false));

    if (options_.rowLimit) {
        dataset_->truncate(*options_.rowLimit);
    }
    auto rows = dataset_->getRowCount();
    if (!rows) {
        dataset_ = materialize(*dataset_);
        rows = dataset_->getRowCount();
    }
    row_budget_ = rows.value_or(0);

    columns_ = SchemaResolver::resolve(*dataset_, describe());
    opened_ = true;

    Logger::info("Opened {}: {} row(s), {} column(s)", describe(), row_budget_, columns_.size());
}

RowCount SnapshotSource::rowCount() const {
    if (!opened_) {
        throw SourceStateError("rowCount() called before open()", describe());
    }
    return row_budget_;
}

const std::vector<std::string>& SnapshotSource::columns() const {
    if (!opened_) {
        throw SourceStateError("columns() called before open()", describe());
    }
    return columns_;
}

ColumnarBatch SnapshotSource::readColumnar(RowCount startRow, RowCount batchSize) {
    if (!opened_) {
        throw SourceStateError("readColumnar() called before open()", describe());
    }
    return detail::readFromHandle(dataset_.get(), startRow, batchSize, describe());
}

}  // namespace rowfeed
