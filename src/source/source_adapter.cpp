#include "source/source_adapter.hpp"
#include "common/errors.hpp"
#include "storage/dataset_handle.hpp"

namespace rowfeed {

namespace detail {

ColumnarBatch readFromHandle(DatasetHandle* handle, RowCount startRow, RowCount batchSize,
                             const std::string& sourceDescription) {
    if (!handle) {
        throw SourceStateError("readColumnar() called before open()", sourceDescription);
    }
    if (startRow < 0) {
        throw InvalidConfiguration("startRow", "must be >= 0, got " + std::to_string(startRow));
    }
    if (batchSize < 1) {
        throw InvalidConfiguration("batch_size", "must be >= 1, got " + std::to_string(batchSize));
    }
    return handle->read(startRow, batchSize);
}

}  // namespace detail

}  // namespace rowfeed
