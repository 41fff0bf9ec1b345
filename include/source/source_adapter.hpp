#pragma once

#include <string>
#include <vector>
#include "common/batch.hpp"
#include "common/types.hpp"

namespace rowfeed {

class DatasetHandle;

/**
 * @brief Contract every data source satisfies so the batch producer can read it without
 * knowing where the data comes from. Adapters are single owner and not thread safe.
 */
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    /**
     * @brief Acquire the backing dataset, resolve the row budget and the columns. Calling it
     * again after a successful open does nothing.
     */
    virtual void open() = 0;

    virtual bool isOpen() const noexcept = 0;

    /**
     * @brief Number of rows this source delivers in one run
     */
    virtual RowCount rowCount() const = 0;

    virtual const std::vector<std::string>& columns() const = 0;

    /**
     * @brief Up to batchSize rows starting at startRow, in source order. Fewer rows are
     * returned only at the end of the source. May block on I/O.
     */
    virtual ColumnarBatch readColumnar(RowCount startRow, RowCount batchSize) = 0;

    /**
     * @brief Whether readColumnar at an arbitrary row is as cheap as reading sequentially
     */
    virtual bool supportsSeek() const noexcept = 0;

    virtual bool isStreaming() const noexcept = 0;

    virtual std::string describe() const = 0;
};

namespace detail {

/**
 * @brief Shared readColumnar body of the adapters: validates the state and the request,
 * then reads from the handle
 */
ColumnarBatch readFromHandle(DatasetHandle* handle, RowCount startRow, RowCount batchSize,
                             const std::string& sourceDescription);

}  // namespace detail

}  // namespace rowfeed
