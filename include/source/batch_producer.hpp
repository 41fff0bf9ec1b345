#pragma once

#include <optional>
#include "common/types.hpp"
#include "source/source_adapter.hpp"

namespace rowfeed {

struct ProducedBatch {
    Batch rows;
    bool isLast = false;
};

/**
 * @brief Lazy, finite sequence of row batches over an opened source. Not restartable;
 * ask the producer for a new stream instead.
 */
class BatchStream {
public:
    BatchStream(SourceAdapter& adapter, RowCount offset, RowCount batchSize);

    /**
     * @brief Next batch, or nullopt once the batch flagged last was returned or the
     * source ran dry
     */
    std::optional<ProducedBatch> next();

    bool done() const noexcept { return done_; }

    /**
     * @brief Rows accounted for so far, including rows below the offset
     */
    RowCount emitted() const noexcept { return emitted_; }

    /**
     * @brief Rows actually handed out by next()
     */
    RowCount delivered() const noexcept { return delivered_; }

private:
    SourceAdapter& adapter_;
    RowCount offset_;
    RowCount batch_size_;
    RowCount row_budget_;
    RowCount cursor_;
    RowCount emitted_;
    RowCount delivered_;
    bool done_;

    /**
     * @brief Move the cursor to the batch holding the offset, discarding the batches in
     * front of it
     */
    void skipToOffset();
};

/**
 * @brief Produces fixed-size batches from a source, resuming after rows a previous run
 * already consumed.
 */
class BatchProducer {
public:
    explicit BatchProducer(SourceAdapter& adapter) : adapter_(adapter) {}

    /**
     * @brief Start a stream of batches.
     *
     * Batches follow the grid [k * batchSize, (k + 1) * batchSize) of the row budget. Rows
     * below offset are never returned: whole batches in front of it are read and dropped
     * (or skipped if the source can seek), and the batch containing it is cut at the offset.
     *
     * @param offset Rows already consumed by an earlier run
     * @param batchSize Rows per batch, at least 1
     * @throws InvalidConfiguration for a negative offset or a batch size below 1
     * @throws SourceStateError if the source was not opened
     */
    BatchStream produce(RowCount offset = 0, RowCount batchSize = 50);

private:
    SourceAdapter& adapter_;
};

}  // namespace rowfeed
