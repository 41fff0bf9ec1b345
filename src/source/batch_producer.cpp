#include "source/batch_producer.hpp"
#include <algorithm>
#include "common/batch.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

BatchStream::BatchStream(SourceAdapter& adapter, RowCount offset, RowCount batchSize)
    : adapter_(adapter),
      offset_(offset),
      batch_size_(batchSize),
      row_budget_(adapter.rowCount()),
      cursor_(0),
      emitted_(0),
      delivered_(0),
      done_(false) {
    if (row_budget_ <= 0 || offset_ >= row_budget_) {
        Logger::debug("Nothing to produce for {}: budget {}, offset {}", adapter_.describe(), row_budget_, offset_);
        done_ = true;
    }
}

void BatchStream::skipToOffset() {
    RowCount target = (offset_ / batch_size_) * batch_size_;
    if (cursor_ >= target) {
        return;
    }

    if (adapter_.supportsSeek()) {
        cursor_ = target;
        emitted_ = target;
        return;
    }

    while (cursor_ < target) {
        auto discarded = adapter_.readColumnar(cursor_, std::min(batch_size_, row_budget_ - cursor_));
        if (discarded.empty()) {
            break;
        }
        cursor_ += discarded.getRowCount();
        emitted_ += discarded.getRowCount();
    }
    Logger::debug("Discarded {} row(s) of {} below offset {}", cursor_, adapter_.describe(), offset_);
}

std::optional<ProducedBatch> BatchStream::next() {
    if (done_) {
        return std::nullopt;
    }

    skipToOffset();
    if (cursor_ < (offset_ / batch_size_) * batch_size_) {
        Logger::warn("{} ended at row {} before reaching offset {}", adapter_.describe(), cursor_, offset_);
        done_ = true;
        return std::nullopt;
    }

    RowCount requested = std::min(batch_size_, row_budget_ - cursor_);
    auto columnar = adapter_.readColumnar(cursor_, requested);
    RowCount rowsRead = columnar.getRowCount();
    if (rowsRead == 0) {
        Logger::warn("{} returned no rows at row {} of {}", adapter_.describe(), cursor_, row_budget_);
        done_ = true;
        return std::nullopt;
    }
    // The source may ignore the budget (streaming); never hand out rows beyond it
    if (rowsRead > requested) {
        columnar.truncate(requested);
        rowsRead = requested;
    }

    ProducedBatch produced;
    produced.rows = toRows(columnar);

    // Batch straddling the offset: drop the rows that were consumed before
    if (cursor_ < offset_) {
        auto alreadyConsumed = std::min(offset_ - cursor_, rowsRead);
        produced.rows.erase(produced.rows.begin(), produced.rows.begin() + alreadyConsumed);
    }

    cursor_ += rowsRead;
    emitted_ += rowsRead;
    delivered_ += static_cast<RowCount>(produced.rows.size());
    produced.isLast = emitted_ >= row_budget_;
    done_ = produced.isLast;
    if (produced.rows.empty() && !produced.isLast) {
        // a short read ended before the offset, keep going
        return next();
    }
    return produced;
}

BatchStream BatchProducer::produce(RowCount offset, RowCount batchSize) {
    if (batchSize < 1) {
        throw InvalidConfiguration("batch_size", "must be >= 1, got " + std::to_string(batchSize));
    }
    if (offset < 0) {
        throw InvalidConfiguration("offset", "must be >= 0, got " + std::to_string(offset));
    }
    if (!adapter_.isOpen()) {
        throw SourceStateError("produce() called before open()", adapter_.describe());
    }
    return BatchStream(adapter_, offset, batchSize);
}

}  // namespace rowfeed
