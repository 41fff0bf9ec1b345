#pragma once

#include <memory>
#include <vector>
#include "hub/hub_client.hpp"
#include "source/source_adapter.hpp"
#include "source/source_descriptor.hpp"
#include "storage/dataset_handle.hpp"

namespace rowfeed {

/**
 * @brief Source reading one split of a dataset repository.
 *
 * The row count and the columns come from the dataset info service. When the service
 * fails the split is opened directly (non-streaming) and the info is derived from it.
 */
class HubSource : public SourceAdapter {
public:
    HubSource(HubDescriptor descriptor, LoadOptions options, std::shared_ptr<DatasetInfoService> infoService,
              std::shared_ptr<DatasetRepository> repository);

    HubSource(const HubSource&) = delete;
    HubSource& operator=(const HubSource&) = delete;

    /**
     * @brief Use an already loaded dataset instead of loading it from the repository on open()
     */
    void attachDataset(std::unique_ptr<DatasetHandle> dataset);

    void open() override;

    bool isOpen() const noexcept override { return opened_; }

    RowCount rowCount() const override;

    const std::vector<std::string>& columns() const override;

    ColumnarBatch readColumnar(RowCount startRow, RowCount batchSize) override;

    bool supportsSeek() const noexcept override { return dataset_ && dataset_->supportsRandomAccess(); }

    bool isStreaming() const noexcept override { return options_.streaming; }

    std::string describe() const override { return rowfeed::describe(descriptor_); }

    const HubDescriptor& getDescriptor() const noexcept { return descriptor_; }

private:
    HubDescriptor descriptor_;
    LoadOptions options_;
    std::shared_ptr<DatasetInfoService> info_service_;
    std::shared_ptr<DatasetRepository> repository_;

    std::unique_ptr<DatasetHandle> dataset_;
    bool opened_;
    RowCount row_budget_;
    std::vector<std::string> columns_;

    /**
     * @brief Infos from the service, falling back to a direct load of the split
     */
    DatasetInfos fetchDatasetInfos();
};

}  // namespace rowfeed
