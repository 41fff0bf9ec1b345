#include "source/hub_source.hpp"
#include <fmt/ranges.h>
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "source/schema_resolver.hpp"

namespace rowfeed {

namespace {

template <typename Map>
std::string availableKeys(const Map& entries) {
    std::vector<std::string> keys;
    for (const auto& entry : entries)
        keys.push_back(entry.first);
    return fmt::format("[{}]", fmt::join(keys, ", "));
}

}  // namespace

HubSource::HubSource(HubDescriptor descriptor, LoadOptions options, std::shared_ptr<DatasetInfoService> infoService,
                     std::shared_ptr<DatasetRepository> repository)
    : descriptor_(std::move(descriptor)),
      options_(std::move(options)),
      info_service_(std::move(infoService)),
      repository_(std::move(repository)),
      opened_(false),
      row_budget_(0) {
    if (!repository_) {
        throw InvalidConfiguration("repo_id", "no dataset repository available for " + describe());
    }
}

void HubSource::attachDataset(std::unique_ptr<DatasetHandle> dataset) {
    if (opened_) {
        throw SourceStateError("cannot attach a dataset to an opened source", describe());
    }
    dataset_ = std::move(dataset);
}

void HubSource::open() {
    if (opened_) {
        Logger::debug("{} is already open", describe());
        return;
    }

    if (!dataset_) {
        dataset_ = repository_->loadDataset(descriptor_.repoId, descriptor_.config, descriptor_.split,
                                            options_.streaming);
    }

    auto infos = fetchDatasetInfos();
    auto infoIt = infos.find(configKey(descriptor_.config));
    if (infoIt == infos.end()) {
        throw SourceUnavailable("No dataset info for configuration '" + configKey(descriptor_.config) +
                                    "', available: " + availableKeys(infos),
                                describe());
    }
    auto splitIt = infoIt->second.splits.find(descriptor_.split);
    if (splitIt == infoIt->second.splits.end()) {
        throw SourceUnavailable("No row count published for split '" + descriptor_.split +
                                    "', available: " + availableKeys(infoIt->second.splits),
                                describe());
    }

    RowCount available = splitIt->second;
    row_budget_ = options_.rowLimit ? std::min(*options_.rowLimit, available) : available;

    if (!options_.streaming) {
        dataset_->truncate(row_budget_);
    }
    columns_ = SchemaResolver::resolve(infos, descriptor_.config, describe());
    opened_ = true;

    Logger::info("Opened {}: {} row(s), columns [{}]", describe(), row_budget_, fmt::join(columns_, ", "));
}

DatasetInfos HubSource::fetchDatasetInfos() {
    std::string serviceError = "no dataset info service configured";
    if (info_service_) {
        try {
            return info_service_->getDatasetInfos(descriptor_.repoId);
        } catch (const std::exception& e) {
            serviceError = e.what();
        }
    }

    // Happens on connection issues: derive the info from the split itself
    Logger::warn("Failed to get dataset info for {}, loading the dataset instead. Error: {}", describe(),
                 serviceError);
    try {
        std::unique_ptr<DatasetHandle> dataset =
            repository_->loadDataset(descriptor_.repoId, descriptor_.config, descriptor_.split, false);
        DatasetInfo info;
        info.features = dataset->getColumnNames();
        auto rows = dataset->getRowCount();
        info.splits[descriptor_.split] = rows ? *rows : materialize(*dataset)->getRowCount().value_or(0);
        return DatasetInfos{{configKey(descriptor_.config), std::move(info)}};
    } catch (const std::exception& e) {
        throw SourceUnavailable("Dataset info unavailable (" + serviceError + ") and direct load failed (" +
                                    e.what() + ")",
                                describe());
    }
}

RowCount HubSource::rowCount() const {
    if (!opened_) {
        throw SourceStateError("rowCount() called before open()", describe());
    }
    return row_budget_;
}

const std::vector<std::string>& HubSource::columns() const {
    if (!opened_) {
        throw SourceStateError("columns() called before open()", describe());
    }
    return columns_;
}

ColumnarBatch HubSource::readColumnar(RowCount startRow, RowCount batchSize) {
    if (!opened_) {
        throw SourceStateError("readColumnar() called before open()", describe());
    }
    return detail::readFromHandle(dataset_.get(), startRow, batchSize, describe());
}

}  // namespace rowfeed
