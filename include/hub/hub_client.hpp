#pragma once

#include <memory>
#include <optional>
#include <string>
#include "hub/dataset_info.hpp"
#include "storage/dataset_handle.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

/**
 * @brief Lightweight metadata query: per configuration, the columns and split sizes of a
 * repository, without transferring data
 */
class DatasetInfoService {
public:
    virtual ~DatasetInfoService() = default;

    /**
     * @throws SourceException (or any std::exception) when the service cannot be reached
     */
    virtual DatasetInfos getDatasetInfos(const std::string& repoId) = 0;
};

/**
 * @brief Opens one split of a repository as a dataset handle
 */
class DatasetRepository {
public:
    virtual ~DatasetRepository() = default;

    virtual std::unique_ptr<DatasetHandle> loadDataset(const std::string& repoId,
                                                       const std::optional<std::string>& config,
                                                       const std::string& split, bool streaming) = 0;
};

/**
 * @brief Hub served from a directory tree (local or behind a registered URL scheme):
 *
 *   <root>/<repo_id>/dataset_infos.json
 *   <root>/<repo_id>/<config or "default">/<split>/<data files>
 *   <root>/<repo_id>/<config or "default">/<split>.<ext>
 */
class LocalHubMirror : public DatasetInfoService, public DatasetRepository {
public:
    explicit LocalHubMirror(std::string root, StorageOptions storageOptions = {});

    DatasetInfos getDatasetInfos(const std::string& repoId) override;

    std::unique_ptr<DatasetHandle> loadDataset(const std::string& repoId, const std::optional<std::string>& config,
                                               const std::string& split, bool streaming) override;

    const std::string& getRoot() const noexcept { return root_; }

    static constexpr const char* infosFileName = "dataset_infos.json";

private:
    std::string root_;
    StorageOptions storage_options_;
    std::shared_ptr<FileSystem> file_system_;

    std::string repositoryPath(const std::string& repoId) const;
};

}  // namespace rowfeed
