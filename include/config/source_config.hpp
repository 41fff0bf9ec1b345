#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "hub/hub_client.hpp"
#include "source/source_adapter.hpp"
#include "source/source_descriptor.hpp"

namespace rowfeed {

enum class SourceKind { HUB, FILESYSTEM, SNAPSHOT };

std::string sourceKindToString(SourceKind kind) noexcept;

std::optional<SourceKind> sourceKindFromString(const std::string& s) noexcept;

/**
 * @brief Construction-time parameters of one source, as read from a JSON document:
 *
 * {
 *   "kind": "hub" | "filesystem" | "snapshot",
 *   "repo_id": "...",                 (hub)
 *   "data_files": "...",              (filesystem)
 *   "filetype": "csv",                (filesystem, optional)
 *   "dataset_path": "...",            (snapshot)
 *   "is_distiset": false,             (snapshot)
 *   "keep_in_memory": true,           (snapshot, optional)
 *   "config": "...", "split": "...",
 *   "streaming": false, "num_examples": 100, "batch_size": 50,
 *   "storage_options": {...}, "hub_mirror": "..."
 * }
 */
struct SourceConfig {
    SourceDescriptor descriptor;
    LoadOptions options;
    RowCount batchSize = 50;
    // root of a LocalHubMirror serving hub sources
    std::optional<std::string> hubMirror;

    SourceKind getKind() const noexcept;

    Value to_json() const;

    /**
     * @throws InvalidConfiguration naming the offending key
     */
    static SourceConfig from_json(const Value& obj);

    /**
     * @throws SourceUnavailable if the file cannot be read, InvalidConfiguration if it is invalid
     */
    static SourceConfig fromFile(const std::string& path);
};

/**
 * @brief Parse a JSON configuration document, reporting any problem as a message
 */
std::expected<SourceConfig, std::string> parseSourceConfig(const std::string& text);

/**
 * @brief Collaborators of hub sources. Left empty, a LocalHubMirror is built from the
 * hub_mirror setting or the ROWFEED_HUB_MIRROR environment variable.
 */
struct SourceServices {
    std::shared_ptr<DatasetInfoService> infoService;
    std::shared_ptr<DatasetRepository> repository;
};

/**
 * @brief Build the adapter for a configuration. The adapter is not opened.
 */
std::unique_ptr<SourceAdapter> makeSourceAdapter(const SourceConfig& config, SourceServices services = {});

}  // namespace rowfeed
