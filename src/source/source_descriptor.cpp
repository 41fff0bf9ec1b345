#include "source/source_descriptor.hpp"

namespace rowfeed {

namespace {

std::string optionalText(const std::optional<std::string>& value) {
    return value ? *value : "<none>";
}

}  // namespace

std::string describe(const HubDescriptor& descriptor) {
    return "hub '" + descriptor.repoId + "' (config: " + optionalText(descriptor.config) +
           ", split: " + descriptor.split + ")";
}

std::string describe(const FilesystemDescriptor& descriptor) {
    return "files '" + descriptor.dataFiles + "' (filetype: " + optionalText(descriptor.filetype) +
           ", split: " + descriptor.split + ")";
}

std::string describe(const SnapshotDescriptor& descriptor) {
    return std::string(descriptor.isDistiset ? "distiset" : "snapshot") + " '" + descriptor.datasetPath +
           "' (config: " + optionalText(descriptor.config) + ", split: " + optionalText(descriptor.split) + ")";
}

std::string describe(const SourceDescriptor& descriptor) {
    return std::visit([](const auto& d) { return describe(d); }, descriptor);
}

}  // namespace rowfeed
