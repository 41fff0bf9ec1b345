#include "storage/data_file_reader.hpp"
#include <algorithm>
#include <cctype>
#include "common/assert.hpp"
#include "storage/csv_data_file_reader.hpp"
#include "storage/json_data_file_reader.hpp"

namespace rowfeed {

std::string fileFormatToString(FileFormat format) noexcept {
    switch (format) {
        case FileFormat::JSON:
            return "json";
        case FileFormat::CSV:
            return "csv";
        case FileFormat::TEXT:
            return "text";
    }
    rf_unreachable("Unknown file format");
}

std::optional<FileFormat> fileFormatFromString(const std::string& filetype) noexcept {
    std::string s = filetypeFromExtension(filetype);
    if (s == "json") {
        return FileFormat::JSON;
    } else if (s == "csv") {
        return FileFormat::CSV;
    } else if (s == "text" || s == "txt") {
        return FileFormat::TEXT;
    } else {
        return std::nullopt;
    }
}

std::string filetypeFromExtension(const std::string& extension) {
    std::string filetype = extension;
    std::transform(filetype.begin(), filetype.end(), filetype.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (filetype == "jsonl") {
        filetype = "json";
    }
    return filetype;
}

std::unique_ptr<DataFileReader> createFileReader(FileFormat format, std::shared_ptr<FileSystem> fileSystem,
                                                 const std::string& path) {
    switch (format) {
        case FileFormat::JSON:
            return std::make_unique<JsonDataFileReader>(std::move(fileSystem), path);
        case FileFormat::CSV:
            return std::make_unique<CsvDataFileReader>(std::move(fileSystem), path);
        case FileFormat::TEXT:
            return std::make_unique<TextDataFileReader>(std::move(fileSystem), path);
    }
    rf_unreachable("Unknown file format");
}

}  // namespace rowfeed
