#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/batch.hpp"
#include "storage/filesystem.hpp"

namespace rowfeed {

enum class FileFormat { JSON, CSV, TEXT };

std::string fileFormatToString(FileFormat format) noexcept;

/**
 * @brief Parse a filetype name. "jsonl" is accepted as a synonym of "json".
 */
std::optional<FileFormat> fileFormatFromString(const std::string& filetype) noexcept;

/**
 * @brief Filetype name for a file extension, applying the jsonl -> json synonym
 */
std::string filetypeFromExtension(const std::string& extension);

class DataFileReader {
public:
    virtual ~DataFileReader() = default;

    /**
     * @brief Read next batch of rows and append them to out
     * @param out Batch created with the reader's column names
     * @param requestedRows Maximum number of rows to read
     * @return Number of rows actually read (0 if EOF)
     */
    virtual int64_t readBatch(ColumnarBatch& out, int64_t requestedRows = 8192) = 0;

    virtual bool hasMore() const noexcept = 0;

    /**
     * @brief Reset to beginning of file
     */
    virtual void reset() = 0;

    virtual const std::string& getPath() const noexcept = 0;

    /**
     * @brief Column names of the file. May read the header or the first record.
     */
    virtual const std::vector<std::string>& getColumnNames() = 0;
};

/**
 * @brief Factory method to create a file reader for the given file path and file format
 */
std::unique_ptr<DataFileReader> createFileReader(FileFormat format, std::shared_ptr<FileSystem> fileSystem,
                                                 const std::string& path);

}  // namespace rowfeed
