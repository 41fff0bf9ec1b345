#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"

namespace rowfeed {

/**
 * @brief Minimal storage abstraction the loaders need. Paths are plain strings and may
 * carry a URL scheme ("gcs://bucket/data"), which is handed back unchanged.
 */
class FileSystem {
   public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string& path) const = 0;

    virtual bool isFile(const std::string& path) const = 0;

    virtual bool isDirectory(const std::string& path) const = 0;

    /**
     * @brief Full paths of the immediate children of a directory, in no particular order
     */
    virtual std::vector<std::string> listDirectory(const std::string& path) const = 0;

    /**
     * @brief Open a file for reading. Throws SourceUnavailable if it cannot be opened.
     */
    virtual std::unique_ptr<std::istream> openInput(const std::string& path) const = 0;
};

class LocalFileSystem : public FileSystem {
   public:
    bool exists(const std::string& path) const override;

    bool isFile(const std::string& path) const override;

    bool isDirectory(const std::string& path) const override;

    std::vector<std::string> listDirectory(const std::string& path) const override;

    std::unique_ptr<std::istream> openInput(const std::string& path) const override;

    /**
     * @brief Strip a leading "file://" so the remainder can be used with std::filesystem
     */
    static std::string toLocalPath(const std::string& path);
};

/**
 * @brief Process-wide map from URL scheme to filesystem factory. Paths without a scheme
 * and "file://" paths resolve to the local filesystem.
 */
class FileSystemRegistry {
   public:
    using Factory = std::function<std::shared_ptr<FileSystem>(const StorageOptions&)>;

    static FileSystemRegistry& instance();

    void registerScheme(const std::string& scheme, Factory factory);

    bool unregisterScheme(const std::string& scheme);

    /**
     * @brief Filesystem serving the given path. Throws SourceUnavailable when no factory
     * is registered for its scheme.
     */
    std::shared_ptr<FileSystem> resolve(const std::string& path, const StorageOptions& storageOptions = {});

   private:
    FileSystemRegistry() = default;

    std::mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
};

/**
 * @brief Scheme of a path ("gcs" for "gcs://bucket/key"), empty when there is none
 */
std::string pathScheme(const std::string& path);

/**
 * @brief Join a directory path and a child name with exactly one separator
 */
std::string joinPath(const std::string& parent, const std::string& child);

/**
 * @brief Last component of a path, ignoring trailing separators
 */
std::string pathFileName(const std::string& path);

/**
 * @brief Extension of the last path component without the dot, empty if there is none
 */
std::string pathExtension(const std::string& path);

}  // namespace rowfeed
