#include "storage/filesystem.hpp"
#include <filesystem>
#include <fstream>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view schemeSeparator = "://";

}  // namespace

std::string pathScheme(const std::string& path) {
    auto pos = path.find(schemeSeparator);
    if (pos == std::string::npos || pos == 0) {
        return "";
    }
    return path.substr(0, pos);
}

std::string joinPath(const std::string& parent, const std::string& child) {
    if (parent.empty()) {
        return child;
    }
    if (parent.back() == '/') {
        return parent + child;
    }
    return parent + "/" + child;
}

std::string pathFileName(const std::string& path) {
    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    auto start = path.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

std::string pathExtension(const std::string& path) {
    auto name = pathFileName(path);
    auto dot = name.find_last_of('.');
    // ".hidden" has no extension
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return name.substr(dot + 1);
}

std::string LocalFileSystem::toLocalPath(const std::string& path) {
    if (path.starts_with("file://")) {
        return path.substr(7);
    }
    return path;
}

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(toLocalPath(path), ec);
}

bool LocalFileSystem::isFile(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(toLocalPath(path), ec);
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(toLocalPath(path), ec);
}

std::vector<std::string> LocalFileSystem::listDirectory(const std::string& path) const {
    std::vector<std::string> children;
    std::error_code ec;
    fs::directory_iterator it(toLocalPath(path), ec);
    if (ec) {
        throw SourceUnavailable("Cannot list directory '" + path + "': " + ec.message());
    }
    for (const auto& entry : it) {
        children.push_back(joinPath(path, entry.path().filename().string()));
    }
    return children;
}

std::unique_ptr<std::istream> LocalFileSystem::openInput(const std::string& path) const {
    auto stream = std::make_unique<std::ifstream>(toLocalPath(path), std::ios::binary);
    if (!stream->is_open() || !stream->good()) {
        throw SourceUnavailable("Failed to open file '" + path + "'");
    }
    return stream;
}

FileSystemRegistry& FileSystemRegistry::instance() {
    static FileSystemRegistry registry;
    return registry;
}

void FileSystemRegistry::registerScheme(const std::string& scheme, Factory factory) {
    std::lock_guard<std::mutex> l(mutex_);
    if (factories_.contains(scheme)) {
        Logger::warn("Replacing filesystem registered for scheme '{}'", scheme);
    }
    factories_[scheme] = std::move(factory);
}

bool FileSystemRegistry::unregisterScheme(const std::string& scheme) {
    std::lock_guard<std::mutex> l(mutex_);
    return factories_.erase(scheme) > 0;
}

std::shared_ptr<FileSystem> FileSystemRegistry::resolve(const std::string& path,
                                                        const StorageOptions& storageOptions) {
    auto scheme = pathScheme(path);
    std::lock_guard<std::mutex> l(mutex_);
    auto it = factories_.find(scheme);
    if (it != factories_.end()) {
        return it->second(storageOptions);
    }
    if (scheme.empty() || scheme == "file") {
        return std::make_shared<LocalFileSystem>();
    }
    throw SourceUnavailable("No filesystem registered for scheme '" + scheme + "'", path);
}

}  // namespace rowfeed
