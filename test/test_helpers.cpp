#include "test_helpers.hpp"
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace rowfeed::test {

namespace fs = std::filesystem;

std::string MemoryFileSystem::directoryPrefix(const std::string& path) {
    return path.ends_with('/') ? path : path + "/";
}

bool MemoryFileSystem::isDirectory(const std::string& path) const {
    auto prefix = directoryPrefix(path);
    auto it = files_.lower_bound(prefix);
    return it != files_.end() && it->first.starts_with(prefix);
}

std::vector<std::string> MemoryFileSystem::listDirectory(const std::string& path) const {
    if (!isDirectory(path)) {
        throw SourceUnavailable("Cannot list directory '" + path + "'");
    }
    auto prefix = directoryPrefix(path);
    std::set<std::string> names;
    for (auto it = files_.lower_bound(prefix); it != files_.end() && it->first.starts_with(prefix); ++it) {
        auto rest = it->first.substr(prefix.size());
        names.insert(rest.substr(0, rest.find('/')));
    }
    // reverse order, callers must not rely on listing order
    std::vector<std::string> children;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        children.push_back(joinPath(path, *it));
    }
    return children;
}

std::unique_ptr<std::istream> MemoryFileSystem::openInput(const std::string& path) const {
    auto it = files_.find(path);
    if (it == files_.end()) {
        throw SourceUnavailable("Failed to open file '" + path + "'");
    }
    ++open_count_;
    return std::make_unique<std::istringstream>(it->second);
}

ScopedMemoryScheme::ScopedMemoryScheme(std::string scheme)
    : scheme_(std::move(scheme)),
      file_system_(std::make_shared<MemoryFileSystem>()),
      last_options_(std::make_shared<StorageOptions>()) {
    auto fileSystem = file_system_;
    auto lastOptions = last_options_;
    FileSystemRegistry::instance().registerScheme(scheme_, [fileSystem, lastOptions](const StorageOptions& options) {
        *lastOptions = options;
        return fileSystem;
    });
}

ScopedMemoryScheme::~ScopedMemoryScheme() {
    FileSystemRegistry::instance().unregisterScheme(scheme_);
}

// ctest may run test cases in parallel processes, keep their directories apart
TempDir::TempDir(const std::string& name)
    : path_(fs::temp_directory_path() / "rowfeed_tests" / (name + "_" + std::to_string(::getpid()))) {
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDir::writeFile(const std::string& relativePath, const std::string& content) const {
    fs::path target = path_ / relativePath;
    fs::create_directories(target.parent_path());
    std::ofstream file(target, std::ios::trunc);
    file << content;
    file.close();
    return target;
}

}  // namespace rowfeed::test
