#pragma once

#include <filesystem>
#include <string>

namespace rowfeed {

/**
 * @brief Local time as ISO 8601 without zone, e.g. 2024-05-01T12:00:00
 */
std::string currentTimestamp();

/**
 * @brief Exclusive advisory lock on "<target>.lock", guarding a metadata file while it is
 * rewritten. Taken on construction, released on destruction or release().
 */
class MetadataLock {
public:
    enum class Mode {
        WAIT,  // block until the lock is free
        TRY    // give up if another holder has it
    };

    /**
     * @throws SourceUnavailable if the lock file cannot be opened or locked. In TRY mode a
     * lock held elsewhere is not an error; check ownsLock().
     */
    explicit MetadataLock(const std::filesystem::path& target, Mode mode = Mode::WAIT);

    ~MetadataLock();

    MetadataLock(const MetadataLock&) = delete;
    MetadataLock& operator=(const MetadataLock&) = delete;

    bool ownsLock() const noexcept { return fd_ != -1; }

    const std::filesystem::path& getLockPath() const noexcept { return lock_path_; }

    void release() noexcept;

private:
    std::filesystem::path lock_path_;
    int fd_;
};

}  // namespace rowfeed
