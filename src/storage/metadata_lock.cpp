#include "storage/metadata_lock.hpp"
#include <fcntl.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace rowfeed {

std::string currentTimestamp() {
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

MetadataLock::MetadataLock(const std::filesystem::path& target, Mode mode)
    : lock_path_(target.string() + ".lock"), fd_(-1) {
    int fd = ::open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw SourceUnavailable(fmt::format("Cannot open lock file: {}", std::strerror(errno)), lock_path_.string());
    }

    int operation = mode == Mode::WAIT ? LOCK_EX : (LOCK_EX | LOCK_NB);
    if (::flock(fd, operation) != 0) {
        int error = errno;
        ::close(fd);
        if (mode == Mode::TRY && error == EWOULDBLOCK) {
            Logger::debug("Lock {} is held elsewhere", lock_path_.string());
            return;
        }
        throw SourceUnavailable(fmt::format("Cannot lock: {}", std::strerror(error)), lock_path_.string());
    }
    fd_ = fd;

    // Holder info for whoever finds a stale lock file
    auto holder = fmt::format("pid={} since={}\n", ::getpid(), currentTimestamp());
    if (::ftruncate(fd_, 0) != 0 ||
        ::write(fd_, holder.data(), holder.size()) != static_cast<ssize_t>(holder.size())) {
        Logger::warn("Could not record the lock holder in {}", lock_path_.string());
    }
}

MetadataLock::~MetadataLock() {
    release();
}

void MetadataLock::release() noexcept {
    if (fd_ == -1) {
        return;
    }
    if (::flock(fd_, LOCK_UN) != 0) {
        Logger::error("Error unlocking {}: {}", lock_path_.string(), std::strerror(errno));
    }
    ::close(fd_);
    fd_ = -1;
}

}  // namespace rowfeed
