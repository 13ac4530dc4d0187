#include "core/RunLock.hpp"
#include "core/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace podcapture {
namespace core {

std::optional<RunLock> RunLock::tryAcquire(const std::filesystem::path& markerFile) {
    if (markerFile.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(markerFile.parent_path(), ec);
    }

    int fd = open(markerFile.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd == -1) {
        if (errno == EEXIST) {
            return std::nullopt;
        }
        throw std::runtime_error("Failed to create lock file " + markerFile.string() + ": " + strerror(errno));
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (write(fd, pid.c_str(), pid.size()) == -1) {
        Logger::warn("Could not write PID to lock file: " + std::string(strerror(errno)));
    }
    close(fd);

    return RunLock(markerFile);
}

RunLock::RunLock(const std::filesystem::path& markerFile) : markerFile_(markerFile) {
}

RunLock::~RunLock() {
    release();
}

RunLock::RunLock(RunLock&& other) noexcept : markerFile_(std::move(other.markerFile_)) {
    other.markerFile_.clear();
}

RunLock& RunLock::operator=(RunLock&& other) noexcept {
    if (this != &other) {
        release();
        markerFile_ = std::move(other.markerFile_);
        other.markerFile_.clear();
    }
    return *this;
}

void RunLock::release() {
    if (markerFile_.empty()) return;

    std::error_code ec;
    std::filesystem::remove(markerFile_, ec);
    if (ec) {
        Logger::error("Failed to remove lock file " + markerFile_.string() + ": " + ec.message());
    }
    markerFile_.clear();
}

} // namespace core
} // namespace podcapture
