#pragma once

#include <filesystem>
#include <optional>

namespace podcapture {
namespace core {

// Exclusive marker file held for the lifetime of one run. The marker is
// created atomically and removed when the lock is destroyed.
class RunLock {
public:
    // nullopt when another run already holds the marker.
    // Throws std::runtime_error when the marker cannot be created for any other reason.
    static std::optional<RunLock> tryAcquire(const std::filesystem::path& markerFile);

    ~RunLock();

    RunLock(RunLock&& other) noexcept;
    RunLock& operator=(RunLock&& other) noexcept;
    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    void release();
    bool held() const { return !markerFile_.empty(); }
    const std::filesystem::path& markerFile() const { return markerFile_; }

private:
    explicit RunLock(const std::filesystem::path& markerFile);

    std::filesystem::path markerFile_;
};

} // namespace core
} // namespace podcapture
