#pragma once

#include "core/Episode.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace podcapture {
namespace core {

class EpisodeCatalog {
public:
    // Part paths of cataloged episodes resolve against rootDir.
    EpisodeCatalog(const std::filesystem::path& storageFile, const std::filesystem::path& rootDir = ".");

    // Persistence
    void load();           // a missing or unreadable file yields an empty catalog
    void save() const;     // write-to-temp then rename; throws std::runtime_error on I/O failure

    // Throws DuplicateKeyError when the key is already cataloged.
    void insert(const Episode& episode);

    bool contains(const std::string& key) const;
    std::optional<Episode> find(const std::string& key) const;
    size_t size() const { return episodes_.size(); }
    bool empty() const { return episodes_.empty(); }

    // Newest first; equal publish instants are ordered by key.
    std::vector<Episode> episodes() const;

    // Removes every episode published before now - retention, deleting its
    // part files. Returns the evicted episodes.
    std::vector<Episode> evictOlderThan(std::chrono::seconds retention,
                                        std::chrono::system_clock::time_point now);

    // Deletes audio files in mediaDir older than the retention window that no
    // cataloged episode references. Returns the removed paths.
    std::vector<std::filesystem::path> pruneStaleMedia(const std::filesystem::path& mediaDir,
                                                       std::chrono::seconds retention,
                                                       std::chrono::system_clock::time_point now) const;

    std::filesystem::path resolvePart(const AudioPart& part) const;
    const std::filesystem::path& storageFile() const { return storageFile_; }

private:
    std::map<std::string, Episode> episodes_;
    std::filesystem::path storageFile_;
    std::filesystem::path rootDir_;
};

} // namespace core
} // namespace podcapture
