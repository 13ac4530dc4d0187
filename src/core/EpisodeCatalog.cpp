#include "core/EpisodeCatalog.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

namespace podcapture {
namespace core {

namespace {

const std::set<std::string> kAudioExtensions = {".mp3", ".m4a", ".aac", ".ogg", ".opus"};

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type fileTime) {
    auto fileNow = std::filesystem::file_time_type::clock::now();
    auto systemNow = std::chrono::system_clock::now();
    return systemNow + std::chrono::duration_cast<std::chrono::system_clock::duration>(fileTime - fileNow);
}

} // namespace

EpisodeCatalog::EpisodeCatalog(const std::filesystem::path& storageFile, const std::filesystem::path& rootDir)
    : storageFile_(storageFile), rootDir_(rootDir) {
}

void EpisodeCatalog::load() {
    episodes_.clear();

    std::ifstream file(storageFile_);
    if (!file.is_open()) {
        // Nothing recorded yet
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        Logger::warn("Catalog " + storageFile_.string() + " is unreadable, starting fresh: " + e.what());
        return;
    }

    if (!j.is_object()) {
        Logger::warn("Catalog " + storageFile_.string() + " is not a JSON object, starting fresh");
        return;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            episodes_.emplace(it.key(), Episode::fromJson(it.key(), it.value()));
        } catch (const std::exception& e) {
            Logger::warn("Skipping malformed catalog entry " + it.key() + ": " + e.what());
        }
    }
    Logger::debug("Loaded " + std::to_string(episodes_.size()) + " episodes from " + storageFile_.string());
}

void EpisodeCatalog::save() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : episodes_) {
        j[entry.first] = entry.second.toJson();
    }

    if (storageFile_.has_parent_path()) {
        std::filesystem::create_directories(storageFile_.parent_path());
    }

    std::filesystem::path tmp = storageFile_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + tmp.string());
        }
        file << j.dump(2) << "\n";
        file.flush();
        if (!file) {
            throw std::runtime_error("Could not write catalog: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, storageFile_, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Could not replace catalog " + storageFile_.string());
    }
}

void EpisodeCatalog::insert(const Episode& episode) {
    if (episodes_.count(episode.key) != 0) {
        throw DuplicateKeyError(episode.key);
    }
    episodes_.emplace(episode.key, episode);
}

bool EpisodeCatalog::contains(const std::string& key) const {
    return episodes_.count(key) != 0;
}

std::optional<Episode> EpisodeCatalog::find(const std::string& key) const {
    auto it = episodes_.find(key);
    if (it == episodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Episode> EpisodeCatalog::episodes() const {
    std::vector<Episode> sorted;
    sorted.reserve(episodes_.size());
    for (const auto& entry : episodes_) {
        sorted.push_back(entry.second);
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const Episode& a, const Episode& b) {
        if (a.publishInstant != b.publishInstant) {
            return a.publishInstant > b.publishInstant;
        }
        return a.key < b.key;
    });
    return sorted;
}

std::vector<Episode> EpisodeCatalog::evictOlderThan(std::chrono::seconds retention,
                                                    std::chrono::system_clock::time_point now) {
    const auto threshold = now - retention;
    std::vector<Episode> evicted;

    for (auto it = episodes_.begin(); it != episodes_.end();) {
        if (it->second.publishInstant >= threshold) {
            ++it;
            continue;
        }

        for (const auto& part : it->second.parts) {
            std::error_code ec;
            auto path = resolvePart(part);
            if (!std::filesystem::remove(path, ec) && ec) {
                Logger::warn("Could not delete " + path.string() + ": " + ec.message());
            }
        }
        Logger::info("Evicted episode " + it->first);
        evicted.push_back(it->second);
        it = episodes_.erase(it);
    }
    return evicted;
}

std::vector<std::filesystem::path> EpisodeCatalog::pruneStaleMedia(const std::filesystem::path& mediaDir,
                                                                   std::chrono::seconds retention,
                                                                   std::chrono::system_clock::time_point now) const {
    std::vector<std::filesystem::path> removed;
    std::error_code ec;
    if (!std::filesystem::is_directory(mediaDir, ec)) {
        return removed;
    }

    std::set<std::filesystem::path> referenced;
    for (const auto& entry : episodes_) {
        for (const auto& part : entry.second.parts) {
            referenced.insert(resolvePart(part).lexically_normal());
        }
    }

    const auto threshold = now - retention;
    for (const auto& entry : std::filesystem::directory_iterator(mediaDir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (kAudioExtensions.count(entry.path().extension().string()) == 0) continue;
        if (referenced.count(entry.path().lexically_normal()) != 0) continue;

        auto modified = entry.last_write_time(ec);
        if (ec || toSystemTime(modified) >= threshold) continue;

        if (std::filesystem::remove(entry.path(), ec)) {
            removed.push_back(entry.path());
        } else if (ec) {
            Logger::warn("Could not delete stale media " + entry.path().string() + ": " + ec.message());
        }
    }
    return removed;
}

std::filesystem::path EpisodeCatalog::resolvePart(const AudioPart& part) const {
    std::filesystem::path path(part.path);
    return path.is_absolute() ? path : rootDir_ / path;
}

} // namespace core
} // namespace podcapture
