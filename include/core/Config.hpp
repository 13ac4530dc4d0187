#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace podcapture {
namespace core {

// A recurring weekly broadcast window. weekday 0 is Monday.
struct ScheduleSlot {
    std::string showName;
    int weekday = 0;
    std::vector<int> hours;
    std::string metadataUrl;
};

struct ChannelMeta {
    std::string title;
    std::string baseUrl;       // also the channel <link>; enclosures resolve against it
    std::string description;
    std::string language = "en-US";
    std::string author;
    bool explicitContent = false;
    std::string image;
    std::string category;
};

struct NotifyConfig {
    std::string webhookUrl;
    int timeoutSeconds = 10;
};

struct PublishConfig {
    bool enabled = false;
    std::filesystem::path repoDir = ".";
    std::string remote = "origin";
    std::string branch = "main";
    std::string commitMessage = "Auto update";
};

struct LogConfig {
    std::filesystem::path file;
    std::uintmax_t maxBytes = 1024 * 1024;
    int maxFiles = 5;
};

struct Config {
    std::string streamUrl;
    int audioBitrateKbps = 192;
    std::uintmax_t maxPartBytes = 99ULL * 1024 * 1024;
    std::chrono::seconds retention = std::chrono::hours(24 * 21);
    std::chrono::seconds captureDuration = std::chrono::seconds(3600);
    std::chrono::seconds forceCaptureDuration = std::chrono::seconds(3600);
    std::string forceShowName = "Manual Capture";
    int metadataTimeoutSeconds = 15;

    // Relative paths below, and the part paths stored in the catalog, resolve
    // against rootDir. Part paths double as the enclosure URL suffix.
    std::filesystem::path rootDir = ".";
    std::filesystem::path mediaDir = "episodes_mp3";
    std::filesystem::path catalogFile = "downloaded_episodes.json";
    std::filesystem::path feedFile = "feed.xml";
    std::filesystem::path lockFile = ".podcapture.lock";

    ChannelMeta channel;
    std::vector<ScheduleSlot> schedule;
    NotifyConfig notify;
    PublishConfig publish;
    LogConfig log;

    // The KTAL schedule and channel the recorder was first written for.
    static Config defaults();

    // Missing keys keep their default value. Throws ConfigError on invalid values.
    static Config fromJson(const nlohmann::json& j);

    // Returns defaults() when the file does not exist; throws ConfigError when it
    // exists but cannot be parsed or validated.
    static Config load(const std::filesystem::path& file);

    // Throws ConfigError describing the first problem found.
    void validate() const;

    std::filesystem::path resolve(const std::filesystem::path& path) const {
        return path.is_absolute() ? path : rootDir / path;
    }
};

} // namespace core
} // namespace podcapture
