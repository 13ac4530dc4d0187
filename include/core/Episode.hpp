#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace podcapture {
namespace core {

struct AudioPart {
    int index = 1;             // 1-based
    std::string path;          // relative to the media root
    std::uintmax_t sizeBytes = 0;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"index", index},
            {"path", path},
            {"sizeBytes", sizeBytes}
        };
    }

    static AudioPart fromJson(const nlohmann::json& j) {
        AudioPart part;
        part.index = j.at("index").get<int>();
        part.path = j.at("path").get<std::string>();
        part.sizeBytes = j.value("sizeBytes", std::uintmax_t{0});
        return part;
    }

    bool operator==(const AudioPart& other) const {
        return index == other.index && path == other.path && sizeBytes == other.sizeBytes;
    }
};

struct Episode {
    std::string key;
    std::string showName;
    std::string title;
    std::chrono::system_clock::time_point publishInstant;
    std::string descriptionHtml;
    std::string imageRef;
    std::string authorName;
    std::string sourceUrl;
    std::vector<AudioPart> parts;

    nlohmann::json toJson() const;

    // Throws nlohmann::json::exception or std::runtime_error on malformed records.
    static Episode fromJson(const std::string& key, const nlohmann::json& j);

    bool operator==(const Episode& other) const {
        return key == other.key && showName == other.showName && title == other.title &&
               publishInstant == other.publishInstant && descriptionHtml == other.descriptionHtml &&
               imageRef == other.imageRef && authorName == other.authorName &&
               sourceUrl == other.sourceUrl && parts == other.parts;
    }
};

// Whitespace and path separators become underscores.
std::string normalizeShowName(const std::string& showName);

// "<YYYY-MM-DD_HHMM±hhmm>_<normalized show name>" in local time with its UTC offset,
// so the repeated hour on a DST fall-back night yields two distinct keys.
std::string makeEpisodeKey(std::chrono::system_clock::time_point start, const std::string& showName);

// "<show name> – <YYYY-MM-DD HH:MM>" in local time.
std::string makeEpisodeTitle(std::chrono::system_clock::time_point start, const std::string& showName);

// ISO-8601 in UTC ("2025-10-18T19:00:00Z") as stored in the catalog.
std::string formatIsoUtc(std::chrono::system_clock::time_point instant);
std::chrono::system_clock::time_point parseIsoUtc(const std::string& text);

// RFC 2822 in UTC ("Sat, 18 Oct 2025 19:00:00 +0000") for feed pubDate.
std::string formatRfc2822(std::chrono::system_clock::time_point instant);

} // namespace core
} // namespace podcapture
