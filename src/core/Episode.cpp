#include "core/Episode.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace podcapture {
namespace core {

namespace {

std::string formatLocal(std::chrono::system_clock::time_point instant, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(instant);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm);
    return buf;
}

} // namespace

nlohmann::json Episode::toJson() const {
    nlohmann::json partsJson = nlohmann::json::array();
    for (const auto& part : parts) {
        partsJson.push_back(part.toJson());
    }

    return nlohmann::json{
        {"showName", showName},
        {"title", title},
        {"pubDate", formatIsoUtc(publishInstant)},
        {"descriptionHtml", descriptionHtml},
        {"image", imageRef},
        {"author", authorName},
        {"sourceUrl", sourceUrl},
        {"parts", partsJson}
    };
}

Episode Episode::fromJson(const std::string& key, const nlohmann::json& j) {
    Episode episode;
    episode.key = key;
    episode.showName = j.value("showName", std::string());
    episode.title = j.at("title").get<std::string>();
    episode.publishInstant = parseIsoUtc(j.at("pubDate").get<std::string>());
    episode.descriptionHtml = j.value("descriptionHtml", std::string());
    episode.imageRef = j.value("image", std::string());
    episode.authorName = j.value("author", std::string());
    episode.sourceUrl = j.value("sourceUrl", std::string());

    for (const auto& partJson : j.at("parts")) {
        episode.parts.push_back(AudioPart::fromJson(partJson));
    }
    if (episode.parts.empty()) {
        throw std::runtime_error("episode has no parts");
    }
    return episode;
}

std::string normalizeShowName(const std::string& showName) {
    std::string normalized = showName;
    for (auto& c : normalized) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\') {
            c = '_';
        }
    }
    return normalized;
}

std::string makeEpisodeKey(std::chrono::system_clock::time_point start, const std::string& showName) {
    return formatLocal(start, "%Y-%m-%d_%H%M%z") + "_" + normalizeShowName(showName);
}

std::string makeEpisodeTitle(std::chrono::system_clock::time_point start, const std::string& showName) {
    return showName + " \xE2\x80\x93 " + formatLocal(start, "%Y-%m-%d %H:%M");
}

std::string formatIsoUtc(std::chrono::system_clock::time_point instant) {
    std::time_t t = std::chrono::system_clock::to_time_t(instant);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::chrono::system_clock::time_point parseIsoUtc(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (end == nullptr || (*end != '\0' && *end != 'Z')) {
        throw std::runtime_error("Invalid timestamp: " + text);
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string formatRfc2822(std::chrono::system_clock::time_point instant) {
    static const char* const kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t t = std::chrono::system_clock::to_time_t(instant);
    std::tm tm{};
    gmtime_r(&t, &tm);

    // Spelled out instead of %a/%b so the output does not depend on the locale.
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d +0000",
                  kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

} // namespace core
} // namespace podcapture
