#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <ada.h>

namespace podcapture {
namespace core {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

bool parseExplicit(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    std::string text = value.get<std::string>();
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text == "yes" || text == "true" || text == "explicit";
}

ScheduleSlot slotFromJson(const nlohmann::json& j) {
    ScheduleSlot slot;
    slot.showName = j.at("name").get<std::string>();
    slot.weekday = j.at("day").get<int>();
    slot.hours = j.at("hours").get<std::vector<int>>();
    readIfPresent(j, "metadataUrl", slot.metadataUrl);
    return slot;
}

} // namespace

Config Config::defaults() {
    Config config;
    config.streamUrl = "https://ktal.broadcasttool.stream/stream";

    config.channel.title = "Automated KTAL Shows \xE2\x80\x93 DJ Tone Deaf";
    config.channel.baseUrl = "https://artiefissio.github.io/Podcast-feedS/";
    config.channel.description =
        "Automated recordings of KTAL shows (Wolfman Max, The Smear Campaign, Johnny Catalog, "
        "Brain Salad, Lost Highway, Soul Salad) with best-effort metadata.";
    config.channel.language = "en-US";
    config.channel.author = "DJ Tone Deaf";
    config.channel.explicitContent = false;
    config.channel.image = "channel_image.jpg";
    config.channel.category = "Music";

    config.schedule = {
        {"Wolfman Max \xE2\x80\x93 Wide World of Funk", 5, {17, 18}, ""},
        {"The Smear Campaign", 5, {19},
         "https://spinitron.com/KTAL/show/277361/The-Smear-Campaign?layout=1"},
        {"Johnny Catalog \xE2\x80\x93 Catalog", 5, {20}, ""},
        {"Brain Salad", 5, {21}, ""},
        {"Lost Highway", 0, {20}, ""},
        {"Soul Salad", 6, {16}, ""},
    };
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config config = defaults();

    try {
        readIfPresent(j, "streamUrl", config.streamUrl);
        readIfPresent(j, "audioBitrateKbps", config.audioBitrateKbps);
        readIfPresent(j, "maxPartBytes", config.maxPartBytes);
        readIfPresent(j, "forceShowName", config.forceShowName);
        readIfPresent(j, "metadataTimeoutSeconds", config.metadataTimeoutSeconds);

        if (j.contains("retentionDays")) {
            config.retention = std::chrono::hours(24 * j["retentionDays"].get<int>());
        }
        if (j.contains("captureSeconds")) {
            config.captureDuration = std::chrono::seconds(j["captureSeconds"].get<int>());
        }
        if (j.contains("forceCaptureSeconds")) {
            config.forceCaptureDuration = std::chrono::seconds(j["forceCaptureSeconds"].get<int>());
        }

        if (j.contains("rootDir")) config.rootDir = j["rootDir"].get<std::string>();
        if (j.contains("mediaDir")) config.mediaDir = j["mediaDir"].get<std::string>();
        if (j.contains("catalogFile")) config.catalogFile = j["catalogFile"].get<std::string>();
        if (j.contains("feedFile")) config.feedFile = j["feedFile"].get<std::string>();
        if (j.contains("lockFile")) config.lockFile = j["lockFile"].get<std::string>();

        if (j.contains("channel")) {
            const auto& c = j["channel"];
            readIfPresent(c, "title", config.channel.title);
            readIfPresent(c, "baseUrl", config.channel.baseUrl);
            readIfPresent(c, "link", config.channel.baseUrl);
            readIfPresent(c, "description", config.channel.description);
            readIfPresent(c, "language", config.channel.language);
            readIfPresent(c, "author", config.channel.author);
            readIfPresent(c, "image", config.channel.image);
            readIfPresent(c, "category", config.channel.category);
            if (c.contains("explicit")) {
                config.channel.explicitContent = parseExplicit(c["explicit"]);
            }
        }

        if (j.contains("schedule")) {
            config.schedule.clear();
            for (const auto& slotJson : j.at("schedule")) {
                config.schedule.push_back(slotFromJson(slotJson));
            }
        }

        if (j.contains("notify")) {
            const auto& n = j["notify"];
            readIfPresent(n, "webhookUrl", config.notify.webhookUrl);
            readIfPresent(n, "timeoutSeconds", config.notify.timeoutSeconds);
        }

        if (j.contains("publish")) {
            const auto& p = j["publish"];
            readIfPresent(p, "enabled", config.publish.enabled);
            if (p.contains("repoDir")) config.publish.repoDir = p["repoDir"].get<std::string>();
            readIfPresent(p, "remote", config.publish.remote);
            readIfPresent(p, "branch", config.publish.branch);
            readIfPresent(p, "commitMessage", config.publish.commitMessage);
        }

        if (j.contains("metadata")) {
            readIfPresent(j["metadata"], "timeoutSeconds", config.metadataTimeoutSeconds);
        }

        if (j.contains("log")) {
            const auto& l = j["log"];
            if (l.contains("file")) config.log.file = l["file"].get<std::string>();
            readIfPresent(l, "maxBytes", config.log.maxBytes);
            readIfPresent(l, "maxFiles", config.log.maxFiles);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    config.validate();
    return config;
}

Config Config::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        if (std::filesystem::exists(file)) {
            throw ConfigError("Could not open configuration file: " + file.string());
        }
        return defaults();
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Could not parse " + file.string() + ": " + e.what());
    }
    return fromJson(j);
}

void Config::validate() const {
    if (streamUrl.empty()) {
        throw ConfigError("streamUrl must not be empty");
    }
    if (maxPartBytes == 0) {
        throw ConfigError("maxPartBytes must be greater than zero");
    }
    if (captureDuration.count() <= 0 || forceCaptureDuration.count() <= 0) {
        throw ConfigError("capture durations must be positive");
    }
    if (retention.count() <= 0) {
        throw ConfigError("retentionDays must be positive");
    }

    auto base = ada::parse<ada::url>(channel.baseUrl);
    if (!base || (base->get_protocol() != "http:" && base->get_protocol() != "https:")) {
        throw ConfigError("channel.baseUrl must be an absolute http(s) URL: " + channel.baseUrl);
    }

    for (const auto& slot : schedule) {
        if (slot.showName.empty()) {
            throw ConfigError("schedule entry with empty name");
        }
        if (slot.weekday < 0 || slot.weekday > 6) {
            throw ConfigError("schedule entry '" + slot.showName + "' has weekday outside 0-6");
        }
        if (slot.hours.empty()) {
            throw ConfigError("schedule entry '" + slot.showName + "' has no hours");
        }
        std::set<int> seen;
        for (int hour : slot.hours) {
            if (hour < 0 || hour > 23) {
                throw ConfigError("schedule entry '" + slot.showName + "' has hour outside 0-23");
            }
            if (!seen.insert(hour).second) {
                throw ConfigError("schedule entry '" + slot.showName + "' repeats hour " + std::to_string(hour));
            }
        }
    }
}

} // namespace core
} // namespace podcapture
