#include "core/MetadataProvider.hpp"
#include "core/Logger.hpp"
#include <cctype>
#include <vector>
#include <cpr/cpr.h>
#include <ada.h>

namespace podcapture {
namespace core {

namespace {

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

std::string stripTags(const std::string& html) {
    std::string text;
    bool inTag = false;
    for (char c : html) {
        if (c == '<') {
            inTag = true;
            text += ' ';
        } else if (c == '>') {
            inTag = false;
        } else if (!inTag) {
            text += c;
        }
    }
    return collapseWhitespace(text);
}

// Entities in scraped text are already encoded, so '&' passes through.
std::string escapeHtml(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// Value of attribute `name` inside the tag that starts at tagStart.
std::string attributeValue(const std::string& html, size_t tagStart, const std::string& name) {
    size_t tagEnd = html.find('>', tagStart);
    size_t pos = html.find(name + "=", tagStart);
    if (pos == std::string::npos || (tagEnd != std::string::npos && pos > tagEnd)) {
        return "";
    }
    pos += name.size() + 1;
    if (pos >= html.size()) return "";

    char quote = html[pos];
    if (quote != '"' && quote != '\'') {
        size_t end = html.find_first_of(" \t\r\n>", pos);
        return html.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    }
    size_t end = html.find(quote, pos + 1);
    if (end == std::string::npos) return "";
    return html.substr(pos + 1, end - pos - 1);
}

std::string resolveAgainst(const std::string& href, const std::string& baseUrl) {
    auto base = ada::parse<ada::url>(baseUrl);
    if (!base) return "";
    auto resolved = ada::parse<ada::url>(href, &*base);
    if (!resolved) return "";
    return resolved->get_href();
}

} // namespace

SpinitronMetadataProvider::SpinitronMetadataProvider(int timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {
}

ShowMetadata SpinitronMetadataProvider::fetch(const std::string& showName, const std::string& archiveUrl) noexcept {
    if (archiveUrl.empty()) {
        return {};
    }

    try {
        std::string archiveHtml;
        if (!get(archiveUrl, archiveHtml)) {
            return {};
        }

        std::string playlistUrl = findPlaylistUrl(archiveHtml, archiveUrl);
        if (playlistUrl.empty()) {
            Logger::warn("No playlist link found for " + showName);
            return {};
        }

        std::string playlistHtml;
        if (!get(playlistUrl, playlistHtml)) {
            return {};
        }

        ShowMetadata meta = parsePlaylist(playlistHtml, playlistUrl);
        Logger::info("Fetched playlist metadata for " + showName + " from " + playlistUrl);
        return meta;
    } catch (const std::exception& e) {
        Logger::warn("Metadata lookup failed for " + showName + ": " + e.what());
        return {};
    }
}

bool SpinitronMetadataProvider::get(const std::string& url, std::string& body) const {
    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", "Mozilla/5.0 (compatible; podcapture/1.0)"},
            {"Accept", "text/html, application/xhtml+xml"}
        },
        cpr::Timeout{timeoutSeconds_ * 1000},
        cpr::Redirect{10L}
    );

    if (response.status_code != 200) {
        std::string message = "Metadata request to " + url + " failed: HTTP " + std::to_string(response.status_code);
        if (response.error.code != cpr::ErrorCode::OK) {
            message += " (" + response.error.message + ")";
        }
        Logger::warn(message);
        return false;
    }

    body = response.text;
    return !body.empty();
}

std::string SpinitronMetadataProvider::findPlaylistUrl(const std::string& archiveHtml, const std::string& archiveUrl) {
    size_t pos = 0;
    while ((pos = archiveHtml.find("<a", pos)) != std::string::npos) {
        std::string href = attributeValue(archiveHtml, pos, "href");
        pos += 2;
        if (href.find("/pl/") == std::string::npos) {
            continue;
        }

        href = href.substr(0, href.find('?'));
        return resolveAgainst(href, archiveUrl);
    }
    return "";
}

ShowMetadata SpinitronMetadataProvider::parsePlaylist(const std::string& playlistHtml, const std::string& playlistUrl) {
    ShowMetadata meta;
    meta.sourceUrl = playlistUrl;

    // Tracklist
    size_t tracksStart = playlistHtml.find("playlist-tracks");
    if (tracksStart != std::string::npos) {
        size_t tracksEnd = playlistHtml.find("</ul>", tracksStart);
        std::string region = playlistHtml.substr(tracksStart, tracksEnd == std::string::npos
                                                                  ? std::string::npos
                                                                  : tracksEnd - tracksStart);
        std::vector<std::string> tracks;
        size_t li = 0;
        while ((li = region.find("<li", li)) != std::string::npos) {
            size_t open = region.find('>', li);
            if (open == std::string::npos) break;
            size_t close = region.find("</li>", open);
            std::string track = stripTags(region.substr(open + 1, close == std::string::npos ? std::string::npos
                                                                                              : close - open - 1));
            if (!track.empty()) {
                tracks.push_back(track);
            }
            if (close == std::string::npos) break;
            li = close;
        }

        if (!tracks.empty()) {
            meta.trackListHtml = "<ul>";
            for (const auto& track : tracks) {
                meta.trackListHtml += "<li>" + escapeHtml(track) + "</li>";
            }
            meta.trackListHtml += "</ul>";
        }
    }

    // Image
    size_t artStart = playlistHtml.find("playlist-art");
    if (artStart != std::string::npos) {
        size_t img = playlistHtml.find("<img", artStart);
        if (img != std::string::npos) {
            std::string src = attributeValue(playlistHtml, img, "src");
            if (!src.empty()) {
                meta.imageUrl = resolveAgainst(src, playlistUrl);
            }
        }
    }

    // DJ / host
    for (const char* cls : {"show-dj", "show-host", "field-name-host", "host"}) {
        size_t at = playlistHtml.find(cls);
        if (at == std::string::npos) continue;
        size_t open = playlistHtml.find('>', at);
        if (open == std::string::npos) continue;
        size_t close = playlistHtml.find("</", open);
        std::string host = stripTags(playlistHtml.substr(open + 1, close == std::string::npos ? std::string::npos
                                                                                              : close - open - 1));
        if (!host.empty()) {
            meta.hostName = host;
            break;
        }
    }

    return meta;
}

} // namespace core
} // namespace podcapture
