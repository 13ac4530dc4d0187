#include "core/FeedSynthesizer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <ada.h>

namespace podcapture {
namespace core {

namespace {

const char* const kItunesNamespace = "http://www.itunes.com/dtds/podcast-1.0.dtd";
const char* const kPartSeparator = " \xE2\x80\x93 Part ";

// Escapes the characters a URL parser would treat as delimiters inside a file name.
std::string escapePathDelimiters(const std::string& path) {
    std::string escaped;
    escaped.reserve(path.size());
    for (char c : path) {
        switch (c) {
            case '%': escaped += "%25"; break;
            case '?': escaped += "%3F"; break;
            case '#': escaped += "%23"; break;
            case '\\': escaped += '/'; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

void appendText(pugi::xml_node parent, const char* name, const std::string& text) {
    parent.append_child(name).text().set(text.c_str());
}

} // namespace

FeedSynthesizer::FeedSynthesizer(const ChannelMeta& channel, const std::filesystem::path& rootDir)
    : channel_(channel), rootDir_(rootDir) {
}

std::string FeedSynthesizer::render(const std::vector<Episode>& episodes) const {
    pugi::xml_document doc;

    auto declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    auto rss = doc.append_child("rss");
    rss.append_attribute("version") = "2.0";
    rss.append_attribute("xmlns:itunes") = kItunesNamespace;

    auto channel = rss.append_child("channel");
    buildChannel(channel);

    for (const auto& episode : episodes) {
        for (const auto& part : episode.parts) {
            appendItem(channel, episode, part);
        }
    }

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

void FeedSynthesizer::write(const std::vector<Episode>& episodes, const std::filesystem::path& feedFile) const {
    const std::string xml = render(episodes);

    if (feedFile.has_parent_path()) {
        std::filesystem::create_directories(feedFile.parent_path());
    }

    std::filesystem::path tmp = feedFile;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + tmp.string());
        }
        file << xml;
        file.flush();
        if (!file) {
            throw std::runtime_error("Could not write feed: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, feedFile, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Could not replace feed " + feedFile.string());
    }
    Logger::info("RSS feed written to " + feedFile.string());
}

std::string FeedSynthesizer::enclosureUrl(const std::string& relativePath) const {
    // Absolute references (e.g. artwork hosted elsewhere) pass through.
    auto absolute = ada::parse<ada::url>(relativePath);
    if (absolute && (absolute->get_protocol() == "http:" || absolute->get_protocol() == "https:")) {
        return absolute->get_href();
    }

    std::string base = channel_.baseUrl;
    if (base.empty() || base.back() != '/') {
        base += '/';
    }

    std::string relative = escapePathDelimiters(relativePath);
    while (relative.rfind("./", 0) == 0) {
        relative.erase(0, 2);
    }
    relative.erase(0, relative.find_first_not_of('/'));

    auto baseUrl = ada::parse<ada::url>(base);
    if (baseUrl) {
        auto joined = ada::parse<ada::url>(relative, &*baseUrl);
        if (joined) {
            return joined->get_href();
        }
    }
    return base + relative;
}

std::string FeedSynthesizer::mimeTypeFor(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".m4a") return "audio/mp4";
    if (ext == ".aac") return "audio/aac";
    if (ext == ".ogg") return "audio/ogg";
    if (ext == ".opus") return "audio/ogg; codecs=opus";
    return "audio/mpeg";
}

void FeedSynthesizer::buildChannel(pugi::xml_node channel) const {
    appendText(channel, "title", channel_.title);
    appendText(channel, "link", channel_.baseUrl);
    appendText(channel, "description", channel_.description);
    appendText(channel, "language", channel_.language);
    appendText(channel, "itunes:author", channel_.author);
    appendText(channel, "itunes:explicit", channel_.explicitContent ? "yes" : "no");

    if (!channel_.image.empty()) {
        channel.append_child("itunes:image").append_attribute("href") = enclosureUrl(channel_.image).c_str();
    }
    if (!channel_.category.empty()) {
        channel.append_child("itunes:category").append_attribute("text") = channel_.category.c_str();
    }
}

void FeedSynthesizer::appendItem(pugi::xml_node channel, const Episode& episode, const AudioPart& part) const {
    auto item = channel.append_child("item");

    std::string title = episode.title;
    if (episode.parts.size() > 1) {
        title += kPartSeparator + std::to_string(part.index);
    }

    const std::string url = enclosureUrl(part.path);
    const std::string& author = episode.authorName.empty() ? channel_.author : episode.authorName;
    const std::string& image = episode.imageRef.empty() ? channel_.image : episode.imageRef;

    appendText(item, "title", title);
    appendText(item, "description", episode.descriptionHtml);
    appendText(item, "pubDate", formatRfc2822(episode.publishInstant));
    appendText(item, "itunes:author", author);
    appendText(item, "itunes:explicit", channel_.explicitContent ? "yes" : "no");
    if (!image.empty()) {
        item.append_child("itunes:image").append_attribute("href") = enclosureUrl(image).c_str();
    }

    auto enclosure = item.append_child("enclosure");
    enclosure.append_attribute("url") = url.c_str();
    enclosure.append_attribute("length") = std::to_string(currentSize(part)).c_str();
    enclosure.append_attribute("type") = mimeTypeFor(part.path).c_str();

    appendText(item, "guid", url);
}

std::uintmax_t FeedSynthesizer::currentSize(const AudioPart& part) const {
    std::filesystem::path path(part.path);
    if (!path.is_absolute()) {
        path = rootDir_ / path;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        Logger::warn("Part file missing while building feed: " + path.string());
        return 0;
    }
    return size;
}

} // namespace core
} // namespace podcapture
