#pragma once

#include "core/Config.hpp"
#include "core/Episode.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace podcapture {
namespace core {

// Renders cataloged episodes into an RSS 2.0 podcast feed with iTunes tags.
// Output depends only on the episodes, the channel metadata and the current
// sizes of the part files.
class FeedSynthesizer {
public:
    FeedSynthesizer(const ChannelMeta& channel, const std::filesystem::path& rootDir = ".");

    // `episodes` must already be in feed order (EpisodeCatalog::episodes()).
    std::string render(const std::vector<Episode>& episodes) const;

    // Atomically replaces feedFile with the rendered feed.
    void write(const std::vector<Episode>& episodes, const std::filesystem::path& feedFile) const;

    // baseUrl joined with a relative part path, percent-encoded as needed.
    std::string enclosureUrl(const std::string& relativePath) const;

    static std::string mimeTypeFor(const std::string& path);

private:
    void buildChannel(pugi::xml_node channel) const;
    void appendItem(pugi::xml_node channel, const Episode& episode, const AudioPart& part) const;
    std::uintmax_t currentSize(const AudioPart& part) const;

    ChannelMeta channel_;
    std::filesystem::path rootDir_;
};

} // namespace core
} // namespace podcapture
