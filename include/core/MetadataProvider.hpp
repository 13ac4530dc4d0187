#pragma once

#include <string>

namespace podcapture {
namespace core {

// Best-effort show metadata. Empty fields mean "use the channel default".
struct ShowMetadata {
    std::string trackListHtml;
    std::string imageUrl;
    std::string sourceUrl;
    std::string hostName;

    bool empty() const {
        return trackListHtml.empty() && imageUrl.empty() && sourceUrl.empty() && hostName.empty();
    }
};

class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    // Never throws; returns an empty ShowMetadata on any failure.
    virtual ShowMetadata fetch(const std::string& showName, const std::string& archiveUrl) noexcept = 0;
};

class NullMetadataProvider : public MetadataProvider {
public:
    ShowMetadata fetch(const std::string&, const std::string&) noexcept override { return {}; }
};

// Reads the most recent playlist linked from a Spinitron show archive page.
class SpinitronMetadataProvider : public MetadataProvider {
public:
    explicit SpinitronMetadataProvider(int timeoutSeconds = 15);

    ShowMetadata fetch(const std::string& showName, const std::string& archiveUrl) noexcept override;

    // Page parsing, exposed for tests. Both return empty results when the
    // expected markup is absent.
    static std::string findPlaylistUrl(const std::string& archiveHtml, const std::string& archiveUrl);
    static ShowMetadata parsePlaylist(const std::string& playlistHtml, const std::string& playlistUrl);

private:
    bool get(const std::string& url, std::string& body) const;

    int timeoutSeconds_;
};

} // namespace core
} // namespace podcapture
