#ifndef PODCAPTURE_CORE_MEDIATOOLS_HPP
#define PODCAPTURE_CORE_MEDIATOOLS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vlc/vlc.h>

namespace podcapture {
namespace core {

// Captures `duration` of a live stream into outputPath.
// Returns false when the capture did not complete.
class Recorder {
public:
    virtual ~Recorder() = default;
    virtual bool record(const std::string& streamUrl, const std::filesystem::path& outputPath,
                        std::chrono::seconds duration) = 0;
};

class DurationProbe {
public:
    virtual ~DurationProbe() = default;
    // Duration in seconds, or nullopt when the file could not be probed.
    virtual std::optional<double> probe(const std::filesystem::path& file) const = 0;
};

// Lossless copy of [startSeconds, startSeconds + lengthSeconds) of source into dest.
class RangeExtractor {
public:
    virtual ~RangeExtractor() = default;
    virtual bool extract(const std::filesystem::path& source, const std::filesystem::path& dest,
                         long startSeconds, long lengthSeconds) = 0;
};

// libVLC backed implementation of all three media capabilities. The libVLC
// instance is created on first use; if that fails every operation reports
// failure instead of throwing.
class VlcMediaTools : public Recorder, public DurationProbe, public RangeExtractor {
public:
    explicit VlcMediaTools(int audioBitrateKbps = 192);
    ~VlcMediaTools() override;

    VlcMediaTools(const VlcMediaTools&) = delete;
    VlcMediaTools& operator=(const VlcMediaTools&) = delete;

    bool record(const std::string& streamUrl, const std::filesystem::path& outputPath,
                std::chrono::seconds duration) override;
    std::optional<double> probe(const std::filesystem::path& file) const override;
    bool extract(const std::filesystem::path& source, const std::filesystem::path& dest,
                 long startSeconds, long lengthSeconds) override;

private:
    // Plays media through its stream output until it ends, fails or the
    // deadline passes. Takes ownership of media.
    bool runToCompletion(libvlc_media_t* media, std::chrono::seconds deadline);
    libvlc_instance_t* instance() const;

    mutable libvlc_instance_t* vlc_;
    mutable bool initFailed_;
    int audioBitrateKbps_;
};

} // namespace core
} // namespace podcapture

#endif // PODCAPTURE_CORE_MEDIATOOLS_HPP
