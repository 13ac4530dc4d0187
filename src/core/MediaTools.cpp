#include "core/MediaTools.hpp"
#include "core/Logger.hpp"
#include <cstdlib>
#include <system_error>
#include <thread>

namespace podcapture {
namespace core {

namespace {

constexpr std::chrono::milliseconds kPollInterval{500};
constexpr std::chrono::seconds kGracePeriod{300};
constexpr int kProbeTimeoutMs = 10000;

// Quotes a value for a VLC module chain (":sout=#std{dst=...}").
std::string quoteChainValue(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

const char* describeState(libvlc_state_t state) {
    switch (state) {
        case libvlc_NothingSpecial: return "idle";
        case libvlc_Opening: return "opening";
        case libvlc_Buffering: return "buffering";
        case libvlc_Playing: return "still playing";
        case libvlc_Paused: return "paused";
        case libvlc_Stopped: return "stopped early";
        case libvlc_Ended: return "ended";
        case libvlc_Error: return "error";
        default: return "unrecognized";
    }
}

} // namespace

VlcMediaTools::VlcMediaTools(int audioBitrateKbps)
    : vlc_(nullptr), initFailed_(false), audioBitrateKbps_(audioBitrateKbps) {
}

VlcMediaTools::~VlcMediaTools() {
    if (vlc_) {
        libvlc_release(vlc_);
    }
}

libvlc_instance_t* VlcMediaTools::instance() const {
    if (vlc_ || initFailed_) {
        return vlc_;
    }

    #ifdef __APPLE__
    setenv("VLC_PLUGIN_PATH", "/Applications/VLC.app/Contents/MacOS/plugins", 1);
    #endif

    const char* args[] = {
        "--no-video",
        "--quiet",
        "--network-caching=3000"
    };

    vlc_ = libvlc_new(3, args);
    if (!vlc_) {
        initFailed_ = true;
        Logger::error("Failed to initialize VLC, media operations are unavailable");
    }
    return vlc_;
}

bool VlcMediaTools::record(const std::string& streamUrl, const std::filesystem::path& outputPath,
                           std::chrono::seconds duration) {
    libvlc_instance_t* vlc = instance();
    if (!vlc) {
        return false;
    }
    libvlc_media_t* media = libvlc_media_new_location(vlc, streamUrl.c_str());
    if (!media) {
        Logger::error("Failed to create media from URL: " + streamUrl);
        return false;
    }

    const std::string sout = ":sout=#transcode{acodec=mp3,ab=" + std::to_string(audioBitrateKbps_) +
                             ",channels=2,samplerate=44100}:std{access=file,mux=dummy,dst=" +
                             quoteChainValue(outputPath.string()) + "}";
    const std::string runTime = ":run-time=" + std::to_string(duration.count());

    libvlc_media_add_option(media, sout.c_str());
    libvlc_media_add_option(media, runTime.c_str());
    libvlc_media_add_option(media, ":no-sout-video");
    libvlc_media_add_option(media, ":http-reconnect=true");
    libvlc_media_add_option(media, ":network-caching=5000");
    libvlc_media_add_option(media, ":network-timeout=30000");

    Logger::info("Recording " + streamUrl + " for " + std::to_string(duration.count()) + "s into " +
                 outputPath.string());
    if (!runToCompletion(media, duration + kGracePeriod)) {
        return false;
    }
    return std::filesystem::exists(outputPath);
}

std::optional<double> VlcMediaTools::probe(const std::filesystem::path& file) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    libvlc_instance_t* vlc = instance();
    if (!vlc) {
        return std::nullopt;
    }
    libvlc_media_t* media = libvlc_media_new_path(vlc, file.c_str());
    if (!media) {
        return std::nullopt;
    }

    if (libvlc_media_parse_with_options(media, libvlc_media_parse_local, kProbeTimeoutMs) != 0) {
        libvlc_media_release(media);
        return std::nullopt;
    }

    // Parsing is asynchronous; wait for it to settle.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kProbeTimeoutMs) +
                          kPollInterval;
    libvlc_media_parsed_status_t status = libvlc_media_get_parsed_status(media);
    while (status != libvlc_media_parsed_status_done &&
           status != libvlc_media_parsed_status_failed &&
           status != libvlc_media_parsed_status_timeout &&
           status != libvlc_media_parsed_status_skipped &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        status = libvlc_media_get_parsed_status(media);
    }

    libvlc_time_t durationMs = status == libvlc_media_parsed_status_done ? libvlc_media_get_duration(media) : -1;
    libvlc_media_release(media);

    if (durationMs <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(durationMs) / 1000.0;
}

bool VlcMediaTools::extract(const std::filesystem::path& source, const std::filesystem::path& dest,
                            long startSeconds, long lengthSeconds) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        Logger::error("Source media not found: " + source.string());
        return false;
    }
    libvlc_instance_t* vlc = instance();
    if (!vlc) {
        return false;
    }
    libvlc_media_t* media = libvlc_media_new_path(vlc, source.c_str());
    if (!media) {
        Logger::error("Failed to open media: " + source.string());
        return false;
    }

    const std::string start = ":start-time=" + std::to_string(startSeconds);
    const std::string stop = ":stop-time=" + std::to_string(startSeconds + lengthSeconds);
    const std::string sout = ":sout=#std{access=file,mux=dummy,dst=" + quoteChainValue(dest.string()) + "}";

    libvlc_media_add_option(media, start.c_str());
    libvlc_media_add_option(media, stop.c_str());
    libvlc_media_add_option(media, sout.c_str());
    libvlc_media_add_option(media, ":no-sout-video");

    if (!runToCompletion(media, std::chrono::seconds(lengthSeconds) + kGracePeriod)) {
        return false;
    }
    return std::filesystem::exists(dest);
}

bool VlcMediaTools::runToCompletion(libvlc_media_t* media, std::chrono::seconds deadline) {
    libvlc_media_player_t* player = libvlc_media_player_new_from_media(media);
    libvlc_media_release(media);
    if (!player) {
        Logger::error("Failed to create VLC media player");
        return false;
    }

    if (libvlc_media_player_play(player) < 0) {
        Logger::error("Failed to start VLC stream output");
        libvlc_media_player_release(player);
        return false;
    }

    const auto until = std::chrono::steady_clock::now() + deadline;
    libvlc_state_t state = libvlc_media_player_get_state(player);
    while (state != libvlc_Ended && state != libvlc_Error && state != libvlc_Stopped &&
           std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(kPollInterval);
        state = libvlc_media_player_get_state(player);
    }

    if (state != libvlc_Ended) {
        Logger::error(std::string("VLC stream output did not reach the end (") + describeState(state) + ")");
    }

    libvlc_media_player_stop(player);
    libvlc_media_player_release(player);
    return state == libvlc_Ended;
}

} // namespace core
} // namespace podcapture
