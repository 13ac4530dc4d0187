#include "core/RunOrchestrator.hpp"
#include "core/Errors.hpp"
#include "core/FeedSynthesizer.hpp"
#include "core/Logger.hpp"
#include "core/RunLock.hpp"
#include "core/Segmenter.hpp"
#include <ctime>
#include <system_error>
#include <utility>

namespace podcapture {
namespace core {

namespace {

std::string escapeHtml(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '\'': out += "&#39;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string formatLocal(Instant instant, const char* pattern) {
    std::time_t t = Clock::to_time_t(instant);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[96];
    std::strftime(buf, sizeof(buf), pattern, &tm);
    return buf;
}

} // namespace

const char* toString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::LockHeld: return "lock held";
        case RunOutcome::NothingScheduled: return "nothing scheduled";
        case RunOutcome::DuplicateKey: return "already recorded";
        case RunOutcome::Recorded: return "recorded";
        case RunOutcome::CaptureFailed: return "capture failed";
        case RunOutcome::SegmentFailed: return "segmentation failed";
        default: return "unknown";
    }
}

int exitCodeFor(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::CaptureFailed:
        case RunOutcome::SegmentFailed:
            return 1;
        default:
            return 0;
    }
}

RunOrchestrator::RunOrchestrator(const Config& config,
                                 Recorder& recorder,
                                 DurationProbe& probe,
                                 RangeExtractor& extractor,
                                 MetadataProvider& metadata,
                                 Notifier& notifier,
                                 Publisher& publisher,
                                 std::function<Instant()> clock)
    : config_(config), recorder_(recorder), probe_(probe), extractor_(extractor), metadata_(metadata),
      notifier_(notifier), publisher_(publisher), clock_(std::move(clock)) {
}

RunOutcome RunOrchestrator::run(bool force) {
    auto lock = RunLock::tryAcquire(config_.resolve(config_.lockFile));
    if (!lock) {
        Logger::info("Another run is in progress (" + config_.resolve(config_.lockFile).string() + "), skipping.");
        return RunOutcome::LockHeld;
    }

    const Instant now = clock_();
    Logger::info("Now: " + formatLocal(now, "%Y-%m-%dT%H:%M:%S") + " (weekday=" +
                 std::to_string(localWeekday(now)) + ", hour=" + std::to_string(localHour(now)) + ")");

    EpisodeCatalog catalog(config_.resolve(config_.catalogFile), config_.rootDir);
    catalog.load();
    cleanup(catalog, now);

    std::optional<CaptureRequest> request;
    if (force) {
        Logger::info("Force mode: bypassing the schedule");
        request = makeManualRequest(now, config_.forceShowName, config_.forceCaptureDuration);
    } else {
        request = evaluate(now, config_.schedule, config_.captureDuration);
    }

    RunOutcome outcome = RunOutcome::NothingScheduled;
    if (request) {
        outcome = capture(catalog, *request);
    } else {
        Logger::info("Nothing scheduled right now.");
    }

    // A successful capture already wrote the feed; every other path rewrites it from the catalog.
    if (outcome != RunOutcome::Recorded) {
        rebuildFeed(catalog);
    }
    return outcome;
}

std::vector<Episode> RunOrchestrator::cleanup(EpisodeCatalog& catalog, Instant now) const {
    auto evicted = catalog.evictOlderThan(config_.retention, now);
    auto pruned = catalog.pruneStaleMedia(config_.resolve(config_.mediaDir), config_.retention, now);

    if (!evicted.empty()) {
        Logger::info("[CLEANUP] Evicted " + std::to_string(evicted.size()) + " episodes past retention.");
    }
    if (!pruned.empty()) {
        Logger::info("[CLEANUP] Removed " + std::to_string(pruned.size()) + " stale media files.");
    }

    catalog.save();
    return evicted;
}

RunOutcome RunOrchestrator::capture(EpisodeCatalog& catalog, const CaptureRequest& request) {
    const std::string key = makeEpisodeKey(request.startInstant, request.showName);
    const std::string stamp = formatLocal(request.startInstant, "%Y-%m-%d_%H%M");

    if (catalog.contains(key)) {
        Logger::warn("Episode " + key + " is already cataloged, skipping capture.");
        return RunOutcome::DuplicateKey;
    }

    const std::filesystem::path relativeFile = config_.mediaDir / (key + ".mp3");
    const std::filesystem::path outputFile = config_.resolve(relativeFile);
    std::filesystem::create_directories(outputFile.parent_path());

    Logger::info("Recording show: " + request.showName + " (block " + std::to_string(request.blockIndex) + ")");
    Logger::info("Output file: " + outputFile.string());

    std::error_code ec;
    if (!recorder_.record(config_.streamUrl, outputFile, request.duration) ||
        !std::filesystem::exists(outputFile, ec)) {
        Logger::error("Recording failed for " + request.showName);
        notifier_.notify("[ERROR] Failed recording: " + request.showName + " at " + stamp);
        return RunOutcome::CaptureFailed;
    }

    Logger::info("Recording complete, checking size / splitting...");
    std::vector<AudioPart> parts;
    try {
        Segmenter segmenter(extractor_);
        parts = segmenter.segment(outputFile, config_.maxPartBytes, probe_);
    } catch (const SegmentError& e) {
        Logger::error(std::string("Segmentation failed, capture kept at ") + outputFile.string() + ": " + e.what());
        notifier_.notify("[ERROR] Failed splitting: " + request.showName + " at " + stamp + " (" + e.what() + ")");
        return RunOutcome::SegmentFailed;
    }

    for (auto& part : parts) {
        part.path = toCatalogPath(part.path);
    }

    ShowMetadata meta = metadata_.fetch(request.showName, request.metadataUrl);
    if (meta.empty() && !request.metadataUrl.empty()) {
        Logger::warn("Metadata unavailable for " + request.showName + ", using channel defaults");
    }

    Episode episode;
    episode.key = key;
    episode.showName = request.showName;
    episode.title = makeEpisodeTitle(request.startInstant, request.showName);
    episode.publishInstant = request.startInstant;
    episode.descriptionHtml = describeEpisode(request.showName, request.startInstant, meta);
    episode.imageRef = meta.imageUrl.empty() ? config_.channel.image : meta.imageUrl;
    episode.authorName = meta.hostName.empty() ? config_.channel.author : meta.hostName;
    episode.sourceUrl = meta.sourceUrl;
    episode.parts = parts;

    try {
        catalog.insert(episode);
    } catch (const DuplicateKeyError& e) {
        Logger::warn(std::string(e.what()) + ", not cataloging this capture again.");
        return RunOutcome::DuplicateKey;
    }
    catalog.save();
    Logger::info("Metadata saved to " + catalog.storageFile().string());

    rebuildFeed(catalog);

    notifier_.notify("[OK] Recorded " + request.showName + " at " + stamp + " (" + std::to_string(parts.size()) +
                     " file(s))");
    publisher_.publish();
    return RunOutcome::Recorded;
}

void RunOrchestrator::rebuildFeed(const EpisodeCatalog& catalog) const {
    Logger::info("Rebuilding RSS feed...");
    FeedSynthesizer synthesizer(config_.channel, config_.rootDir);
    synthesizer.write(catalog.episodes(), config_.resolve(config_.feedFile));
}

std::string RunOrchestrator::describeEpisode(const std::string& showName, Instant start, const ShowMetadata& meta) {
    std::string html = "<p><strong>" + escapeHtml(showName) + "</strong></p>\n";
    html += "<p>Aired: " + formatLocal(start, "%A %B %d, %Y \xE2\x80\xA2 %I:%M %p") + "</p>";

    if (!meta.sourceUrl.empty()) {
        html += "\n<p><a href='" + escapeHtml(meta.sourceUrl) + "'>View playlist</a></p>";
    }
    if (!meta.trackListHtml.empty()) {
        html += "\n<p>Tracklist:</p>\n" + meta.trackListHtml;
    }
    return html;
}

// Paths under rootDir are stored relative to it so they can double as URL paths.
std::string RunOrchestrator::toCatalogPath(const std::string& path) const {
    std::filesystem::path relative = std::filesystem::path(path).lexically_relative(config_.rootDir);
    if (relative.empty() || *relative.begin() == "..") {
        return std::filesystem::path(path).generic_string();
    }
    return relative.generic_string();
}

} // namespace core
} // namespace podcapture
