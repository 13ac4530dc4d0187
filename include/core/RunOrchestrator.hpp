#pragma once

#include "core/Config.hpp"
#include "core/EpisodeCatalog.hpp"
#include "core/MediaTools.hpp"
#include "core/MetadataProvider.hpp"
#include "core/Notifier.hpp"
#include "core/Schedule.hpp"
#include <functional>
#include <string>
#include <vector>

namespace podcapture {
namespace core {

enum class RunOutcome {
    LockHeld,          // another run holds the lock
    NothingScheduled,
    DuplicateKey,      // the slot is already cataloged
    Recorded,
    CaptureFailed,
    SegmentFailed
};

const char* toString(RunOutcome outcome);

// 0 for no-op and success, 1 when a capture or its segmentation failed.
int exitCodeFor(RunOutcome outcome);

// One pass of the recorder: cleanup, schedule check, capture, segment,
// catalog, feed, notify, publish. Holds the run lock for its whole duration.
class RunOrchestrator {
public:
    RunOrchestrator(const Config& config,
                    Recorder& recorder,
                    DurationProbe& probe,
                    RangeExtractor& extractor,
                    MetadataProvider& metadata,
                    Notifier& notifier,
                    Publisher& publisher,
                    std::function<Instant()> clock = [] { return Clock::now(); });

    // force skips the schedule and records config.forceShowName right away.
    // Throws std::runtime_error when the catalog or feed cannot be written.
    RunOutcome run(bool force = false);

    // Retention pass; also run at the start of every run().
    std::vector<Episode> cleanup(EpisodeCatalog& catalog, Instant now) const;

    static std::string describeEpisode(const std::string& showName, Instant start, const ShowMetadata& meta);

private:
    RunOutcome capture(EpisodeCatalog& catalog, const CaptureRequest& request);
    void rebuildFeed(const EpisodeCatalog& catalog) const;
    std::string toCatalogPath(const std::string& path) const;

    const Config config_;
    Recorder& recorder_;
    DurationProbe& probe_;
    RangeExtractor& extractor_;
    MetadataProvider& metadata_;
    Notifier& notifier_;
    Publisher& publisher_;
    std::function<Instant()> clock_;
};

} // namespace core
} // namespace podcapture
