#ifndef PODCAPTURE_CORE_SCHEDULE_HPP
#define PODCAPTURE_CORE_SCHEDULE_HPP

#include "core/Config.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace podcapture {
namespace core {

using Clock = std::chrono::system_clock;
using Instant = Clock::time_point;

struct CaptureRequest {
    std::string showName;
    Instant startInstant;
    std::chrono::seconds duration{3600};
    int blockIndex = 1;          // 1-based position of the hour within the slot
    std::string metadataUrl;
};

// Local-time calendar helpers. Weekday 0 is Monday.
int localWeekday(Instant instant);
int localHour(Instant instant);
Instant alignToHour(Instant instant);
Instant alignToMinute(Instant instant);

// Returns the first slot (in declaration order) covering the local weekday and
// hour of `now`, with the start aligned to the top of the hour. Overlapping
// slots resolve to whichever was declared first.
std::optional<CaptureRequest> evaluate(Instant now, const std::vector<ScheduleSlot>& schedule,
                                       std::chrono::seconds duration = std::chrono::seconds(3600));

// Unscheduled capture for operational testing.
CaptureRequest makeManualRequest(Instant now, const std::string& showName, std::chrono::seconds duration);

} // namespace core
} // namespace podcapture

#endif // PODCAPTURE_CORE_SCHEDULE_HPP
