#include "core/Schedule.hpp"
#include <algorithm>
#include <ctime>

namespace podcapture {
namespace core {

namespace {

std::tm toLocal(Instant instant) {
    std::time_t t = Clock::to_time_t(instant);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

Instant truncateToSecond(Instant instant) {
    return std::chrono::time_point_cast<std::chrono::seconds>(instant);
}

} // namespace

int localWeekday(Instant instant) {
    // tm_wday counts from Sunday
    return (toLocal(instant).tm_wday + 6) % 7;
}

int localHour(Instant instant) {
    return toLocal(instant).tm_hour;
}

// Works from the local minute/second fields so half-hour zone offsets align too.
Instant alignToHour(Instant instant) {
    std::tm tm = toLocal(instant);
    return truncateToSecond(instant) - std::chrono::seconds(tm.tm_min * 60 + tm.tm_sec);
}

Instant alignToMinute(Instant instant) {
    std::tm tm = toLocal(instant);
    return truncateToSecond(instant) - std::chrono::seconds(tm.tm_sec);
}

std::optional<CaptureRequest> evaluate(Instant now, const std::vector<ScheduleSlot>& schedule,
                                       std::chrono::seconds duration) {
    const int weekday = localWeekday(now);
    const int hour = localHour(now);

    for (const auto& slot : schedule) {
        if (slot.weekday != weekday) {
            continue;
        }
        auto it = std::find(slot.hours.begin(), slot.hours.end(), hour);
        if (it == slot.hours.end()) {
            continue;
        }

        CaptureRequest request;
        request.showName = slot.showName;
        request.startInstant = alignToHour(now);
        request.duration = duration;
        request.blockIndex = static_cast<int>(it - slot.hours.begin()) + 1;
        request.metadataUrl = slot.metadataUrl;
        return request;
    }
    return std::nullopt;
}

CaptureRequest makeManualRequest(Instant now, const std::string& showName, std::chrono::seconds duration) {
    CaptureRequest request;
    request.showName = showName;
    request.startInstant = alignToMinute(now);
    request.duration = duration;
    return request;
}

} // namespace core
} // namespace podcapture
