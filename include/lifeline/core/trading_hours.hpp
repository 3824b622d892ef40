#pragma once
// ============================================================================
// LIFELINE - Regular Trading Hours
// ============================================================================
// Exchange session bounds used to reject historical windows outside RTH.
// Exchange local time is expressed as a fixed UTC offset (the deployment
// updates it across daylight saving changes).
// ============================================================================

#include "lifeline/core/types.hpp"

#include <chrono>

namespace lifeline {

struct TradingHours {
    std::chrono::minutes open{9 * 60 + 30};   // 09:30 local
    std::chrono::minutes close{16 * 60};      // 16:00 local
    std::chrono::minutes utc_offset{-5 * 60}; // US/Eastern standard time

    /// True when [window.start, window.end) lies inside one weekday session
    [[nodiscard]] bool contains(const HistoricalWindow& window) const noexcept {
        using namespace std::chrono;
        if (window.end <= window.start) return false;

        const auto local_start = window.start.time_since_epoch() + utc_offset;
        const auto local_end = window.end.time_since_epoch() + utc_offset;

        const auto day = floor<days>(local_start);
        // 1970-01-01 was a Thursday (0 = Sunday)
        const auto weekday = ((day.count() % 7) + 11) % 7;
        if (weekday == 0 || weekday == 6) return false;

        const auto session_open = day + open;
        const auto session_close = day + close;
        return local_start >= session_open && local_end <= session_close;
    }
};

}  // namespace lifeline
