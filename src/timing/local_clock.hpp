#pragma once

/// @file local_clock.hpp
/// @brief Civil time in the display timezone and the analog hand angles.

#include "core/types.hpp"
#include "timing/time_zone.hpp"

#include <chrono>
#include <string>

namespace chronoring::timing
{
    struct LocalClockState
    {
        i32 year;
        u32 month;       ///< 1–12
        u32 day;         ///< 1–31
        u32 weekday;     ///< 0 = Sunday
        u32 hour;
        u32 minute;
        f64 second;      ///< Including the fractional part

        std::string timezone;
        std::string abbreviation;
        std::chrono::seconds utc_offset{0};

        // Clockwise from 12 o'clock, degrees in [0, 360)
        f64 hour_hand_deg;    ///< 12-hour dial
        f64 minute_hand_deg;
        f64 second_hand_deg;
        f64 day_fraction;     ///< Fraction of the local civil day elapsed
    };

    class LocalClock
    {
    public:
        LocalClock() = delete;

        [[nodiscard]] static LocalClockState compute(Instant instant, const TimeZone& zone);

        /// @brief "YYYY-MM-DD HH:MM:SS.mmm ABBR"
        [[nodiscard]] static std::string format(const LocalClockState& state);
    };

} // namespace chronoring::timing
