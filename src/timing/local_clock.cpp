/// @file local_clock.cpp
/// @brief Local civil time and clock-hand geometry.

#include "timing/local_clock.hpp"

#include <spdlog/fmt/fmt.h>

namespace chronoring::timing
{

// -----------------------------------------------------------------
// Hand angles (continuous sweep)
//
// second = 6° × s
// minute = 6° × (m + s/60)
// hour   = 30° × ((h mod 12) + m/60 + s/3600)
// -----------------------------------------------------------------

LocalClockState LocalClock::compute(Instant instant, const TimeZone& zone)
{
    using namespace std::chrono;

    ZoneOffset offset = zone.offset_at(instant);

    const Instant local = instant + offset.utc_offset;
    const sys_days civil_day = floor<days>(local);
    const year_month_day ymd{civil_day};
    const weekday wd{civil_day};
    const hh_mm_ss<Duration> tod{local - civil_day};

    const auto hour = static_cast<u32>(tod.hours().count());
    const auto minute = static_cast<u32>(tod.minutes().count());
    const f64 second = static_cast<f64>(tod.seconds().count()) +
                       static_cast<f64>(tod.subseconds().count()) / 1'000'000.0;

    const f64 minutes_f = static_cast<f64>(minute) + second / 60.0;
    const f64 hours_f = static_cast<f64>(hour % 12) + minutes_f / 60.0;

    return LocalClockState{
        .year            = static_cast<i32>(ymd.year()),
        .month           = static_cast<u32>(ymd.month()),
        .day             = static_cast<u32>(ymd.day()),
        .weekday         = wd.c_encoding(),
        .hour            = hour,
        .minute          = minute,
        .second          = second,
        .timezone        = zone.id(),
        .abbreviation    = std::move(offset.abbreviation),
        .utc_offset      = offset.utc_offset,
        .hour_hand_deg   = 30.0 * hours_f,
        .minute_hand_deg = 6.0 * minutes_f,
        .second_hand_deg = 6.0 * second,
        .day_fraction    = static_cast<f64>((local - civil_day).count()) / (astro_constants::kSecondsPerDay * 1'000'000.0),
    };
}

std::string LocalClock::format(const LocalClockState& state)
{
    // Seconds are built from whole microseconds; the bias absorbs the binary rounding
    const auto total_ms = static_cast<u32>(state.second * 1000.0 + 1e-6);
    const u32 whole = total_ms / 1000;
    const u32 millis = total_ms % 1000;

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} {}",
                       state.year, state.month, state.day,
                       state.hour, state.minute, whole, millis, state.abbreviation);
}

} // namespace chronoring::timing
