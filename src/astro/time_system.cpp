/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <chrono>
#include <cmath>

namespace chronoring::astro
{

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Time from day fraction
    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// Instant ↔ Julian Date
//
// The Unix epoch (1970-01-01 00:00 UTC) is JD 2440587.5.
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(Instant instant)
{
    using namespace std::chrono;

    const auto total_seconds = duration_cast<duration<f64>>(instant.time_since_epoch()).count();
    return astro_constants::kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay;
}

Instant TimeSystem::to_instant(f64 jd)
{
    const f64 micros = (jd - astro_constants::kUnixEpochJd) * astro_constants::kSecondsPerDay * 1.0e6;
    return Instant{Duration{static_cast<i64>(std::llround(micros))}};
}

Instant TimeSystem::to_instant(const DateTime& dt)
{
    using namespace std::chrono;

    // Integer day arithmetic keeps whole-second inputs exact
    const year_month_day ymd{year{dt.year},
                             month{static_cast<unsigned>(dt.month)},
                             day{static_cast<unsigned>(dt.day)}};
    const auto midnight = time_point_cast<Duration>(sys_days{ymd});
    const auto second_us = static_cast<i64>(std::llround(dt.second * 1.0e6));

    return midnight + hours{dt.hour} + minutes{dt.minute} + Duration{second_us};
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
//
// Where T = Julian centuries from J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::gmst_deg(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst = 280.46061837
                   + 360.98564736629 * d
                   + 0.000387933 * t * t
                   - (t * t * t) / 38710000.0;

    return normalize_degrees(gmst);
}

// -----------------------------------------------------------------
// LMST = GMST + observer longitude
// -----------------------------------------------------------------

f64 TimeSystem::lmst_deg(f64 jd, f64 longitude_deg)
{
    return normalize_degrees(gmst_deg(jd) + longitude_deg);
}

f64 TimeSystem::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, 360.0);
    if (angle < 0.0)
    {
        angle += 360.0;
    }
    // fmod of a tiny negative value can round back up to exactly 360
    if (angle >= 360.0)
    {
        angle = 0.0;
    }
    return angle;
}

f64 TimeSystem::wrap_degrees_180(f64 angle)
{
    return normalize_degrees(angle + 180.0) - 180.0;
}

} // namespace chronoring::astro
