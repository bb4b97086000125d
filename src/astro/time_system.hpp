#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time, Instant conversion.

#include "core/types.hpp"

namespace chronoring::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), and Instant <-> Julian Date mapping.
    /// Sidereal results are in degrees; nothing here reads the system clock.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Julian Date of a UTC-anchored Instant.
        [[nodiscard]] static f64 to_julian_date(Instant instant);

        /// @brief Instant of a Julian Date, truncated to microseconds.
        [[nodiscard]] static Instant to_instant(f64 jd);

        /// @brief Instant of a civil date/time (UTC).
        [[nodiscard]] static Instant to_instant(const DateTime& dt);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (degrees).
        /// @param jd Julian Date (UTC).
        /// @return GMST in degrees, normalized to [0, 360).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst_deg(f64 jd);

        /// @brief Local Mean Sidereal Time (degrees).
        /// @param jd Julian Date (UTC).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        /// @return LMST in degrees, normalized to [0, 360).
        [[nodiscard]] static f64 lmst_deg(f64 jd, f64 longitude_deg);

        /// @brief Normalize an angle to the range [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);

        /// @brief Normalize an angle to the range [-180, 180).
        [[nodiscard]] static f64 wrap_degrees_180(f64 angle);
    };

} // namespace chronoring::astro
