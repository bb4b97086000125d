#pragma once

/// @file solar_position.hpp
/// @brief Apparent position of the Sun: ecliptic longitude, season, zodiac sign.

#include "core/types.hpp"

#include <string_view>

namespace chronoring::astro
{
    /// @brief Astronomical season, bounded by equinoxes and solstices.
    /// Named for the northern hemisphere.
    enum class Season : u8
    {
        Spring,  ///< 0° ≤ λ < 90°   (March equinox → June solstice)
        Summer,  ///< 90° ≤ λ < 180°
        Autumn,  ///< 180° ≤ λ < 270°
        Winter,  ///< 270° ≤ λ < 360°
    };

    /// @brief Tropical zodiac sign, one per 30° of ecliptic longitude starting at Aries.
    enum class ZodiacSign : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    /// @brief Position of the Sun for one Instant.
    struct SolarPosition
    {
        f64 ecliptic_longitude_deg;  ///< Apparent ecliptic longitude, [0, 360)
        f64 right_ascension_deg;     ///< [0, 360)
        f64 declination_deg;         ///< [-23.44, +23.44]
        f64 obliquity_deg;           ///< Obliquity of the ecliptic used
        f64 distance_au;             ///< Earth–Sun distance
        Season season;
        f64 season_progress;         ///< Fraction of the current season elapsed, [0, 1)
        ZodiacSign zodiac;
        f64 zodiac_progress;         ///< Fraction of the current sign elapsed, [0, 1)
    };

    /// @brief Low-precision solar ephemeris (Astronomical Almanac, accuracy ~0.01°).
    ///
    /// With n = JD − 2451545.0:
    ///   L = 280.460° + 0.9856474° n        (mean longitude)
    ///   g = 357.528° + 0.9856003° n        (mean anomaly)
    ///   λ = L + 1.915° sin g + 0.020° sin 2g
    ///   ε = 23.439° − 0.0000004° n
    /// Valid for roughly 1950–2050 at this accuracy, still well under 1° for
    /// several centuries either side.
    class SolarPositionCalculator
    {
    public:
        SolarPositionCalculator() = delete;

        /// @brief Compute the Sun's position for an Instant.
        [[nodiscard]] static SolarPosition compute(Instant instant);

        /// @brief Compute the Sun's position for a Julian Date.
        [[nodiscard]] static SolarPosition compute_jd(f64 jd);

        /// @brief Season containing an ecliptic longitude (degrees, any range).
        [[nodiscard]] static Season season_for_longitude(f64 longitude_deg);

        /// @brief Zodiac sign containing an ecliptic longitude (degrees, any range).
        [[nodiscard]] static ZodiacSign zodiac_for_longitude(f64 longitude_deg);
    };

    [[nodiscard]] std::string_view to_string(Season season);
    [[nodiscard]] std::string_view to_string(ZodiacSign sign);

} // namespace chronoring::astro
