#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Ecliptic, Equatorial, Horizontal.

#include "core/types.hpp"

namespace chronoring::astro
{
    /// @brief Equatorial coordinate (of date).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Ecliptic (longitude, latitude = 0) → Equatorial (RA/Dec).
        /// @param ecliptic_longitude_rad Ecliptic longitude of the body (radians).
        /// @param obliquity_rad Obliquity of the ecliptic (radians).
        /// @return Equatorial coordinates of a body lying on the ecliptic.
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            f64 ecliptic_longitude_rad,
            f64 obliquity_rad
        );

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        /// @return Horizontal coordinates (altitude and azimuth).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace chronoring::astro
