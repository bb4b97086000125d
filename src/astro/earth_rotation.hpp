#pragma once

/// @file earth_rotation.hpp
/// @brief Earth rotation relative to the Sun: subsolar point, local hour angle, daylight.

#include "astro/solar_position.hpp"
#include "core/types.hpp"

namespace chronoring::astro
{
    /// @brief Rotation state of the Earth for one Instant and one observer.
    struct RotationState
    {
        f64  subsolar_longitude_deg;    ///< [-180, 180), east positive
        f64  subsolar_latitude_deg;     ///< Equals the solar declination
        f64  local_rotation_angle_deg;  ///< Local solar hour angle, [0, 360), 0 = apparent noon
        f64  sidereal_angle_deg;        ///< Local mean sidereal time, [0, 360)
        f64  sun_altitude_deg;          ///< Angular distance above the terminator (negative = night)
        f64  day_fraction_visible;      ///< Fraction of the day the location spends in daylight, [0, 1]
        bool is_daytime;
    };

    /// @brief Geometric day/night model of the rotating Earth.
    ///
    /// The subsolar point is where the Sun's hour angle is zero:
    ///   lon_ss = RA_sun − GMST,  lat_ss = δ_sun
    /// Daylight duration at latitude φ follows the sunrise hour angle
    ///   cos H0 = −tan φ · tan δ
    /// No refraction or solar-disc correction is applied.
    class EarthRotationModel
    {
    public:
        EarthRotationModel() = delete;

        /// @brief Compute the rotation state for an Instant and observer location.
        [[nodiscard]] static RotationState compute(Instant instant, const GeoLocation& location);

        /// @brief Same as compute(), reusing an already computed solar position.
        [[nodiscard]] static RotationState compute(Instant instant,
                                                   const GeoLocation& location,
                                                   const SolarPosition& sun);

        /// @brief Fraction of 24 h with the Sun above the horizon, from latitude and declination.
        [[nodiscard]] static f64 daylight_fraction(f64 latitude_deg, f64 declination_deg);
    };

} // namespace chronoring::astro
