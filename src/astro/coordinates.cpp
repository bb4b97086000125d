/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace chronoring::astro
{

// -----------------------------------------------------------------
// Ecliptic → Equatorial, for a body on the ecliptic (β = 0)
//
// RA  = atan2(cos(ε) × sin(λ), cos(λ))
// Dec = asin(sin(ε) × sin(λ))
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(
    f64 ecliptic_longitude_rad,
    f64 obliquity_rad)
{
    const f64 sin_lambda = std::sin(ecliptic_longitude_rad);
    const f64 cos_lambda = std::cos(ecliptic_longitude_rad);

    const f64 ra = std::atan2(std::cos(obliquity_rad) * sin_lambda, cos_lambda);
    const f64 dec = std::asin(std::clamp(std::sin(obliquity_rad) * sin_lambda, -1.0, 1.0));

    return EquatorialCoord{
        .ra  = normalize_radians(ra),
        .dec = dec,
    };
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   sin(az) × cos(alt) = -cos(dec) × sin(H)
//   cos(az) × cos(alt) =  sin(dec) × cos(lat) - cos(dec) × sin(lat) × cos(H)
//   az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
//
// Normalize az to [0, 2π)
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    // Altitude
    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    // Azimuth (north-based, east = π/2)
    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;

    return HorizontalCoord{
        .alt = alt,
        .az  = normalize_radians(std::atan2(az_y, az_x)),
    };
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace chronoring::astro
