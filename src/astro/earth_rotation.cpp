/// @file earth_rotation.cpp
/// @brief Implementation of the subsolar point and daylight model.

#include "astro/earth_rotation.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace chronoring::astro
{

RotationState EarthRotationModel::compute(Instant instant, const GeoLocation& location)
{
    return compute(instant, location, SolarPositionCalculator::compute(instant));
}

// -----------------------------------------------------------------
// Subsolar point and local hour angle
//
// Greenwich hour angle of the Sun: GHA = GMST − RA
// The subsolar meridian is where the local hour angle is zero,
// i.e. lon_ss = −GHA = RA − GMST.
// Local hour angle: LHA = LMST − RA = lon − lon_ss.
//
// GMST advances ~360.986°/day and RA ~1°/day, so LHA grows
// monotonically and only wraps at 360°.
// -----------------------------------------------------------------

RotationState EarthRotationModel::compute(Instant instant,
                                          const GeoLocation& location,
                                          const SolarPosition& sun)
{
    const f64 jd = TimeSystem::to_julian_date(instant);
    const f64 gmst = TimeSystem::gmst_deg(jd);
    const f64 lmst = TimeSystem::lmst_deg(jd, location.longitude_deg);

    const f64 subsolar_lon = TimeSystem::wrap_degrees_180(sun.right_ascension_deg - gmst);
    const f64 hour_angle = TimeSystem::normalize_degrees(location.longitude_deg - subsolar_lon);

    // Altitude of the Sun = 90° minus the central angle to the subsolar point,
    // i.e. the observer's angular distance from the terminator.
    const ObserverLocation observer{
        .latitude_rad  = glm::radians(location.latitude_deg),
        .longitude_rad = glm::radians(location.longitude_deg),
    };
    const EquatorialCoord sun_eq{
        .ra  = glm::radians(sun.right_ascension_deg),
        .dec = glm::radians(sun.declination_deg),
    };
    const HorizontalCoord sun_hz = Coordinates::equatorial_to_horizontal(
        sun_eq, observer, glm::radians(lmst));
    const f64 altitude = glm::degrees(sun_hz.alt);

    return RotationState{
        .subsolar_longitude_deg   = subsolar_lon,
        .subsolar_latitude_deg    = sun.declination_deg,
        .local_rotation_angle_deg = hour_angle,
        .sidereal_angle_deg       = lmst,
        .sun_altitude_deg         = altitude,
        .day_fraction_visible     = daylight_fraction(location.latitude_deg, sun.declination_deg),
        .is_daytime               = altitude > 0.0,
    };
}

// -----------------------------------------------------------------
// Sunrise hour angle: cos H0 = −tan φ · tan δ
//
// |cos H0| > 1 means the terminator never crosses this parallel:
// polar day (H0 = 180°) or polar night (H0 = 0°).
// -----------------------------------------------------------------

f64 EarthRotationModel::daylight_fraction(f64 latitude_deg, f64 declination_deg)
{
    const f64 phi = glm::radians(latitude_deg);
    const f64 delta = glm::radians(declination_deg);

    const f64 denom = std::cos(phi) * std::cos(delta);
    if (std::abs(denom) < 1e-12)
    {
        // At a pole: daylight all day iff the Sun is in that hemisphere
        const f64 product = std::sin(phi) * std::sin(delta);
        if (product > 0.0)
        {
            return 1.0;
        }
        return product < 0.0 ? 0.0 : 0.5;
    }

    const f64 cos_h0 = std::clamp(-(std::sin(phi) * std::sin(delta)) / denom, -1.0, 1.0);
    return glm::degrees(std::acos(cos_h0)) / 180.0;
}

} // namespace chronoring::astro
