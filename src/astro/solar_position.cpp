/// @file solar_position.cpp
/// @brief Implementation of the low-precision solar ephemeris.

#include "astro/solar_position.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"

#include <glm/trigonometric.hpp>

#include <array>
#include <cmath>

namespace chronoring::astro
{

namespace
{

constexpr std::array<std::string_view, 4> kSeasonNames{
    "Spring", "Summer", "Autumn", "Winter",
};

constexpr std::array<std::string_view, 12> kZodiacNames{
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

} // anonymous namespace

SolarPosition SolarPositionCalculator::compute(Instant instant)
{
    return compute_jd(TimeSystem::to_julian_date(instant));
}

// -----------------------------------------------------------------
// Mean longitude + equation of center, then ecliptic → equatorial
// -----------------------------------------------------------------

SolarPosition SolarPositionCalculator::compute_jd(f64 jd)
{
    const f64 n = jd - astro_constants::kJ2000;

    const f64 mean_longitude = TimeSystem::normalize_degrees(280.460 + 0.9856474 * n);
    const f64 mean_anomaly = glm::radians(TimeSystem::normalize_degrees(357.528 + 0.9856003 * n));

    // Equation of center from the orbital eccentricity
    const f64 lambda = TimeSystem::normalize_degrees(
        mean_longitude
        + 1.915 * std::sin(mean_anomaly)
        + 0.020 * std::sin(2.0 * mean_anomaly));

    const f64 obliquity = 23.439 - 0.0000004 * n;

    const f64 distance = 1.00014
                       - 0.01671 * std::cos(mean_anomaly)
                       - 0.00014 * std::cos(2.0 * mean_anomaly);

    const EquatorialCoord eq = Coordinates::ecliptic_to_equatorial(
        glm::radians(lambda), glm::radians(obliquity));

    const f64 season_span = std::fmod(lambda, 90.0);
    const f64 sign_span = std::fmod(lambda, 30.0);

    return SolarPosition{
        .ecliptic_longitude_deg = lambda,
        .right_ascension_deg    = TimeSystem::normalize_degrees(glm::degrees(eq.ra)),
        .declination_deg        = glm::degrees(eq.dec),
        .obliquity_deg          = obliquity,
        .distance_au            = distance,
        .season                 = season_for_longitude(lambda),
        .season_progress        = season_span / 90.0,
        .zodiac                 = zodiac_for_longitude(lambda),
        .zodiac_progress        = sign_span / 30.0,
    };
}

Season SolarPositionCalculator::season_for_longitude(f64 longitude_deg)
{
    const auto index = static_cast<u8>(TimeSystem::normalize_degrees(longitude_deg) / 90.0);
    return static_cast<Season>(index < 4 ? index : 3);
}

ZodiacSign SolarPositionCalculator::zodiac_for_longitude(f64 longitude_deg)
{
    const auto index = static_cast<u8>(TimeSystem::normalize_degrees(longitude_deg) / 30.0);
    return static_cast<ZodiacSign>(index < 12 ? index : 11);
}

std::string_view to_string(Season season)
{
    return kSeasonNames[static_cast<std::size_t>(season)];
}

std::string_view to_string(ZodiacSign sign)
{
    return kZodiacNames[static_cast<std::size_t>(sign)];
}

} // namespace chronoring::astro
