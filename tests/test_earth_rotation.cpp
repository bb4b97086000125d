/// @file test_earth_rotation.cpp
/// @brief Unit tests for chronoring::astro::EarthRotationModel.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/earth_rotation.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace chronoring;
using namespace chronoring::astro;

static Instant utc(i32 year, i32 month, i32 day, i32 hour, i32 minute)
{
    return TimeSystem::to_instant(DateTime{
        .year = year, .month = month, .day = day, .hour = hour, .minute = minute, .second = 0.0,
    });
}

static const GeoLocation kGreenwich{.latitude_deg = 51.4779, .longitude_deg = 0.0};
static const GeoLocation kWarsaw{.latitude_deg = 52.23, .longitude_deg = 21.01};
static const GeoLocation kSydney{.latitude_deg = -33.87, .longitude_deg = 151.21};

// =================================================================
// Subsolar point
// =================================================================

TEST_CASE("Subsolar point at 12:00 UTC on the September equinox is near Greenwich")
{
    const RotationState rot = EarthRotationModel::compute(utc(2024, 9, 22, 12, 0), kGreenwich);

    // Equation of time ≈ +7.5 min puts the Sun ≈ 1.9° west of Greenwich
    CHECK(rot.subsolar_longitude_deg == doctest::Approx(-1.87).epsilon(0.05));
    CHECK(std::abs(rot.subsolar_latitude_deg) < 0.1);
}

TEST_CASE("Subsolar latitude equals the solar declination")
{
    const Instant t = utc(2024, 6, 20, 12, 0);
    const SolarPosition sun = SolarPositionCalculator::compute(t);
    const RotationState rot = EarthRotationModel::compute(t, kWarsaw, sun);

    CHECK(rot.subsolar_latitude_deg == sun.declination_deg);
    CHECK(rot.subsolar_latitude_deg == doctest::Approx(23.435).epsilon(1e-3));
}

TEST_CASE("Subsolar longitude stays in [-180, 180)")
{
    for (i32 hour = 0; hour < 24; ++hour)
    {
        const RotationState rot = EarthRotationModel::compute(utc(2024, 1, 1, hour, 0), kGreenwich);
        CHECK(rot.subsolar_longitude_deg >= -180.0);
        CHECK(rot.subsolar_longitude_deg < 180.0);
    }
}

// =================================================================
// Local rotation angle
// =================================================================

TEST_CASE("Rotation angle is zero where the Sun is overhead")
{
    const Instant t = utc(2024, 3, 1, 9, 30);
    const RotationState at_greenwich = EarthRotationModel::compute(t, kGreenwich);

    const GeoLocation subsolar{.latitude_deg = at_greenwich.subsolar_latitude_deg,
                               .longitude_deg = at_greenwich.subsolar_longitude_deg};
    const RotationState overhead = EarthRotationModel::compute(t, subsolar);

    const f64 angle = overhead.local_rotation_angle_deg;
    CHECK((angle < 1e-6 || angle > 360.0 - 1e-6));
    CHECK(overhead.sun_altitude_deg == doctest::Approx(90.0).epsilon(1e-3));
}

TEST_CASE("Rotation angle advances ~15° per hour and only wraps at 360°")
{
    f64 previous = EarthRotationModel::compute(utc(2024, 5, 10, 0, 0), kWarsaw).local_rotation_angle_deg;
    u32 wraps = 0;

    for (i32 minute = 10; minute < 48 * 60; minute += 10)
    {
        const Instant t = utc(2024, 5, 10, 0, 0) + std::chrono::minutes{minute};
        const f64 angle = EarthRotationModel::compute(t, kWarsaw).local_rotation_angle_deg;

        CHECK(angle >= 0.0);
        CHECK(angle < 360.0);

        f64 step = angle - previous;
        if (step < 0.0)
        {
            ++wraps;
            step += 360.0;
        }
        CHECK(step == doctest::Approx(2.5).epsilon(0.01));
        previous = angle;
    }

    CHECK(wraps == 2);
}

// =================================================================
// Day / night
// =================================================================

TEST_CASE("Midday in Warsaw and midnight in Sydney on the June solstice")
{
    const Instant t = utc(2024, 6, 20, 12, 0);

    const RotationState warsaw = EarthRotationModel::compute(t, kWarsaw);
    const RotationState sydney = EarthRotationModel::compute(t, kSydney);

    CHECK(warsaw.is_daytime);
    CHECK(warsaw.sun_altitude_deg == doctest::Approx(57.19).epsilon(0.01));
    CHECK_FALSE(sydney.is_daytime);
    CHECK(sydney.sun_altitude_deg < -60.0);
}

TEST_CASE("Daylight fraction: equinox equator, summer and polar cases")
{
    CHECK(EarthRotationModel::daylight_fraction(0.0, 0.0) == doctest::Approx(0.5));
    CHECK(EarthRotationModel::daylight_fraction(60.0, 23.435) * 24.0 == doctest::Approx(18.49).epsilon(0.01));
    CHECK(EarthRotationModel::daylight_fraction(-60.0, 23.435) * 24.0 == doctest::Approx(24.0 - 18.49).epsilon(0.01));
    CHECK(EarthRotationModel::daylight_fraction(80.0, 23.435) == doctest::Approx(1.0));
    CHECK(EarthRotationModel::daylight_fraction(-80.0, 23.435) == 0.0);
}

TEST_CASE("Daylight fraction at the poles")
{
    CHECK(EarthRotationModel::daylight_fraction(90.0, 10.0) == 1.0);
    CHECK(EarthRotationModel::daylight_fraction(90.0, -10.0) == 0.0);
    CHECK(EarthRotationModel::daylight_fraction(-90.0, -10.0) == 1.0);
}

TEST_CASE("Sidereal angle is the local sidereal time")
{
    const Instant t = utc(2024, 2, 29, 18, 15);
    const RotationState rot = EarthRotationModel::compute(t, kWarsaw);

    const f64 expected = TimeSystem::lmst_deg(TimeSystem::to_julian_date(t), kWarsaw.longitude_deg);
    CHECK(rot.sidereal_angle_deg == doctest::Approx(expected).epsilon(1e-12));
}
