/// @file test_local_clock.cpp
/// @brief Unit tests for chronoring::timing::TimeZone and LocalClock.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "timing/local_clock.hpp"
#include "timing/time_zone.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <thread>

using namespace chronoring;
using namespace chronoring::timing;
using namespace std::chrono_literals;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    chronoring::core::Logger::init(spdlog::level::warn, "chronoring_tests.log");
    const int result = doctest::Context(argc, argv).run();
    chronoring::core::Logger::shutdown();
    return result;
}

static Instant utc(i32 year, i32 month, i32 day, i32 hour, i32 minute, f64 second = 0.0)
{
    return astro::TimeSystem::to_instant(astro::DateTime{
        .year = year, .month = month, .day = day, .hour = hour, .minute = minute, .second = second,
    });
}

// =================================================================
// Zone resolution
// =================================================================

TEST_CASE("UTC aliases resolve to a zero fixed offset")
{
    for (const char* id : {"UTC", "GMT", "Z", "UTC+00:00"})
    {
        const auto zone = TimeZone::resolve(id);
        REQUIRE(zone.has_value());
        CHECK(zone->is_fixed());
        CHECK(zone->offset_at(Instant{}).utc_offset == 0s);
        CHECK(zone->offset_at(Instant{}).abbreviation == "UTC");
    }
}

TEST_CASE("Fixed offsets")
{
    const auto india = TimeZone::resolve("UTC+05:30");
    REQUIRE(india.has_value());
    CHECK(india->id() == "UTC+05:30");
    CHECK(india->offset_at(Instant{}).utc_offset == 5h + 30min);

    const auto pacific = TimeZone::resolve("UTC-8");
    REQUIRE(pacific.has_value());
    CHECK(pacific->offset_at(Instant{}).utc_offset == -8h);
    CHECK(pacific->offset_at(Instant{}).abbreviation == "UTC-08:00");

    const auto kiribati = TimeZone::resolve("GMT+14");
    REQUIRE(kiribati.has_value());
    CHECK(kiribati->offset_at(Instant{}).utc_offset == 14h);
}

TEST_CASE("Unknown or unsafe identifiers are rejected")
{
    CHECK_FALSE(TimeZone::resolve("").has_value());
    CHECK_FALSE(TimeZone::resolve("Mars/Olympus_Mons").has_value());
    CHECK_FALSE(TimeZone::resolve("../etc/passwd").has_value());
    CHECK_FALSE(TimeZone::resolve("/etc/localtime").has_value());
    CHECK_FALSE(TimeZone::resolve("UTC+15").has_value());
    CHECK_FALSE(TimeZone::resolve("UTC+05:75").has_value());
    CHECK_FALSE(TimeZone::resolve("UTC+5x").has_value());
}

TEST_CASE("IANA zone applies daylight saving")
{
    const auto warsaw = TimeZone::resolve("Europe/Warsaw");
    if (!warsaw)
    {
        MESSAGE("zoneinfo for Europe/Warsaw not installed, skipping");
        return;
    }

    CHECK_FALSE(warsaw->is_fixed());

    const ZoneOffset winter = warsaw->offset_at(utc(2024, 1, 15, 12, 0));
    CHECK(winter.utc_offset == 1h);
    CHECK(winter.abbreviation == "CET");

    const ZoneOffset summer = warsaw->offset_at(utc(2024, 7, 15, 12, 0));
    CHECK(summer.utc_offset == 2h);
    CHECK(summer.abbreviation == "CEST");

    // Clocks go forward at 01:00 UTC on the last Sunday of March
    CHECK(warsaw->offset_at(utc(2024, 3, 31, 0, 59, 59.0)).utc_offset == 1h);
    CHECK(warsaw->offset_at(utc(2024, 3, 31, 1, 0)).utc_offset == 2h);
    CHECK(warsaw->offset_at(utc(2024, 10, 27, 0, 59, 59.0)).utc_offset == 2h);
    CHECK(warsaw->offset_at(utc(2024, 10, 27, 1, 0)).utc_offset == 1h);

    // Far beyond the transition table the footer rule takes over
    CHECK(warsaw->offset_at(utc(2150, 7, 1, 12, 0)).abbreviation == "CEST");
    CHECK(warsaw->offset_at(utc(2150, 12, 1, 12, 0)).abbreviation == "CET");
}

TEST_CASE("Zone lookups leave the process timezone alone")
{
    const auto tokyo = TimeZone::resolve("Asia/Tokyo");
    if (!tokyo)
    {
        MESSAGE("zoneinfo for Asia/Tokyo not installed, skipping");
        return;
    }

    ::setenv("TZ", "UTC", 1);
    ::tzset();

    constexpr int kLookups = 20000;
    std::atomic<bool> done{false};
    i64 offset_sum = 0;

    std::thread lookups([&] {
        for (int i = 0; i < kLookups; ++i)
        {
            offset_sum += tokyo->offset_at(Instant{std::chrono::seconds{i * 60}}).utc_offset.count();
        }
        done.store(true);
    });

    int samples = 0;
    int foreign = 0;
    while (!done.load() || samples < 1000)
    {
        const std::time_t epoch = 0;
        std::tm local{};
        REQUIRE(::localtime_r(&epoch, &local) != nullptr);
        if (local.tm_gmtoff != 0)
        {
            ++foreign;
        }
        ++samples;
    }
    lookups.join();

    CHECK(foreign == 0);
    CHECK(offset_sum == i64{kLookups} * 9 * 3600);
    CHECK(tokyo->offset_at(Instant{}).abbreviation == "JST");
}

// =================================================================
// Local clock
// =================================================================

TEST_CASE("UTC fields and hand angles")
{
    const LocalClockState s = LocalClock::compute(utc(2024, 3, 15, 14, 45, 30.25), TimeZone::utc());

    CHECK(s.year == 2024);
    CHECK(s.month == 3);
    CHECK(s.day == 15);
    CHECK(s.weekday == 5);  // Friday
    CHECK(s.hour == 14);
    CHECK(s.minute == 45);
    CHECK(s.second == doctest::Approx(30.25));
    CHECK(s.timezone == "UTC");
    CHECK(s.utc_offset == 0s);

    CHECK(s.second_hand_deg == doctest::Approx(181.5));
    CHECK(s.minute_hand_deg == doctest::Approx(6.0 * (45.0 + 30.25 / 60.0)));
    CHECK(s.hour_hand_deg == doctest::Approx(30.0 * (2.0 + (45.0 + 30.25 / 60.0) / 60.0)));
}

TEST_CASE("Hands at noon and midnight point up")
{
    const LocalClockState noon = LocalClock::compute(utc(2024, 3, 15, 12, 0), TimeZone::utc());
    CHECK(noon.hour_hand_deg == 0.0);
    CHECK(noon.minute_hand_deg == 0.0);
    CHECK(noon.second_hand_deg == 0.0);
    CHECK(noon.day_fraction == doctest::Approx(0.5));

    const LocalClockState midnight = LocalClock::compute(utc(2024, 3, 16, 0, 0), TimeZone::utc());
    CHECK(midnight.hour_hand_deg == 0.0);
    CHECK(midnight.day_fraction == 0.0);
}

TEST_CASE("Fixed offset shifts the civil time and date")
{
    const auto india = TimeZone::resolve("UTC+05:30");
    REQUIRE(india.has_value());

    const LocalClockState s = LocalClock::compute(utc(2024, 3, 15, 14, 45, 30.25), *india);
    CHECK(s.hour == 20);
    CHECK(s.minute == 15);
    CHECK(s.abbreviation == "UTC+05:30");
    CHECK(s.utc_offset == 5h + 30min);

    // 03:00 UTC on 1 March is still the leap day in UTC-8
    const auto pacific = TimeZone::resolve("UTC-08:00");
    REQUIRE(pacific.has_value());

    const LocalClockState leap = LocalClock::compute(utc(2024, 3, 1, 3, 0), *pacific);
    CHECK(leap.month == 2);
    CHECK(leap.day == 29);
    CHECK(leap.hour == 19);
    CHECK(leap.weekday == 4);  // Thursday
}

TEST_CASE("Format")
{
    const LocalClockState s = LocalClock::compute(utc(2024, 3, 15, 14, 45, 30.25), TimeZone::utc());
    CHECK(LocalClock::format(s) == "2024-03-15 14:45:30.250 UTC");

    const LocalClockState t = LocalClock::compute(utc(2024, 3, 15, 9, 5, 7.123), TimeZone::utc());
    CHECK(LocalClock::format(t) == "2024-03-15 09:05:07.123 UTC");
}
