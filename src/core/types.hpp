#pragma once

#include <glm/gtc/constants.hpp>

#include <chrono>
#include <cstdint>

namespace chronoring
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Time types. Every Instant is UTC-anchored; timezones only apply at display time.
    using Duration = std::chrono::microseconds;
    using Instant  = std::chrono::time_point<std::chrono::system_clock, Duration>;

    /// @brief Geographic position of the observer (degrees).
    struct GeoLocation
    {
        f64 latitude_deg  = 0.0;  ///< [-90, 90], north positive
        f64 longitude_deg = 0.0;  ///< [-180, 180], east positive
    };

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd = 2440587.5;  // 1970-01-01 00:00 UTC
        constexpr f64 kSecondsPerDay = 86400.0;
    }
}
