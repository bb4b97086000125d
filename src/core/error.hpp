#pragma once

/// @file error.hpp
/// @brief Error codes shared across the engine.
///
/// Errors travel as values (std::optional / std::variant results carrying
/// one of these codes). Nothing here is thrown.

#include <string>
#include <string_view>

namespace chronoring
{
    /// @brief Failure of a network time query. Recovered locally by NetworkTimeSync.
    enum class TimeSourceError
    {
        DnsResolutionFailed,
        SocketError,
        Timeout,
        MalformedResponse,
        NoServerReachable,
        Cancelled,
    };

    /// @brief Instant outside the range a calendar can represent.
    enum class CalendarDomainError
    {
        BeforeEpoch,
    };

    /// @brief Rejected configuration. Fatal before the first tick.
    enum class ConfigError
    {
        InvalidTimezone,
        LatitudeOutOfRange,
        LongitudeOutOfRange,
        NonPositivePulsarPeriod,
        PulsarPeriodTooLong,
        DuplicatePulsarName,
        InvalidPulseWidth,
        NonPositiveInterval,
        IntervalTooLong,
        UnknownLogLevel,
        ParseError,
        FileNotFound,
    };

    /// @brief A configuration error with the offending key or value.
    struct ConfigIssue
    {
        ConfigError code;
        std::string detail;
    };

    [[nodiscard]] std::string_view to_string(TimeSourceError error);
    [[nodiscard]] std::string_view to_string(CalendarDomainError error);
    [[nodiscard]] std::string_view to_string(ConfigError error);

} // namespace chronoring
