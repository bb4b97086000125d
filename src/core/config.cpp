/// @file config.cpp
/// @brief Configuration defaults and validation.

#include "core/config.hpp"
#include "timing/time_zone.hpp"

#include <spdlog/fmt/fmt.h>

#include <unordered_set>

namespace chronoring::core
{

std::vector<std::string> EngineConfig::default_ntp_servers()
{
    return {"pool.ntp.org", "time.google.com", "time.windows.com", "time.nist.gov"};
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name)
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

std::optional<ConfigIssue> validate_config(const EngineConfig& config)
{
    if (!timing::TimeZone::resolve(config.timezone))
    {
        return ConfigIssue{ConfigError::InvalidTimezone, config.timezone};
    }

    const f64 lat = config.location.latitude_deg;
    const f64 lon = config.location.longitude_deg;
    if (!(lat >= -90.0 && lat <= 90.0))
    {
        return ConfigIssue{ConfigError::LatitudeOutOfRange, fmt::format("{}", lat)};
    }
    if (!(lon >= -180.0 && lon <= 180.0))
    {
        return ConfigIssue{ConfigError::LongitudeOutOfRange, fmt::format("{}", lon)};
    }

    std::unordered_set<std::string> names;
    for (const auto& pulsar : config.pulsars)
    {
        if (pulsar.period.count() <= 0)
        {
            return ConfigIssue{ConfigError::NonPositivePulsarPeriod, pulsar.display_name};
        }
        if (pulsar.period > kMaxPulsarPeriod)
        {
            return ConfigIssue{ConfigError::PulsarPeriodTooLong, pulsar.display_name};
        }
        if (!(pulsar.pulse_width > 0.0 && pulsar.pulse_width <= 1.0))
        {
            return ConfigIssue{ConfigError::InvalidPulseWidth, pulsar.display_name};
        }
        if (!names.insert(pulsar.display_name).second)
        {
            return ConfigIssue{ConfigError::DuplicatePulsarName, pulsar.display_name};
        }
    }

    if (config.sync_interval.count() <= 0)
    {
        return ConfigIssue{ConfigError::NonPositiveInterval, "sync_interval"};
    }
    if (config.staleness_threshold.count() <= 0)
    {
        return ConfigIssue{ConfigError::NonPositiveInterval, "staleness_threshold"};
    }
    if (config.tick_interval.count() <= 0)
    {
        return ConfigIssue{ConfigError::NonPositiveInterval, "tick_interval"};
    }
    if (config.ntp_timeout.count() <= 0)
    {
        return ConfigIssue{ConfigError::NonPositiveInterval, "ntp_timeout"};
    }

    if (config.sync_interval > kMaxInterval)
    {
        return ConfigIssue{ConfigError::IntervalTooLong, "sync_interval"};
    }
    if (config.staleness_threshold > kMaxInterval)
    {
        return ConfigIssue{ConfigError::IntervalTooLong, "staleness_threshold"};
    }
    if (config.tick_interval > kMaxInterval)
    {
        return ConfigIssue{ConfigError::IntervalTooLong, "tick_interval"};
    }
    if (config.ntp_timeout > kMaxInterval)
    {
        return ConfigIssue{ConfigError::IntervalTooLong, "ntp_timeout"};
    }

    if (!parse_log_level(config.log_level))
    {
        return ConfigIssue{ConfigError::UnknownLogLevel, config.log_level};
    }

    return std::nullopt;
}

} // namespace chronoring::core
