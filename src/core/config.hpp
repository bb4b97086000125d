#pragma once

/// @file config.hpp
/// @brief Engine configuration and its validation.

#include "astro/pulsar_simulator.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronoring::core
{
    /// @brief Everything the engine needs before its first tick.
    ///
    /// Default-constructed values form a usable configuration: UTC at
    /// 0°/0°, the public NTP pool servers and the built-in pulsar catalogue.
    struct EngineConfig
    {
        std::string timezone = "UTC";
        GeoLocation location{};

        std::vector<std::string> ntp_servers = default_ntp_servers();
        std::vector<astro::PulsarConfig> pulsars = astro::PulsarSimulator::builtin_catalog();

        Duration sync_interval = std::chrono::seconds{60};
        Duration staleness_threshold = std::chrono::seconds{600};
        Duration tick_interval = std::chrono::milliseconds{1000};
        std::chrono::milliseconds ntp_timeout{2000};

        std::string log_level = "info";
        std::string log_file = "chronoring.log";

        [[nodiscard]] static std::vector<std::string> default_ntp_servers();
    };

    /// @brief Longest accepted pulsar period.
    inline constexpr std::chrono::nanoseconds kMaxPulsarPeriod = std::chrono::hours{24};

    /// @brief Longest accepted sync, staleness, tick or timeout interval.
    inline constexpr std::chrono::seconds kMaxInterval = std::chrono::hours{24};

    /// @brief Check every field; the first problem found is returned.
    /// @return std::nullopt if the configuration is usable.
    [[nodiscard]] std::optional<ConfigIssue> validate_config(const EngineConfig& config);

    /// @brief Map "trace", "debug", "info", "warn", "error", "critical", "off".
    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace chronoring::core
