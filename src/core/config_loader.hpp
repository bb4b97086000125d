#pragma once

/// @file config_loader.hpp
/// @brief Reads an EngineConfig from a `key = value` text file.

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <variant>

namespace chronoring::core
{
    using ConfigResult = std::variant<EngineConfig, ConfigIssue>;

    /// @brief Static utility class for loading configuration files.
    ///
    /// Format, one setting per line, `#` starts a comment:
    ///
    ///     timezone              = Europe/Warsaw
    ///     latitude              = 52.23
    ///     longitude             = 21.01
    ///     ntp_server            = pool.ntp.org
    ///     pulsar                = Crab, 33.0, 0.0, 0.1
    ///     sync_interval_s       = 60
    ///     staleness_threshold_s = 600
    ///     ntp_timeout_s         = 2
    ///     tick_interval_ms      = 1000
    ///     log_level             = info
    ///     log_file              = chronoring.log
    ///
    /// `ntp_server` and `pulsar` may repeat; their first occurrence replaces
    /// the default list. A pulsar line is `name, period_ms[, phase_offset_ms[, pulse_width]]`.
    /// Keys that are absent keep their EngineConfig defaults.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load and validate a configuration file.
        /// @return The configuration, or the first problem found.
        [[nodiscard]] static ConfigResult load(const std::filesystem::path& path);

        /// @brief Parse and validate configuration text.
        [[nodiscard]] static ConfigResult parse(std::string_view text);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single i64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<i64> parse_i64(std::string_view sv);

        /// @brief Parse `name, period_ms[, phase_offset_ms[, pulse_width]]`.
        [[nodiscard]] static std::optional<astro::PulsarConfig> parse_pulsar(std::string_view sv);
    };

} // namespace chronoring::core
