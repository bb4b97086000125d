/// @file config_loader.cpp
/// @brief Implementation of the `key = value` configuration reader.

#include "core/config_loader.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace chronoring::core
{

namespace
{

ConfigIssue parse_error(u32 line_number, std::string_view what)
{
    return ConfigIssue{ConfigError::ParseError, fmt::format("line {}: {}", line_number, what)};
}

// Pulsar fields beyond this many milliseconds (about 31 years) cannot be
// held in nanoseconds safely
constexpr f64 kMaxPulsarFieldMs = 1.0e12;

std::chrono::nanoseconds millis_to_ns(f64 ms)
{
    return std::chrono::nanoseconds{std::llround(ms * 1'000'000.0)};
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load from disk
// -----------------------------------------------------------------

ConfigResult ConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        CHR_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return ConfigIssue{ConfigError::FileNotFound, path.string()};
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    ConfigResult result = parse(contents.str());
    if (std::holds_alternative<EngineConfig>(result))
    {
        CHR_CORE_INFO("ConfigLoader: Loaded {}", path.string());
    }
    return result;
}

// -----------------------------------------------------------------
// Parse text
// -----------------------------------------------------------------

ConfigResult ConfigLoader::parse(std::string_view text)
{
    EngineConfig config;
    bool servers_replaced = false;
    bool pulsars_replaced = false;

    u32 line_number = 0;
    while (!text.empty())
    {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        ++line_number;

        if (const auto hash = line.find('#'); hash != std::string_view::npos)
        {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty())
        {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
        {
            CHR_CORE_ERROR("ConfigLoader: Missing '=' on line {}: {}", line_number, line);
            return parse_error(line_number, "expected key = value");
        }

        const std::string_view key = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));

        if (key == "timezone")
        {
            config.timezone = std::string(value);
        }
        else if (key == "latitude" || key == "longitude")
        {
            const auto degrees = parse_f64(value);
            if (!degrees)
            {
                CHR_CORE_ERROR("ConfigLoader: Invalid {} on line {}: {}", key, line_number, value);
                return parse_error(line_number, key);
            }
            (key == "latitude" ? config.location.latitude_deg : config.location.longitude_deg) = *degrees;
        }
        else if (key == "ntp_server")
        {
            if (!servers_replaced)
            {
                config.ntp_servers.clear();
                servers_replaced = true;
            }
            config.ntp_servers.emplace_back(value);
        }
        else if (key == "pulsar")
        {
            const auto pulsar = parse_pulsar(value);
            if (!pulsar)
            {
                CHR_CORE_ERROR("ConfigLoader: Malformed pulsar on line {}: {}", line_number, value);
                return parse_error(line_number, "pulsar");
            }
            if (!pulsars_replaced)
            {
                config.pulsars.clear();
                pulsars_replaced = true;
            }
            config.pulsars.push_back(*pulsar);
        }
        else if (key == "sync_interval_s" || key == "staleness_threshold_s" ||
                 key == "ntp_timeout_s" || key == "tick_interval_ms")
        {
            const auto amount = parse_i64(value);
            if (!amount)
            {
                CHR_CORE_ERROR("ConfigLoader: Invalid {} on line {}: {}", key, line_number, value);
                return parse_error(line_number, key);
            }

            // Bounded here, before the value is widened to microseconds
            const bool in_ms = key == "tick_interval_ms";
            const i64 limit = in_ms ? std::chrono::milliseconds{kMaxInterval}.count() : kMaxInterval.count();
            if (*amount > limit)
            {
                CHR_CORE_ERROR("ConfigLoader: {} on line {} exceeds one day: {}", key, line_number, value);
                return ConfigIssue{ConfigError::IntervalTooLong, fmt::format("line {}: {}", line_number, key)};
            }

            if (key == "sync_interval_s")
            {
                config.sync_interval = std::chrono::seconds{*amount};
            }
            else if (key == "staleness_threshold_s")
            {
                config.staleness_threshold = std::chrono::seconds{*amount};
            }
            else if (key == "ntp_timeout_s")
            {
                config.ntp_timeout = std::chrono::seconds{*amount};
            }
            else
            {
                config.tick_interval = std::chrono::milliseconds{*amount};
            }
        }
        else if (key == "log_level")
        {
            config.log_level = std::string(value);
        }
        else if (key == "log_file")
        {
            config.log_file = std::string(value);
        }
        else
        {
            CHR_CORE_ERROR("ConfigLoader: Unknown key '{}' on line {}", key, line_number);
            return parse_error(line_number, fmt::format("unknown key '{}'", key));
        }
    }

    if (auto issue = validate_config(config))
    {
        CHR_CORE_ERROR("ConfigLoader: {} ({})", to_string(issue->code), issue->detail);
        return *issue;
    }

    return config;
}

// -----------------------------------------------------------------
// Field helpers
// -----------------------------------------------------------------

std::optional<astro::PulsarConfig> ConfigLoader::parse_pulsar(std::string_view sv)
{
    std::vector<std::string_view> fields;
    while (true)
    {
        const auto comma = sv.find(',');
        fields.push_back(trim(sv.substr(0, comma)));
        if (comma == std::string_view::npos)
        {
            break;
        }
        sv = sv.substr(comma + 1);
    }

    if (fields.size() < 2 || fields.size() > 4 || fields[0].empty())
    {
        return std::nullopt;
    }

    astro::PulsarConfig pulsar{.display_name = std::string(fields[0])};

    const auto period_ms = parse_f64(fields[1]);
    if (!period_ms || std::abs(*period_ms) > kMaxPulsarFieldMs)
    {
        return std::nullopt;
    }
    pulsar.period = millis_to_ns(*period_ms);

    if (fields.size() > 2)
    {
        const auto offset_ms = parse_f64(fields[2]);
        if (!offset_ms || std::abs(*offset_ms) > kMaxPulsarFieldMs)
        {
            return std::nullopt;
        }
        pulsar.phase_offset = millis_to_ns(*offset_ms);
    }

    if (fields.size() > 3)
    {
        const auto width = parse_f64(fields[3]);
        if (!width)
        {
            return std::nullopt;
        }
        pulsar.pulse_width = *width;
    }

    return pulsar;
}

std::string_view ConfigLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> ConfigLoader::parse_f64(std::string_view sv)
{
    f64 value = 0.0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<i64> ConfigLoader::parse_i64(std::string_view sv)
{
    i64 value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace chronoring::core
