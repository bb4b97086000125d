/// @file time_zone.cpp
/// @brief Timezone resolution and offset lookup.
///
/// IANA zones are decoded from the compiled zoneinfo files the system uses.

#include "timing/time_zone.hpp"
#include "timing/zone_rules.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>

namespace chronoring::timing
{

namespace
{

constexpr i64 kMaxFixedOffsetMinutes = 14 * 60;

std::filesystem::path zoneinfo_dir()
{
    if (const char* dir = std::getenv("TZDIR"); dir != nullptr && *dir != '\0')
    {
        return dir;
    }
    return "/usr/share/zoneinfo";
}

std::optional<std::chrono::seconds> parse_fixed_offset(std::string_view text)
{
    if (text.empty())
    {
        return std::chrono::seconds{0};
    }

    const char sign = text.front();
    if (sign != '+' && sign != '-')
    {
        return std::nullopt;
    }
    text.remove_prefix(1);

    const auto colon = text.find(':');
    const std::string_view hours_text = text.substr(0, colon);
    const std::string_view minutes_text = colon == std::string_view::npos ? std::string_view{} : text.substr(colon + 1);

    if (hours_text.empty() || hours_text.size() > 2)
    {
        return std::nullopt;
    }
    if (colon != std::string_view::npos && minutes_text.size() != 2)
    {
        return std::nullopt;
    }

    i64 hours = 0;
    auto [hp, hec] = std::from_chars(hours_text.data(), hours_text.data() + hours_text.size(), hours);
    if (hec != std::errc{} || hp != hours_text.data() + hours_text.size())
    {
        return std::nullopt;
    }

    i64 minutes = 0;
    if (!minutes_text.empty())
    {
        auto [mp, mec] = std::from_chars(minutes_text.data(), minutes_text.data() + minutes_text.size(), minutes);
        if (mec != std::errc{} || mp != minutes_text.data() + minutes_text.size() || minutes >= 60)
        {
            return std::nullopt;
        }
    }

    const i64 total = hours * 60 + minutes;
    if (total > kMaxFixedOffsetMinutes)
    {
        return std::nullopt;
    }

    return std::chrono::seconds{(sign == '-' ? -total : total) * 60};
}

bool is_valid_zone_name(std::string_view id)
{
    if (id.empty() || id.front() == '/' || id.find("..") != std::string_view::npos)
    {
        return false;
    }
    for (const char c : id)
    {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                        c == '/' || c == '_' || c == '-' || c == '+';
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

std::string format_fixed_abbreviation(std::chrono::seconds offset)
{
    if (offset.count() == 0)
    {
        return "UTC";
    }
    const i64 minutes = std::abs(offset.count()) / 60;
    return fmt::format("UTC{}{:02}:{:02}", offset.count() < 0 ? '-' : '+', minutes / 60, minutes % 60);
}

} // anonymous namespace

TimeZone::TimeZone(std::string id, std::chrono::seconds fixed_offset)
    : m_id(std::move(id))
    , m_fixed(true)
    , m_fixed_offset(fixed_offset)
{
}

TimeZone::TimeZone(std::string id, std::shared_ptr<const ZoneRules> rules)
    : m_id(std::move(id))
    , m_fixed(false)
    , m_fixed_offset(0)
    , m_rules(std::move(rules))
{
}

TimeZone TimeZone::utc()
{
    return TimeZone("UTC", std::chrono::seconds{0});
}

std::optional<TimeZone> TimeZone::resolve(std::string_view id)
{
    if (id == "UTC" || id == "GMT" || id == "Z")
    {
        return TimeZone(std::string(id), std::chrono::seconds{0});
    }

    if (id.starts_with("UTC") || id.starts_with("GMT"))
    {
        if (auto offset = parse_fixed_offset(id.substr(3)))
        {
            return TimeZone(std::string(id), *offset);
        }
        // "GMT+5" style names may still exist as Etc/ zones; fall through
    }

    if (is_valid_zone_name(id))
    {
        const std::filesystem::path path = zoneinfo_dir() / std::string(id);

        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            if (auto rules = ZoneRules::load(path))
            {
                CHR_CORE_DEBUG("Timezone '{}' loaded ({} transitions)", id, rules->transition_count());
                return TimeZone(std::string(id), std::make_shared<const ZoneRules>(std::move(*rules)));
            }
        }
    }

    CHR_CORE_WARN("Unknown timezone '{}'", id);
    return std::nullopt;
}

// -----------------------------------------------------------------
// Offset lookup
// -----------------------------------------------------------------

ZoneOffset TimeZone::offset_at(Instant instant) const
{
    if (m_fixed)
    {
        return ZoneOffset{m_fixed_offset, format_fixed_abbreviation(m_fixed_offset)};
    }

    const i64 seconds = std::chrono::floor<std::chrono::seconds>(instant).time_since_epoch().count();
    LocalTimeType type = m_rules->lookup(seconds);
    return ZoneOffset{type.utc_offset, std::move(type.abbreviation)};
}

} // namespace chronoring::timing
