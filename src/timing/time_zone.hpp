#pragma once

/// @file time_zone.hpp
/// @brief Display timezone: fixed UTC offsets or IANA zones from the system tz database.

#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chronoring::timing
{
    class ZoneRules;

    /// @brief UTC offset and abbreviation in effect at some instant.
    struct ZoneOffset
    {
        std::chrono::seconds utc_offset{0};
        std::string abbreviation;
    };

    /// @brief A resolved timezone.
    ///
    /// Accepted identifiers:
    /// - "UTC", "GMT", "Z"
    /// - fixed offsets "UTC+H", "UTC-H", "UTC+HH:MM" (up to ±14:00)
    /// - IANA names present under the zoneinfo directory ($TZDIR or /usr/share/zoneinfo)
    ///
    /// IANA zones are read once in resolve(); offset_at() only searches the
    /// loaded rules and never touches process-wide state such as TZ.
    class TimeZone
    {
    public:
        /// @return The zone, or std::nullopt if the identifier is not recognised.
        [[nodiscard]] static std::optional<TimeZone> resolve(std::string_view id);

        [[nodiscard]] static TimeZone utc();

        [[nodiscard]] const std::string& id() const { return m_id; }
        [[nodiscard]] bool is_fixed() const { return m_fixed; }

        /// @brief Offset in effect at `instant` (daylight saving applied for IANA zones).
        [[nodiscard]] ZoneOffset offset_at(Instant instant) const;

    private:
        TimeZone(std::string id, std::chrono::seconds fixed_offset);
        TimeZone(std::string id, std::shared_ptr<const ZoneRules> rules);

        std::string m_id;
        bool m_fixed;
        std::chrono::seconds m_fixed_offset;
        std::shared_ptr<const ZoneRules> m_rules;  ///< Shared between copies, immutable
    };

} // namespace chronoring::timing
